#pragma once

#include <SFML/Graphics.hpp>
#include "grid.hpp"
#include "utils.hpp"

// CellMap class that inherits from sf::Drawable and sf::Transformable
// This allows us to draw it directly and apply transformations to it
class CellMap : public sf::Drawable, public sf::Transformable
{
public:
  static const sf::Color DAY_COLOR;
  static const sf::Color NIGHT_COLOR;

  explicit CellMap(unsigned int cellSize = 25);

  // Allocate two triangles per cell and colour them from the grid
  void initialize(const Grid &grid);

  // Recolour every cell from the grid
  void update(const Grid &grid);

  void updateCell(int x, int y, CellType state);

private:
  // Required by sf::Drawable
  virtual void draw(sf::RenderTarget &target, sf::RenderStates states) const override;

  void setCellVertices(int x, int y, CellType state);

  static const sf::Color &colorFor(CellType state);

  sf::VertexArray m_vertices;
  unsigned int m_cellSize;
  int m_width = 0;
  int m_height = 0;

  static constexpr int VERTICES_PER_CELL = 6;
};
