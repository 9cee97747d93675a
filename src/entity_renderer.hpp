#pragma once

#include <SFML/Graphics.hpp>
#include "simulation.hpp"
#include <unordered_map>
#include <utility>
#include <vector>

class EntityRenderer : public sf::Drawable, public sf::Transformable
{
public:
  explicit EntityRenderer(unsigned int cellSize = 25);

  // Initialize/update the circle shapes with entity data
  void initialize(const Simulation *sim);
  void update();

private:
  virtual void draw(sf::RenderTarget &target, sf::RenderStates states) const override;

  void addEntityToCircles(const Entity &entity);

  // Vector to store all entity circle shapes
  std::vector<sf::CircleShape> m_circles;

  const Simulation *m_sim;
  unsigned int m_cellSize;

  static const std::unordered_map<CellType, sf::Color> ENTITY_COLORS;
};
