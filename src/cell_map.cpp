#include "cell_map.hpp"

const sf::Color CellMap::DAY_COLOR(17, 74, 88);
const sf::Color CellMap::NIGHT_COLOR(216, 231, 226);

CellMap::CellMap(unsigned int cellSize)
    : m_cellSize(cellSize)
{
  // Triangles rather than quads, two per cell
  m_vertices.setPrimitiveType(sf::PrimitiveType::Triangles);
}

void CellMap::initialize(const Grid &grid)
{
  m_width = grid.getWidth();
  m_height = grid.getHeight();
  m_vertices.resize(static_cast<std::size_t>(m_width) * m_height * VERTICES_PER_CELL);

  for (int y = 0; y < m_height; ++y)
  {
    for (int x = 0; x < m_width; ++x)
    {
      setCellVertices(x, y, grid.get(x, y));
    }
  }
}

void CellMap::update(const Grid &grid)
{
  if (grid.getWidth() != m_width || grid.getHeight() != m_height)
  {
    initialize(grid);
    return;
  }

  const auto &cells = grid.raw();
  for (int y = 0; y < m_height; ++y)
  {
    for (int x = 0; x < m_width; ++x)
    {
      updateCell(x, y, static_cast<CellType>(cells[static_cast<std::size_t>(y) * m_width + x]));
    }
  }
}

void CellMap::updateCell(int x, int y, CellType state)
{
  sf::Vertex *cell = &m_vertices[(static_cast<std::size_t>(y) * m_width + x) * VERTICES_PER_CELL];
  const sf::Color &color = colorFor(state);
  for (int i = 0; i < VERTICES_PER_CELL; ++i)
  {
    cell[i].color = color;
  }
}

void CellMap::setCellVertices(int x, int y, CellType state)
{
  float xPos = static_cast<float>(x * m_cellSize);
  float yPos = static_cast<float>(y * m_cellSize);
  float size = static_cast<float>(m_cellSize);

  sf::Vertex *cell = &m_vertices[(static_cast<std::size_t>(y) * m_width + x) * VERTICES_PER_CELL];

  cell[0].position = sf::Vector2f(xPos, yPos);
  cell[1].position = sf::Vector2f(xPos + size, yPos);
  cell[2].position = sf::Vector2f(xPos, yPos + size);

  cell[3].position = sf::Vector2f(xPos + size, yPos);
  cell[4].position = sf::Vector2f(xPos + size, yPos + size);
  cell[5].position = sf::Vector2f(xPos, yPos + size);

  updateCell(x, y, state);
}

const sf::Color &CellMap::colorFor(CellType state)
{
  return state == DAY ? DAY_COLOR : NIGHT_COLOR;
}

void CellMap::draw(sf::RenderTarget &target, sf::RenderStates states) const
{
  states.transform *= getTransform();
  states.texture = nullptr;
  target.draw(m_vertices, states);
}
