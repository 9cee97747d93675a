#include "entity_renderer.hpp"

// Each entity is drawn in the colour of the territory it carves out
const std::unordered_map<CellType, sf::Color> EntityRenderer::ENTITY_COLORS = {
    {NIGHT, sf::Color(17, 74, 88)},
    {DAY, sf::Color(216, 231, 226)}};

EntityRenderer::EntityRenderer(unsigned int cellSize)
    : m_sim(nullptr), m_cellSize(cellSize)
{
}

void EntityRenderer::initialize(const Simulation *sim)
{
  m_sim = sim;
}

void EntityRenderer::update()
{
  m_circles.clear();
  if (!m_sim)
    return;

  m_circles.reserve(m_sim->getEntities().size());
  for (const auto &entity : m_sim->getEntities())
  {
    addEntityToCircles(entity);
  }
}

void EntityRenderer::addEntityToCircles(const Entity &entity)
{
  float radius = m_cellSize / 2.0f;
  float x = entity.getXPos() * static_cast<float>(m_cellSize) + radius;
  float y = entity.getYPos() * static_cast<float>(m_cellSize) + radius;

  sf::CircleShape circle(radius);
  circle.setFillColor(ENTITY_COLORS.at(entity.getEntityType()));
  circle.setPointCount(15);
  circle.setPosition({x - radius, y - radius}); // Adjust position to center the circle

  m_circles.push_back(std::move(circle));
}

void EntityRenderer::draw(sf::RenderTarget &target, sf::RenderStates states) const
{
  states.transform *= getTransform();

  for (const auto &circle : m_circles)
  {
    target.draw(circle, states);
  }
}
