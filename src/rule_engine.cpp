#include "rule_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

const std::unordered_map<Direction, std::array<Direction, 2>> RuleEngine::COLLISION_ALTERNATIVES = {
    {LEFT_UP, {RIGHT_UP, LEFT_DOWN}},
    {RIGHT_UP, {LEFT_UP, RIGHT_DOWN}},
    {LEFT_DOWN, {LEFT_UP, RIGHT_DOWN}},
    {RIGHT_DOWN, {RIGHT_UP, LEFT_DOWN}}};

const std::unordered_map<Direction, Direction> RuleEngine::ALTERNATIVE_OFFSETS = {
    {RIGHT_UP, LEFT},
    {LEFT_DOWN, RIGHT},
    {LEFT_UP, RIGHT},
    {RIGHT_DOWN, UP}};

const std::unordered_map<Direction, std::array<Direction, 2>> RuleEngine::FALLBACK_OFFSETS = {
    {LEFT_UP, {RIGHT, LEFT}},
    {RIGHT_UP, {LEFT, DOWN}},
    {LEFT_DOWN, {RIGHT, DOWN}},
    {RIGHT_DOWN, {UP, LEFT}}};

RetryLimitExceeded::RetryLimitExceeded(CellType entityType, int retries)
    : std::runtime_error(std::string("Move of ") + cellTypeName(entityType) +
                         " entity did not resolve within " + std::to_string(retries) + " retries"),
      entityType(entityType)
{
}

RuleEngine::RuleEngine()
    : directions{LEFT_UP, LEFT_UP}, rng(std::random_device{}())
{
}

RuleEngine::RuleEngine(uint32_t seed)
    : directions{LEFT_UP, LEFT_UP}, rng(seed)
{
}

void RuleEngine::reset()
{
  directions = {LEFT_UP, LEFT_UP};
}

void RuleEngine::seed(uint32_t seed)
{
  rng.seed(seed);
}

void RuleEngine::setDirection(CellType type, Direction direction)
{
  if (!isDiagonal(direction))
    throw std::invalid_argument(std::string("Heading must be diagonal, got ") + directionName(direction));
  directions[type] = direction;
}

MoveResult RuleEngine::moveEntity(Entity &entity, Grid &grid)
{
  return resolveMove(entity, grid, nullptr);
}

MoveResult RuleEngine::moveEntityTraced(Entity &entity, Grid &grid, MoveTrace &trace)
{
  trace = MoveTrace();
  trace.initialPos = entity.getCell();
  trace.entityType = entity.getEntityType();
  trace.direction = directions[entity.getEntityType()];
  trace.cellStateAtPos = grid.get(entity.getXPos(), entity.getYPos());

  MoveResult result = resolveMove(entity, grid, &trace);
  trace.finalPos = entity.getCell();
  return result;
}

MoveResult RuleEngine::resolveMove(Entity &entity, Grid &grid, MoveTrace *trace)
{
  MoveResult result;
  const CellType type = entity.getEntityType();
  const int width = grid.getWidth();
  const int height = grid.getHeight();

  for (int attempt = 0; attempt <= MAX_RETRIES; ++attempt)
  {
    Direction &direction = directions[type];
    auto [newX, newY] = offsetCell(entity.getCell(), direction);

    Boundary boundary = checkBoundaries(newX, newY, width, height);
    if (boundary != BOUNDARY_NONE)
    {
      Direction reflected = reflect(direction, boundary);
      spdlog::trace("{} entity at ({}, {}) reflects {} -> {}", cellTypeName(type),
                    entity.getXPos(), entity.getYPos(), directionName(direction), directionName(reflected));
      direction = reflected;
      result.boundaryHits++;
      if (trace)
        trace->boundaryHits.push_back(boundary);
      continue;
    }

    if (grid.get(newX, newY) == type)
    {
      std::vector<Direction> offsets;
      Direction next = handleCollision(entity, grid, direction, offsets);

      grid.toggle(newX, newY);
      appendSecondaryToggles({newX, newY}, offsets, grid, result.additionalToggles);

      spdlog::debug("{} entity collided at ({}, {}), heading {} -> {}", cellTypeName(type),
                    newX, newY, directionName(direction), directionName(next));
      direction = next;
      result.collisions++;
      if (trace)
        trace->collisions.emplace_back(newX, newY);
      continue;
    }

    entity.moveTo(newX, newY);
    result.success = true;
    result.newX = newX;
    result.newY = newY;
    return result;
  }

  spdlog::error("{} entity at ({}, {}) gave up after {} retries", cellTypeName(type),
                entity.getXPos(), entity.getYPos(), MAX_RETRIES);
  throw RetryLimitExceeded(type, MAX_RETRIES);
}

Direction RuleEngine::handleCollision(const Entity &entity, const Grid &grid, Direction current,
                                      std::vector<Direction> &offsets)
{
  const CellType type = entity.getEntityType();

  auto alternatives = COLLISION_ALTERNATIVES.find(current);
  if (alternatives != COLLISION_ALTERNATIVES.end())
  {
    for (Direction alternative : alternatives->second)
    {
      auto [testX, testY] = offsetCell(entity.getCell(), alternative);
      if (grid.isInside(testX, testY) && grid.get(testX, testY) != type)
      {
        offsets.push_back(ALTERNATIVE_OFFSETS.at(alternative));
        return alternative;
      }
    }
  }

  std::uniform_int_distribution<std::size_t> pick(0, DIAGONAL_DIRECTIONS.size() - 1);
  Direction randomDirection = DIAGONAL_DIRECTIONS[pick(rng)];

  auto fallback = FALLBACK_OFFSETS.find(current);
  if (fallback != FALLBACK_OFFSETS.end())
    offsets.insert(offsets.end(), fallback->second.begin(), fallback->second.end());

  return randomDirection;
}

void RuleEngine::appendSecondaryToggles(const CellCoord &collision, const std::vector<Direction> &offsets,
                                        const Grid &grid, ToggleList &toggles)
{
  for (Direction offset : offsets)
  {
    CellCoord target = offsetCell(collision, offset);
    if (grid.isInside(target.first, target.second))
      toggles.push_back(target);
  }
}

ToggleList RuleEngine::batchMoveEntities(std::vector<Entity> &entities, Grid &grid, MoveTotals *totals)
{
  ToggleList allToggles;

  for (auto &entity : entities)
  {
    MoveResult result = moveEntity(entity, grid);
    if (totals)
    {
      totals->moves++;
      totals->collisions += result.collisions;
      totals->boundaryHits += result.boundaryHits;
      if (result.success)
        totals->successfulMoves++;
    }
    if (result.success)
      allToggles.insert(allToggles.end(), result.additionalToggles.begin(), result.additionalToggles.end());
  }

  return allToggles;
}

void RuleEngine::applyToggles(Grid &grid, const ToggleList &toggles)
{
  for (const auto &[x, y] : toggles)
  {
    grid.toggle(x, y);
    spdlog::trace("Toggled ({}, {})", x, y);
  }
}

std::pair<int, int> RuleEngine::countStates(const Grid &grid)
{
  const auto &cells = grid.raw();
  const int nightCount = static_cast<int>(std::count(cells.begin(), cells.end(), NIGHT));
  const int dayCount = static_cast<int>(cells.size()) - nightCount;
  return {dayCount, nightCount};
}

Boundary RuleEngine::checkBoundaries(int x, int y, int width, int height)
{
  if (y < 0)
    return BOUNDARY_TOP;
  if (y >= height)
    return BOUNDARY_BOTTOM;
  if (x < 0)
    return BOUNDARY_LEFT;
  if (x >= width)
    return BOUNDARY_RIGHT;
  return BOUNDARY_NONE;
}

Direction RuleEngine::reflect(Direction direction, Boundary boundary)
{
  switch (boundary)
  {
  case BOUNDARY_TOP:
    if (direction == LEFT_UP)
      return LEFT_DOWN;
    if (direction == RIGHT_UP)
      return RIGHT_DOWN;
    break;
  case BOUNDARY_BOTTOM:
    if (direction == LEFT_DOWN)
      return LEFT_UP;
    if (direction == RIGHT_DOWN)
      return RIGHT_UP;
    break;
  case BOUNDARY_LEFT:
    if (direction == LEFT_UP)
      return RIGHT_UP;
    if (direction == LEFT_DOWN)
      return RIGHT_DOWN;
    break;
  case BOUNDARY_RIGHT:
    if (direction == RIGHT_UP)
      return LEFT_UP;
    if (direction == RIGHT_DOWN)
      return LEFT_DOWN;
    break;
  case BOUNDARY_NONE:
    break;
  }
  return direction;
}
