#include "simulation.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

Simulation::Simulation(const SimConfig &sc)
    : simConfig(sc),
      grid(sc.width, sc.height),
      rules(sc.seed ? RuleEngine(*sc.seed) : RuleEngine()),
      placementRng(sc.seed ? *sc.seed : std::random_device{}())
{
  loadEntities();
  updateCounts();

  spdlog::info("Created {}x{} simulation with {} entities", grid.getWidth(), grid.getHeight(),
               entities.size());
}

void Simulation::reset()
{
  if (simConfig.seed)
  {
    rules.seed(*simConfig.seed);
    placementRng.seed(*simConfig.seed);
  }

  grid.initializeSplit();
  rules.reset();
  entities.clear();
  loadEntities();

  frame = 0;
  stats = SimulationStats();
  updateCounts();

  spdlog::info("Simulation reset");
}

void Simulation::loadEntities()
{
  const int width = grid.getWidth();
  const int height = grid.getHeight();

  addEntity(2 * width / 4, height / 4, NIGHT);
  addEntity(3 * width / 4, 3 * height / 4, DAY);

  addEntitiesRandom(simConfig.randomDayEntities, DAY);
  addEntitiesRandom(simConfig.randomNightEntities, NIGHT);
}

void Simulation::addEntity(int x, int y, CellType type)
{
  if (!grid.isInside(x, y))
    throw OutOfBoundsError(x, y, grid.getWidth(), grid.getHeight());

  entities.emplace_back(type, x, y);
}

void Simulation::addEntitiesRandom(int count, CellType type)
{
  std::uniform_int_distribution<int> xDist(0, grid.getWidth() - 1);
  std::uniform_int_distribution<int> yDist(0, grid.getHeight() - 1);

  for (int i = 0; i < count; ++i)
  {
    int x = xDist(placementRng);
    int y = yDist(placementRng);
    addEntity(x, y, type);
  }
}

void Simulation::step()
{
  auto start = std::chrono::steady_clock::now();

  MoveTotals totals;
  ToggleList toggles;
  try
  {
    toggles = rules.batchMoveEntities(entities, grid, &totals);
  }
  catch (const RetryLimitExceeded &e)
  {
    spdlog::error("Step {} aborted: {}", frame + 1, e.what());
    throw;
  }

  RuleEngine::applyToggles(grid, toggles);
  updateCounts();
  frame++;

  stats.totalMoves += totals.moves;
  stats.successfulMoves += totals.successfulMoves;
  stats.collisions += totals.collisions;
  stats.boundaryHits += totals.boundaryHits;
  stats.togglesApplied += static_cast<long long>(toggles.size());
  stats.simulationTime += std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

  spdlog::debug("Step {}: {} toggles, day {} night {}", frame, toggles.size(), dayCount, nightCount);
}

void Simulation::stepIndividual()
{
  auto start = std::chrono::steady_clock::now();

  for (auto &entity : entities)
  {
    MoveResult result;
    try
    {
      result = rules.moveEntity(entity, grid);
    }
    catch (const RetryLimitExceeded &e)
    {
      spdlog::error("Step {} aborted: {}", frame + 1, e.what());
      throw;
    }

    stats.totalMoves++;
    stats.collisions += result.collisions;
    stats.boundaryHits += result.boundaryHits;
    if (result.success)
    {
      stats.successfulMoves++;
      RuleEngine::applyToggles(grid, result.additionalToggles);
      stats.togglesApplied += static_cast<long long>(result.additionalToggles.size());
    }
  }

  updateCounts();
  frame++;
  stats.simulationTime += std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

  spdlog::debug("Step {}: day {} night {}", frame, dayCount, nightCount);
}

void Simulation::updateCounts()
{
  auto [day, night] = RuleEngine::countStates(grid);
  dayCount = day;
  nightCount = night;
}
