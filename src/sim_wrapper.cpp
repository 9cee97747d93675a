#include "sim_wrapper.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>

SimWrapper::SimWrapper(const SimConfig &config)
    : simConfig(config), debugMode(config.debugMode), batchStep(config.batchStep)
{
  sim = std::make_unique<Simulation>(simConfig);
  if (!simConfig.headless)
  {
    renderer = std::make_unique<Renderer>(sim.get(), static_cast<unsigned int>(simConfig.cellSize),
                                          simConfig.showGrid, simConfig.showCoordinates);
    renderer->setFramerateLimit(static_cast<unsigned int>(simConfig.stepsPerSecond));
  }
}

void SimWrapper::reset()
{
  sim->reset();
}

void SimWrapper::tick()
{
  if (debugMode && sim->getFrame() % DEBUG_LOG_INTERVAL == 0)
  {
    logDebugState();
  }

  if (batchStep)
    sim->step();
  else
    sim->stepIndividual();
}

void SimWrapper::render()
{
  if (!renderer)
    return;

  for (sf::Keyboard::Key key : renderer->pollEvents())
  {
    handleKey(key);
  }
  renderer->draw();
}

bool SimWrapper::isWindowOpen() const
{
  return renderer && renderer->isWindowOpen();
}

void SimWrapper::run()
{
  spdlog::info("Keys: D debug, G grid lines, C coordinates, R reset, O batched/individual stepping, Esc quit");

  auto start = std::chrono::steady_clock::now();
  render();
  while (isWindowOpen() && !reachedStepLimit())
  {
    tick();
    render();
  }
  logReport(std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
}

void SimWrapper::runHeadless()
{
  auto start = std::chrono::steady_clock::now();
  while (!reachedStepLimit())
  {
    tick();
  }
  logReport(std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
}

bool SimWrapper::reachedStepLimit() const
{
  return simConfig.maxSteps > 0 && sim->getFrame() >= simConfig.maxSteps;
}

void SimWrapper::handleKey(sf::Keyboard::Key key)
{
  switch (key)
  {
  case sf::Keyboard::D:
    debugMode = !debugMode;
    spdlog::info("Debug mode: {}", debugMode ? "ON" : "OFF");
    break;
  case sf::Keyboard::G:
    renderer->toggleGrid();
    spdlog::info("Grid lines: {}", renderer->isGridShown() ? "ON" : "OFF");
    break;
  case sf::Keyboard::C:
    renderer->toggleCoordinates();
    spdlog::info("Coordinate labels: {}", renderer->areCoordinatesShown() ? "ON" : "OFF");
    break;
  case sf::Keyboard::R:
    reset();
    break;
  case sf::Keyboard::O:
    batchStep = !batchStep;
    spdlog::info("Switched to {} stepping", batchStep ? "batched" : "individual");
    break;
  default:
    break;
  }
}

void SimWrapper::logDebugState() const
{
  std::string positions;
  for (const auto &entity : sim->getEntities())
  {
    if (!positions.empty())
      positions += ", ";
    positions += "(" + std::to_string(entity.getXPos()) + ", " + std::to_string(entity.getYPos()) +
                 ", " + cellTypeName(entity.getEntityType()) + ")";
  }

  spdlog::info("Step {}: entities [{}]", sim->getFrame(), positions);
  spdlog::info("Counts - day: {}, night: {}", sim->getDayCount(), sim->getNightCount());
}

void SimWrapper::logReport(double seconds) const
{
  const SimulationStats &stats = sim->getStats();
  const int totalCells = sim->getGrid().getWidth() * sim->getGrid().getHeight();

  spdlog::info("Ran {} steps in {:.3f}s", sim->getFrame(), seconds);
  spdlog::info("Moves: {} ({} successful), collisions: {}, boundary hits: {}, toggles applied: {}",
               stats.totalMoves, stats.successfulMoves, stats.collisions, stats.boundaryHits,
               stats.togglesApplied);
  if (stats.simulationTime > 0.0)
  {
    spdlog::info("Moves per second: {:.0f}", stats.totalMoves / stats.simulationTime);
  }
  spdlog::info("Grid state: {} day, {} night ({} total)", sim->getDayCount(), sim->getNightCount(),
               totalCells);
}
