#include "sim_config.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

SimConfig::SimConfig(int width,
                     int height,
                     std::optional<uint32_t> seed,
                     int randomDayEntities,
                     int randomNightEntities)
    : width(width),
      height(height),
      seed(seed),
      randomDayEntities(randomDayEntities),
      randomNightEntities(randomNightEntities)
{
}

SimConfig SimConfig::fromArgs(const SimConfigArgs *args)
{
  if (!args)
  {
    return SimConfig();
  }

  SimConfig config(
      args->width,
      args->height,
      args->seed,
      args->randomDayEntities,
      args->randomNightEntities);
  config.cellSize = args->cellSize;
  config.showGrid = args->showGrid;
  config.showCoordinates = args->showCoordinates;
  config.debugMode = args->debugMode;
  config.batchStep = args->batchStep;
  config.stepsPerSecond = args->stepsPerSecond;
  config.maxSteps = args->maxSteps;
  config.headless = args->headless;
  config.logLevel = args->logLevel;
  return config;
}

void SimConfig::validate() const
{
  if (width <= 0 || height <= 0)
    throw std::invalid_argument("Grid width and height must be positive");
  if (randomDayEntities < 0 || randomNightEntities < 0)
    throw std::invalid_argument("Entity counts must not be negative");
  if (cellSize <= 0)
    throw std::invalid_argument("Cell size must be positive");
  if (stepsPerSecond <= 0)
    throw std::invalid_argument("Steps per second must be positive");
  if (maxSteps < 0)
    throw std::invalid_argument("Max steps must not be negative");
  if (headless && maxSteps == 0)
    throw std::invalid_argument("Headless runs need a step limit");
  if (spdlog::level::from_str(logLevel) == spdlog::level::off && logLevel != "off")
    throw std::invalid_argument("Unknown log level: " + logLevel);
}
