#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Helper struct for passing parsed command-line options
struct SimConfigArgs
{
  int width = 20;
  int height = 20;
  std::optional<uint32_t> seed;
  int randomDayEntities = 0;
  int randomNightEntities = 0;
  int cellSize = 25;
  bool showGrid = true;
  bool showCoordinates = false;
  bool debugMode = false;
  bool batchStep = true;
  int stepsPerSecond = 10;
  long long maxSteps = 0;
  bool headless = false;
  std::string logLevel = "info";
};

class SimConfig
{
public:
  SimConfig(int width = 20,
            int height = 20,
            std::optional<uint32_t> seed = std::nullopt,
            int randomDayEntities = 0,
            int randomNightEntities = 0);

  // Build a config from parsed options; defaults when args is null
  static SimConfig fromArgs(const SimConfigArgs *args = nullptr);

  // Throws std::invalid_argument describing the first bad value
  void validate() const;

  // Grid and population
  int width;
  int height;
  std::optional<uint32_t> seed;
  int randomDayEntities;
  int randomNightEntities;

  // Renderer
  int cellSize = 25;
  bool showGrid = true;
  bool showCoordinates = false;

  // Driver
  bool debugMode = false;
  bool batchStep = true;
  int stepsPerSecond = 10;
  long long maxSteps = 0; // 0 runs until the window closes
  bool headless = false;
  std::string logLevel = "info";
};
