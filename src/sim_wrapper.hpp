#pragma once

#include <SFML/Window/Keyboard.hpp>
#include <memory>
#include <utility>
#include "renderer.hpp"
#include "sim_config.hpp"
#include "simulation.hpp"

class SimWrapper
{
public:
  explicit SimWrapper(const SimConfig &config);
  ~SimWrapper() = default;

  // Simulation control
  void reset();
  void tick();

  // Frame loop until the window closes or the step limit is reached
  void run();

  // Step loop without a window
  void runHeadless();

  // State getters
  const Simulation &getSimulation() const { return *sim; }
  int getSimFrame() const { return sim->getFrame(); }
  std::pair<int, int> getCounts() const { return sim->getCounts(); }
  bool isBatchStep() const { return batchStep; }
  bool isDebugMode() const { return debugMode; }

  // Rendering
  void render();

  // Window status
  bool isWindowOpen() const;

private:
  void handleKey(sf::Keyboard::Key key);
  void logDebugState() const;
  void logReport(double seconds) const;
  bool reachedStepLimit() const;

  SimConfig simConfig;
  std::unique_ptr<Simulation> sim;
  std::unique_ptr<Renderer> renderer;
  bool debugMode;
  bool batchStep;

  static constexpr int DEBUG_LOG_INTERVAL = 30;
};
