#pragma once

#include "entity.hpp"
#include "grid.hpp"
#include "rule_engine.hpp"
#include "sim_config.hpp"
#include "utils.hpp"

#include <random>
#include <utility>
#include <vector>

struct SimulationStats
{
  long long totalMoves = 0;
  long long successfulMoves = 0;
  long long collisions = 0;
  long long boundaryHits = 0;
  long long togglesApplied = 0;
  double simulationTime = 0.0; // seconds spent inside step calls
};

class Simulation
{
public:
  using EntityList = std::vector<Entity>;

  explicit Simulation(const SimConfig &sc);

  // Restore the split grid, the initial population and both headings
  void reset();

  // Move every entity, then apply all secondary toggles at once and recount
  void step();

  // Move entities one at a time, applying each entity's toggles before the next moves
  void stepIndividual();

  // Entity management
  void addEntity(int x, int y, CellType type);
  void addEntitiesRandom(int count, CellType type);

  // Public accessors
  const Grid &getGrid() const { return grid; }
  const EntityList &getEntities() const { return entities; }
  const RuleEngine &getRules() const { return rules; }
  RuleEngine &getRules() { return rules; }
  const SimConfig &getConfig() const { return simConfig; }
  const SimulationStats &getStats() const { return stats; }
  int getFrame() const { return frame; }
  int getDayCount() const { return dayCount; }
  int getNightCount() const { return nightCount; }
  std::pair<int, int> getCounts() const { return {dayCount, nightCount}; }

private:
  void loadEntities();
  void updateCounts();

  SimConfig simConfig;
  Grid grid;
  RuleEngine rules;
  EntityList entities;
  std::mt19937 placementRng;

  // State variables
  int frame = 0;
  int dayCount = 0;
  int nightCount = 0;
  SimulationStats stats;
};
