#pragma once

#include "entity.hpp"
#include "grid.hpp"
#include "utils.hpp"

#include <array>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

// Grid edge crossed by a candidate step
enum Boundary : uint8_t
{
  BOUNDARY_NONE = 0,
  BOUNDARY_TOP = 1,
  BOUNDARY_BOTTOM = 2,
  BOUNDARY_LEFT = 3,
  BOUNDARY_RIGHT = 4
};

// Thrown when a move keeps reflecting or colliding past the retry bound
class RetryLimitExceeded : public std::runtime_error
{
public:
  RetryLimitExceeded(CellType entityType, int retries);

  CellType getEntityType() const { return entityType; }

private:
  CellType entityType;
};

struct MoveResult
{
  bool success = false;
  int newX = 0;
  int newY = 0;
  // Secondary cells to flip, in the order the collisions produced them.
  // Collision cells themselves are flipped by the engine and never listed here.
  ToggleList additionalToggles;
  int collisions = 0;
  int boundaryHits = 0;
};

// Step-by-step record of a single move, for debugging
struct MoveTrace
{
  CellCoord initialPos{0, 0};
  CellType entityType = DAY;
  Direction direction = LEFT_UP;
  CellType cellStateAtPos = DAY;
  std::vector<CellCoord> collisions;
  std::vector<Boundary> boundaryHits;
  CellCoord finalPos{0, 0};
};

// Running totals filled in by batch moves
struct MoveTotals
{
  long long moves = 0;
  long long successfulMoves = 0;
  long long collisions = 0;
  long long boundaryHits = 0;
};

class RuleEngine
{
public:
  static constexpr int MAX_RETRIES = 8;

  // Alternatives tried in order after a collision
  static const std::unordered_map<Direction, std::array<Direction, 2>> COLLISION_ALTERNATIVES;
  // Orthogonal offset marked when an alternative is adopted
  static const std::unordered_map<Direction, Direction> ALTERNATIVE_OFFSETS;
  // Orthogonal offsets marked when falling back to a random heading, keyed by the colliding heading
  static const std::unordered_map<Direction, std::array<Direction, 2>> FALLBACK_OFFSETS;

  RuleEngine();
  explicit RuleEngine(uint32_t seed);

  // Both entity types back to left-up
  void reset();
  void seed(uint32_t seed);

  Direction getDirection(CellType type) const { return directions[type]; }
  void setDirection(CellType type, Direction direction);

  // Move one entity a single diagonal step, reflecting off edges and resolving collisions
  MoveResult moveEntity(Entity &entity, Grid &grid);
  MoveResult moveEntityTraced(Entity &entity, Grid &grid, MoveTrace &trace);

  // Move every entity once, in order, and return the secondary toggles without applying them
  ToggleList batchMoveEntities(std::vector<Entity> &entities, Grid &grid, MoveTotals *totals = nullptr);

  static void applyToggles(Grid &grid, const ToggleList &toggles);

  // Returns (dayCount, nightCount)
  static std::pair<int, int> countStates(const Grid &grid);

  static Boundary checkBoundaries(int x, int y, int width, int height);
  static Direction reflect(Direction direction, Boundary boundary);

private:
  MoveResult resolveMove(Entity &entity, Grid &grid, MoveTrace *trace);

  Direction handleCollision(const Entity &entity, const Grid &grid, Direction current,
                            std::vector<Direction> &offsets);

  static void appendSecondaryToggles(const CellCoord &collision, const std::vector<Direction> &offsets,
                                     const Grid &grid, ToggleList &toggles);

  std::array<Direction, 2> directions;
  std::mt19937 rng;
};
