#pragma once

#include <array>
#include <cstdint>
#include <utility>
#include <vector>

// Cell coordinate as (x, y), x is the column and y the row
using CellCoord = std::pair<int, int>;
using ToggleList = std::vector<CellCoord>;

// Cell state, also used as the type tag of an entity
enum CellType : uint8_t
{
  DAY = 0,
  NIGHT = 1
};

// Compass directions, y grows downward
enum Direction : uint8_t
{
  LEFT_UP = 0,
  UP = 1,
  RIGHT_UP = 2,
  LEFT = 3,
  RIGHT = 4,
  LEFT_DOWN = 5,
  DOWN = 6,
  RIGHT_DOWN = 7
};

constexpr std::array<Direction, 4> DIAGONAL_DIRECTIONS = {LEFT_UP, RIGHT_UP, LEFT_DOWN, RIGHT_DOWN};

// Convert a direction (0-7) to its unit step
inline CellCoord mapDirectionToVector(Direction direction)
{
  switch (direction)
  {
  case LEFT_UP:
    return {-1, -1};
  case UP:
    return {0, -1};
  case RIGHT_UP:
    return {1, -1};
  case LEFT:
    return {-1, 0};
  case RIGHT:
    return {1, 0};
  case LEFT_DOWN:
    return {-1, 1};
  case DOWN:
    return {0, 1};
  case RIGHT_DOWN:
  default:
    return {1, 1};
  }
}

inline bool isDiagonal(Direction direction)
{
  return direction == LEFT_UP || direction == RIGHT_UP ||
         direction == LEFT_DOWN || direction == RIGHT_DOWN;
}

inline CellCoord offsetCell(const CellCoord &cell, Direction direction)
{
  auto [dx, dy] = mapDirectionToVector(direction);
  return {cell.first + dx, cell.second + dy};
}

inline const char *cellTypeName(CellType type)
{
  return type == DAY ? "day" : "night";
}

inline const char *directionName(Direction direction)
{
  switch (direction)
  {
  case LEFT_UP:
    return "left-up";
  case UP:
    return "up";
  case RIGHT_UP:
    return "right-up";
  case LEFT:
    return "left";
  case RIGHT:
    return "right";
  case LEFT_DOWN:
    return "left-down";
  case DOWN:
    return "down";
  case RIGHT_DOWN:
    return "right-down";
  }
  return "unknown";
}
