#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown when a cell outside the grid is accessed
class OutOfBoundsError : public std::out_of_range
{
public:
  OutOfBoundsError(int x, int y, int width, int height);

  int getX() const { return x; }
  int getY() const { return y; }

private:
  int x;
  int y;
};

// Dense two-state cell matrix, stored row-major
class Grid
{
public:
  Grid(int width, int height);

  // Columns x < width / 2 are day, the rest night
  void initializeSplit();

  // Set every cell to day
  void reset();

  void toggle(int x, int y);
  CellType get(int x, int y) const;

  bool isInside(int x, int y) const
  {
    return x >= 0 && y >= 0 && x < width && y < height;
  }

  int getWidth() const noexcept { return width; }
  int getHeight() const noexcept { return height; }
  std::size_t size() const noexcept { return cells.size(); }

  const std::vector<uint8_t> &raw() const noexcept { return cells; }

private:
  int width;
  int height;
  std::vector<uint8_t> cells;

  std::size_t index(int x, int y) const;
};
