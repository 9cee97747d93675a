#include "grid.hpp"

#include <algorithm>

OutOfBoundsError::OutOfBoundsError(int x, int y, int width, int height)
    : std::out_of_range("Cell (" + std::to_string(x) + ", " + std::to_string(y) +
                        ") is outside the " + std::to_string(width) + "x" +
                        std::to_string(height) + " grid"),
      x(x),
      y(y)
{
}

Grid::Grid(int width, int height)
    : width(width), height(height)
{
  if (width <= 0 || height <= 0)
    throw std::invalid_argument("Grid dimensions must be positive");

  cells.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), DAY);
  initializeSplit();
}

void Grid::initializeSplit()
{
  const int midPoint = width / 2;
  for (int y = 0; y < height; ++y)
  {
    auto row = cells.begin() + static_cast<std::ptrdiff_t>(y) * width;
    std::fill(row, row + midPoint, DAY);
    std::fill(row + midPoint, row + width, NIGHT);
  }
}

void Grid::reset()
{
  std::fill(cells.begin(), cells.end(), DAY);
}

void Grid::toggle(int x, int y)
{
  auto &cell = cells[index(x, y)];
  cell = (cell == DAY) ? NIGHT : DAY;
}

CellType Grid::get(int x, int y) const
{
  return static_cast<CellType>(cells[index(x, y)]);
}

std::size_t Grid::index(int x, int y) const
{
  if (!isInside(x, y))
    throw OutOfBoundsError(x, y, width, height);
  return static_cast<std::size_t>(y) * width + x;
}
