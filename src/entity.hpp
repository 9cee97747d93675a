#pragma once

#include "utils.hpp"

class Entity
{
public:
  Entity(CellType entityType, int xcoord, int ycoord);

  // Record the current cell as the previous one, then move
  void moveTo(int x, int y);

  // Getters
  CellType getEntityType() const { return entityType; }
  int getXPos() const { return xpos; }
  int getYPos() const { return ypos; }
  int getXPosOld() const { return xposOld; }
  int getYPosOld() const { return yposOld; }
  CellCoord getCell() const { return {xpos, ypos}; }

private:
  CellType entityType;
  int xpos;
  int ypos;
  int xposOld;
  int yposOld;
};
