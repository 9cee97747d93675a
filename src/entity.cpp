#include "entity.hpp"

Entity::Entity(CellType entityType, int xcoord, int ycoord)
    : entityType(entityType), xpos(xcoord), ypos(ycoord), xposOld(xcoord), yposOld(ycoord)
{
}

void Entity::moveTo(int x, int y)
{
  xposOld = xpos;
  yposOld = ypos;
  xpos = x;
  ypos = y;
}
