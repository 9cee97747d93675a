#pragma once

#include <SFML/Graphics.hpp>
#include <SFML/System.hpp>
#include <string>
#include <vector>
#include "cell_map.hpp"
#include "entity_renderer.hpp"
#include "simulation.hpp"

class Renderer
{
public:
  static constexpr int STATUS_BAR_HEIGHT = 30;

  Renderer(const Simulation *sim, unsigned int cellSize, bool showGrid = true, bool showCoordinates = false);

  // Handle window events; returns the keys pressed since the last call
  std::vector<sf::Keyboard::Key> pollEvents();

  // Main drawing method
  void draw();

  void setFramerateLimit(unsigned int limit) { window.setFramerateLimit(limit); }
  bool isWindowOpen() const { return window.isOpen(); }
  void close() { window.close(); }

  void toggleGrid() { showGrid = !showGrid; }
  void toggleCoordinates() { showCoordinates = !showCoordinates; }
  bool isGridShown() const { return showGrid; }
  bool areCoordinatesShown() const { return showCoordinates; }

  // Accessors
  sf::RenderWindow &getWindow() { return window; }
  const sf::RenderWindow &getWindow() const { return window; }

private:
  // Helper methods
  void loadFont();
  void updateScreenSize();
  void updateOffsets();
  void drawGridLines();
  void drawCoordinates();
  void drawCounters();

  // Member variables
  const Simulation *sim;
  unsigned int cellSize;
  float srcWidth;
  float srcHeight;
  sf::RenderWindow window;
  float adjust = 1.0f;
  float width;
  float height;
  float xOffset = 0.0f;
  float yOffset = 0.0f;
  bool showGrid;
  bool showCoordinates;
  bool fontLoaded = false;

  CellMap cellMap;
  EntityRenderer entityRenderer;

  // Static color constants
  static const sf::Color BG_COLOR;
  static const sf::Color GRID_LINE_COLOR;
  static const sf::Color TEXT_COLOR;

  sf::Font font;
  sf::Text text;
};
