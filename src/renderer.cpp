#include "renderer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

// Initialize static color constants
const sf::Color Renderer::BG_COLOR(200, 200, 200);
const sf::Color Renderer::GRID_LINE_COLOR(255, 255, 255, 64); // White with 25% opacity
const sf::Color Renderer::TEXT_COLOR(0, 0, 0);

Renderer::Renderer(const Simulation *sim, unsigned int cellSize, bool showGrid, bool showCoordinates)
    : sim(sim),
      cellSize(cellSize),
      srcWidth(static_cast<float>(sim->getGrid().getWidth() * cellSize)),
      srcHeight(static_cast<float>(sim->getGrid().getHeight() * cellSize + STATUS_BAR_HEIGHT)),
      window(sf::VideoMode(static_cast<unsigned int>(srcWidth), static_cast<unsigned int>(srcHeight)),
             "Day/Night Simulation", sf::Style::Default),
      width(srcWidth),
      height(srcHeight),
      showGrid(showGrid),
      showCoordinates(showCoordinates),
      cellMap(cellSize),
      entityRenderer(cellSize)
{
  // Center the window on the screen
  sf::VideoMode desktop = sf::VideoMode::getDesktopMode();
  sf::Vector2i windowPos(
      (static_cast<int>(desktop.width) - static_cast<int>(window.getSize().x)) / 2,
      (static_cast<int>(desktop.height) - static_cast<int>(window.getSize().y)) / 2);
  window.setPosition(windowPos);

  loadFont();

  cellMap.initialize(sim->getGrid());
  entityRenderer.initialize(sim);
}

void Renderer::loadFont()
{
  fontLoaded = font.loadFromFile("assets/fonts/DejaVuSans.ttf");
  if (!fontLoaded)
  {
    // Try system font paths
    const std::vector<std::string> fontPaths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/System/Library/Fonts/Helvetica.ttc",
        "C:/Windows/Fonts/arial.ttf"};

    for (const auto &path : fontPaths)
    {
      if (std::filesystem::exists(path) && font.loadFromFile(path))
      {
        fontLoaded = true;
        break;
      }
    }
  }

  if (fontLoaded)
  {
    text.setFont(font);
    text.setCharacterSize(16);
    text.setFillColor(TEXT_COLOR);
  }
  else
  {
    spdlog::warn("Could not load any font, counters and coordinate labels are disabled");
  }
}

std::vector<sf::Keyboard::Key> Renderer::pollEvents()
{
  std::vector<sf::Keyboard::Key> pressed;

  sf::Event event;
  while (window.pollEvent(event))
  {
    if (event.type == sf::Event::Closed)
    {
      window.close();
    }
    else if (event.type == sf::Event::KeyPressed)
    {
      if (event.key.code == sf::Keyboard::Escape)
        window.close();
      else
        pressed.push_back(event.key.code);
    }
    else if (event.type == sf::Event::Resized)
    {
      // Update view to match new window size
      sf::FloatRect visibleArea(0.f, 0.f, static_cast<float>(event.size.width), static_cast<float>(event.size.height));
      window.setView(sf::View(visibleArea));
    }
  }

  return pressed;
}

void Renderer::draw()
{
  if (!window.isOpen())
    return;

  updateScreenSize();
  updateOffsets();

  // Apply screen scaling to cell map and entity renderer
  cellMap.setScale(sf::Vector2f(adjust, adjust));
  cellMap.setPosition(sf::Vector2f(xOffset, yOffset));

  entityRenderer.setScale(sf::Vector2f(adjust, adjust));
  entityRenderer.setPosition(sf::Vector2f(xOffset, yOffset));

  window.clear(BG_COLOR);

  cellMap.update(sim->getGrid());
  window.draw(cellMap);

  if (showGrid)
    drawGridLines();

  entityRenderer.update();
  window.draw(entityRenderer);

  if (showCoordinates)
    drawCoordinates();

  drawCounters();

  window.display();
}

void Renderer::updateScreenSize()
{
  auto size = window.getSize();
  adjust = std::min(static_cast<float>(size.x) / srcWidth,
                    static_cast<float>(size.y) / srcHeight);
  width = srcWidth * adjust;
  height = srcHeight * adjust;
}

void Renderer::updateOffsets()
{
  auto size = window.getSize();
  xOffset = (size.x - width) / 2.0f;
  yOffset = (size.y - height) / 2.0f;
}

void Renderer::drawGridLines()
{
  const int gridWidth = sim->getGrid().getWidth();
  const int gridHeight = sim->getGrid().getHeight();
  const float scaledCell = cellSize * adjust;

  for (int i = 0; i <= gridWidth; i++)
  {
    sf::RectangleShape line;
    line.setSize({1.0f, gridHeight * scaledCell});
    line.setPosition({xOffset + i * scaledCell, yOffset});
    line.setFillColor(GRID_LINE_COLOR);
    window.draw(line);
  }

  for (int i = 0; i <= gridHeight; i++)
  {
    sf::RectangleShape line;
    line.setSize({gridWidth * scaledCell, 1.0f});
    line.setPosition({xOffset, yOffset + i * scaledCell});
    line.setFillColor(GRID_LINE_COLOR);
    window.draw(line);
  }
}

void Renderer::drawCoordinates()
{
  if (!fontLoaded)
    return;

  const Grid &grid = sim->getGrid();
  const float scaledCell = cellSize * adjust;

  sf::Text label("", font, std::max(6u, static_cast<unsigned int>(scaledCell / 3.0f)));
  for (int y = 0; y < grid.getHeight(); ++y)
  {
    for (int x = 0; x < grid.getWidth(); ++x)
    {
      // Contrast against the cell underneath
      label.setFillColor(grid.get(x, y) == DAY ? CellMap::NIGHT_COLOR : CellMap::DAY_COLOR);
      label.setString(std::to_string(x) + "," + std::to_string(y));
      label.setPosition({xOffset + x * scaledCell + 1.0f, yOffset + y * scaledCell});
      window.draw(label);
    }
  }
}

void Renderer::drawCounters()
{
  if (!fontLoaded)
    return;

  text.setString("day " + std::to_string(sim->getDayCount()) +
                 " | night " + std::to_string(sim->getNightCount()));
  text.setScale(adjust, adjust);
  text.setPosition({xOffset + 10.0f * adjust,
                    yOffset + (srcHeight - STATUS_BAR_HEIGHT + 5.0f) * adjust});
  window.draw(text);
}
