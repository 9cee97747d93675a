#include <doctest/doctest.h>

#include "sim_config.hpp"
#include "simulation.hpp"

#include <stdexcept>

TEST_CASE("Simulation places one night and one day entity")
{
  Simulation sim(SimConfig(20, 20, 3u));

  REQUIRE(sim.getEntities().size() == 2);
  CHECK(sim.getEntities()[0].getEntityType() == NIGHT);
  CHECK(sim.getEntities()[0].getCell() == CellCoord{10, 5});
  CHECK(sim.getEntities()[1].getEntityType() == DAY);
  CHECK(sim.getEntities()[1].getCell() == CellCoord{15, 15});

  CHECK(sim.getDayCount() == 200);
  CHECK(sim.getNightCount() == 200);
  CHECK(sim.getFrame() == 0);
}

TEST_CASE("Random population is added after the default pair")
{
  Simulation sim(SimConfig(10, 8, 5u, 3, 4));

  REQUIRE(sim.getEntities().size() == 9);
  for (std::size_t i = 2; i < 5; ++i)
    CHECK(sim.getEntities()[i].getEntityType() == DAY);
  for (std::size_t i = 5; i < 9; ++i)
    CHECK(sim.getEntities()[i].getEntityType() == NIGHT);
  for (const auto &entity : sim.getEntities())
    CHECK(sim.getGrid().isInside(entity.getXPos(), entity.getYPos()));
}

TEST_CASE("First two steps on a 5x5 grid")
{
  Simulation sim(SimConfig(5, 5, 11u));
  REQUIRE(sim.getEntities()[0].getCell() == CellCoord{2, 1});
  REQUIRE(sim.getEntities()[1].getCell() == CellCoord{3, 3});

  // Both step left-up onto cells of the other colour
  sim.step();
  CHECK(sim.getEntities()[0].getCell() == CellCoord{1, 0});
  CHECK(sim.getEntities()[1].getCell() == CellCoord{2, 2});
  CHECK(sim.getDayCount() == 10);
  CHECK(sim.getNightCount() == 15);
  CHECK(sim.getFrame() == 1);

  // Night bounces off the top edge; day collides at (1, 1) and turns right-up
  sim.step();
  CHECK(sim.getEntities()[0].getCell() == CellCoord{0, 1});
  CHECK(sim.getEntities()[1].getCell() == CellCoord{3, 1});
  CHECK(sim.getRules().getDirection(NIGHT) == LEFT_DOWN);
  CHECK(sim.getRules().getDirection(DAY) == RIGHT_UP);
  CHECK(sim.getGrid().get(1, 1) == NIGHT);
  CHECK(sim.getGrid().get(0, 1) == NIGHT);
  CHECK(sim.getDayCount() == 8);
  CHECK(sim.getNightCount() == 17);

  const SimulationStats &stats = sim.getStats();
  CHECK(stats.totalMoves == 4);
  CHECK(stats.successfulMoves == 4);
  CHECK(stats.collisions == 1);
  CHECK(stats.boundaryHits == 1);
  CHECK(stats.togglesApplied == 1);
  CHECK(stats.simulationTime >= 0.0);
}

TEST_CASE("Counts and positions stay valid over many steps")
{
  Simulation sim(SimConfig(20, 20, 42u, 10, 10));
  const int cells = 20 * 20;

  for (int i = 0; i < 500; ++i)
  {
    if (i % 2 == 0)
      sim.step();
    else
      sim.stepIndividual();

    REQUIRE(sim.getDayCount() + sim.getNightCount() == cells);
    for (const auto &entity : sim.getEntities())
    {
      REQUIRE(entity.getXPos() >= 0);
      REQUIRE(entity.getXPos() < 20);
      REQUIRE(entity.getYPos() >= 0);
      REQUIRE(entity.getYPos() < 20);
    }
  }

  auto [day, night] = RuleEngine::countStates(sim.getGrid());
  CHECK(day == sim.getDayCount());
  CHECK(night == sim.getNightCount());
  CHECK(sim.getStats().totalMoves == 500 * 22);
  CHECK(sim.getFrame() == 500);
}

TEST_CASE("Seeded simulations replay identically")
{
  Simulation first(SimConfig(16, 12, 1234u, 5, 5));
  Simulation second(SimConfig(16, 12, 1234u, 5, 5));

  for (int i = 0; i < 300; ++i)
  {
    first.step();
    second.step();
  }

  CHECK(first.getGrid().raw() == second.getGrid().raw());
  REQUIRE(first.getEntities().size() == second.getEntities().size());
  for (std::size_t i = 0; i < first.getEntities().size(); ++i)
    CHECK(first.getEntities()[i].getCell() == second.getEntities()[i].getCell());
  CHECK(first.getCounts() == second.getCounts());
}

TEST_CASE("Reset restores the starting state")
{
  Simulation sim(SimConfig(12, 12, 8u, 2, 2));
  const auto startGrid = sim.getGrid().raw();
  std::vector<CellCoord> startCells;
  for (const auto &entity : sim.getEntities())
    startCells.push_back(entity.getCell());

  for (int i = 0; i < 40; ++i)
    sim.step();
  sim.reset();

  CHECK(sim.getFrame() == 0);
  CHECK(sim.getGrid().raw() == startGrid);
  CHECK(sim.getDayCount() == 72);
  CHECK(sim.getNightCount() == 72);
  CHECK(sim.getRules().getDirection(DAY) == LEFT_UP);
  CHECK(sim.getRules().getDirection(NIGHT) == LEFT_UP);
  CHECK(sim.getStats().totalMoves == 0);
  REQUIRE(sim.getEntities().size() == startCells.size());
  for (std::size_t i = 0; i < startCells.size(); ++i)
    CHECK(sim.getEntities()[i].getCell() == startCells[i]);
}

TEST_CASE("Entities can only be added inside the grid")
{
  Simulation sim(SimConfig(5, 5, 1u));

  sim.addEntity(4, 4, DAY);
  CHECK(sim.getEntities().size() == 3);
  CHECK_THROWS_AS(sim.addEntity(5, 0, NIGHT), OutOfBoundsError);
  CHECK_THROWS_AS(sim.addEntity(0, -1, DAY), OutOfBoundsError);
  CHECK(sim.getEntities().size() == 3);
}

TEST_CASE("A step that cannot resolve is aborted")
{
  Simulation sim(SimConfig(1, 1, 1u));

  CHECK_THROWS_AS(sim.step(), RetryLimitExceeded);
  CHECK(sim.getFrame() == 0);
  CHECK(sim.getStats().totalMoves == 0);
}

TEST_CASE("SimConfig built from options")
{
  SUBCASE("null options give defaults")
  {
    SimConfig config = SimConfig::fromArgs(nullptr);
    CHECK(config.width == 20);
    CHECK(config.height == 20);
    CHECK_FALSE(config.seed.has_value());
    CHECK(config.batchStep);
    CHECK(config.showGrid);
    CHECK(config.stepsPerSecond == 10);
    CHECK_NOTHROW(config.validate());
  }

  SUBCASE("parsed options are carried over")
  {
    SimConfigArgs args;
    args.width = 30;
    args.height = 12;
    args.seed = 77u;
    args.randomNightEntities = 4;
    args.batchStep = false;
    args.headless = true;
    args.maxSteps = 100;
    args.logLevel = "debug";

    SimConfig config = SimConfig::fromArgs(&args);
    CHECK(config.width == 30);
    CHECK(config.height == 12);
    REQUIRE(config.seed.has_value());
    CHECK(*config.seed == 77u);
    CHECK(config.randomNightEntities == 4);
    CHECK_FALSE(config.batchStep);
    CHECK(config.headless);
    CHECK(config.maxSteps == 100);
    CHECK_NOTHROW(config.validate());
  }

  SUBCASE("bad values are rejected")
  {
    SimConfig config;
    config.width = 0;
    CHECK_THROWS_AS(config.validate(), std::invalid_argument);

    config = SimConfig();
    config.headless = true;
    CHECK_THROWS_AS(config.validate(), std::invalid_argument);

    config = SimConfig();
    config.logLevel = "loud";
    CHECK_THROWS_AS(config.validate(), std::invalid_argument);

    config = SimConfig();
    config.randomDayEntities = -1;
    CHECK_THROWS_AS(config.validate(), std::invalid_argument);
  }
}
