#include "sim_config.hpp"
#include "sim_wrapper.hpp"

#include <getopt.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

namespace
{

enum LongOnlyOption
{
  OPT_HEADLESS = 256,
  OPT_NO_GRID,
  OPT_COORDS,
  OPT_DEBUG,
  OPT_INDIVIDUAL
};

void printUsage(const char *prog)
{
  std::printf(
      "Usage: %s [options]\n"
      "  -w, --width N            grid width in cells (default 20)\n"
      "  -H, --height N           grid height in cells (default 20)\n"
      "  -s, --seed N             seed for collision fallback and placement\n"
      "  -c, --cell-size N        cell size in pixels (default 25)\n"
      "  -d, --day-entities N     extra day entities at random cells\n"
      "  -n, --night-entities N   extra night entities at random cells\n"
      "  -f, --fps N              steps per second (default 10)\n"
      "  -m, --max-steps N        stop after N steps (0 = until closed)\n"
      "      --headless           run without a window (needs --max-steps)\n"
      "      --no-grid            hide grid lines\n"
      "      --coords             show cell coordinates\n"
      "      --debug              log entity positions every 30 steps\n"
      "      --individual         apply toggles after each entity instead of per step\n"
      "  -l, --log-level LEVEL    trace, debug, info, warn, err, critical, off\n"
      "  -h, --help               show this help\n",
      prog);
}

// Returns false when the program should exit after parsing
bool parseOptions(int argc, char **argv, SimConfigArgs &args)
{
  const char *shortOpt = "w:H:s:c:d:n:f:m:l:h";
  const option longOpt[] = {
      {"width", required_argument, nullptr, 'w'},
      {"height", required_argument, nullptr, 'H'},
      {"seed", required_argument, nullptr, 's'},
      {"cell-size", required_argument, nullptr, 'c'},
      {"day-entities", required_argument, nullptr, 'd'},
      {"night-entities", required_argument, nullptr, 'n'},
      {"fps", required_argument, nullptr, 'f'},
      {"max-steps", required_argument, nullptr, 'm'},
      {"log-level", required_argument, nullptr, 'l'},
      {"headless", no_argument, nullptr, OPT_HEADLESS},
      {"no-grid", no_argument, nullptr, OPT_NO_GRID},
      {"coords", no_argument, nullptr, OPT_COORDS},
      {"debug", no_argument, nullptr, OPT_DEBUG},
      {"individual", no_argument, nullptr, OPT_INDIVIDUAL},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  int c;
  while ((c = getopt_long(argc, argv, shortOpt, longOpt, nullptr)) != -1)
  {
    switch (c)
    {
    case 'w':
      args.width = std::stoi(optarg);
      break;
    case 'H':
      args.height = std::stoi(optarg);
      break;
    case 's':
      args.seed = static_cast<uint32_t>(std::stoul(optarg));
      break;
    case 'c':
      args.cellSize = std::stoi(optarg);
      break;
    case 'd':
      args.randomDayEntities = std::stoi(optarg);
      break;
    case 'n':
      args.randomNightEntities = std::stoi(optarg);
      break;
    case 'f':
      args.stepsPerSecond = std::stoi(optarg);
      break;
    case 'm':
      args.maxSteps = std::stoll(optarg);
      break;
    case 'l':
      args.logLevel = optarg;
      break;
    case OPT_HEADLESS:
      args.headless = true;
      break;
    case OPT_NO_GRID:
      args.showGrid = false;
      break;
    case OPT_COORDS:
      args.showCoordinates = true;
      break;
    case OPT_DEBUG:
      args.debugMode = true;
      break;
    case OPT_INDIVIDUAL:
      args.batchStep = false;
      break;
    case 'h':
      printUsage(argv[0]);
      return false;
    default:
      printUsage(argv[0]);
      std::exit(EXIT_FAILURE);
    }
  }

  return true;
}

} // namespace

int main(int argc, char **argv)
{
  try
  {
    SimConfigArgs args;
    if (!parseOptions(argc, argv, args))
      return EXIT_SUCCESS;

    SimConfig config = SimConfig::fromArgs(&args);
    config.validate();
    spdlog::set_level(spdlog::level::from_str(config.logLevel));

    SimWrapper wrapper(config);
    if (config.headless)
      wrapper.runHeadless();
    else
      wrapper.run();
  }
  catch (const std::exception &e)
  {
    spdlog::critical("{}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
