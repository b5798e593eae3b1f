// -----------------------------------------------------------------------------
// turf_engine_cli — single executable entry point.
//
//   turf_engine_cli <config.json> <timeline.json>
//                   [--forecast] [--report <out.json>] [--ratings <out.json>]
//
//   1) Load and validate the EngineConfig (non_finisher_policy is required).
//   2) Load the race timeline; malformed records abort before any work.
//   3) Subscribe logging callbacks on the engine's EventBus.
//   4) Run a forward-chaining backtest (default) or a forecast of the
//      pending events (--forecast).
//   5) Print a summary and optionally write the JSON report, and the rating
//      history with --ratings.
//
// Exit codes: 0 success, 1 usage, 2 configuration or input error,
// 3 leakage or ordering violation, 4 cancelled.
// -----------------------------------------------------------------------------

#include "turf/engine/race_engine.hpp"
#include "turf/errors.hpp"
#include "turf/events/event.hpp"
#include "turf/io/json_codec.hpp"

#include <csignal>
#include <iostream>
#include <optional>
#include <string>

// The only global: lets the SIGINT handler ask the engine to stop at the
// next event or fold boundary. Owned by SigintScope.
static turf::RaceEngine* g_engine_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_engine_ptr != nullptr) {
    g_engine_ptr->cancel();
  }
}

namespace {

// Routes SIGINT to one engine for the lifetime of this object. Declared
// after the engine so it is torn down first.
class SigintScope {
 public:
  explicit SigintScope(turf::RaceEngine& engine) {
    g_engine_ptr = &engine;
    std::signal(SIGINT, sigint_handler);
  }
  ~SigintScope() {
    std::signal(SIGINT, SIG_DFL);
    g_engine_ptr = nullptr;
  }
  SigintScope(const SigintScope&) = delete;
  SigintScope& operator=(const SigintScope&) = delete;
};

struct CliOptions {
  std::string config_path;
  std::string timeline_path;
  bool forecast{false};
  std::optional<std::string> report_path;
  std::optional<std::string> ratings_path;
};

void printUsage() {
  std::cerr << "usage: turf_engine_cli <config.json> <timeline.json> "
               "[--forecast] [--report <out.json>] [--ratings <out.json>]\n";
}

std::optional<CliOptions> parseArgs(int argc, char** argv) {
  CliOptions opts;
  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--forecast") {
      opts.forecast = true;
    } else if (arg == "--report" && i + 1 < argc) {
      opts.report_path = argv[++i];
    } else if (arg == "--ratings" && i + 1 < argc) {
      opts.ratings_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && positional < 2) {
      (positional++ == 0 ? opts.config_path : opts.timeline_path) = arg;
    } else {
      return std::nullopt;
    }
  }
  if (positional != 2) {
    return std::nullopt;
  }
  return opts;
}

void subscribeLogging(turf::EventBus& bus) {
  bus.subscribe<turf::FoldSkippedEvent>([](const turf::FoldSkippedEvent& e) {
    std::cerr << "[Fold] " << e.fold_index << " skipped: " << e.reason << "\n";
  });
  bus.subscribe<turf::NumericalIncidentEvent>(
      [](const turf::NumericalIncidentEvent& e) {
        std::cerr << "[NumericalIncident] event#" << e.event_id;
        if (e.fold_index) {
          std::cerr << " fold=" << *e.fold_index;
        }
        std::cerr << " reason=" << e.reason << "\n";
      });
  bus.subscribe<turf::RatingPassEvent>([](const turf::RatingPassEvent& e) {
    std::cout << "[RatingPass]";
    if (e.fold_index) {
      std::cout << " fold=" << *e.fold_index;
    }
    std::cout << " applied=" << e.events_applied
              << " pending_skipped=" << e.pending_skipped
              << " snapshots=" << e.snapshots_appended
              << (e.cancelled ? " (cancelled)" : "") << "\n";
  });
}

int runBacktest(turf::RaceEngine& engine, const turf::EventTimeline& timeline,
                const CliOptions& opts) {
  const turf::EvaluationReport report = engine.backtest(timeline);

  std::cout << "[main] folds=" << report.folds.size() << "/"
            << report.folds_planned
            << " skipped=" << report.skipped_folds.size()
            << " events=" << report.aggregate.events
            << " log_loss=" << report.aggregate.log_loss
            << " brier=" << report.aggregate.brier
            << " incidents=" << report.numerical_incidents << "\n";

  if (opts.report_path) {
    nlohmann::json j = turf::io::reportToJson(report);
    j["config"] = turf::io::engineConfigToJson(engine.config());
    turf::io::writeJson(j, *opts.report_path);
    std::cout << "[main] report written to " << *opts.report_path << "\n";
  }
  return report.cancelled ? 4 : 0;
}

int runForecast(turf::RaceEngine& engine, const turf::EventTimeline& timeline,
                const CliOptions& opts) {
  const turf::Forecast forecast = engine.forecast(timeline);
  const nlohmann::json j = turf::io::forecastToJson(forecast.predictions);

  if (opts.report_path) {
    turf::io::writeJson(j, *opts.report_path);
    std::cout << "[main] forecast written to " << *opts.report_path << "\n";
  } else {
    std::cout << j.dump(2) << "\n";
  }
  return forecast.cancelled ? 4 : 0;
}

}  // namespace

int main(int argc, char** argv) {
  const std::optional<CliOptions> opts = parseArgs(argc, argv);
  if (!opts) {
    printUsage();
    return 1;
  }

  try {
    const turf::domain::EngineConfig config =
        turf::io::loadEngineConfig(opts->config_path);
    const turf::EventTimeline timeline =
        turf::io::loadTimeline(opts->timeline_path);
    std::cout << "[main] loaded " << timeline.size() << " events ("
              << timeline.settledEvents().size() << " settled, "
              << timeline.pendingEvents().size() << " pending)\n";

    turf::RaceEngine engine(config);
    subscribeLogging(engine.eventBus());

    const SigintScope sigint(engine);

    const int rc = opts->forecast ? runForecast(engine, timeline, *opts)
                                  : runBacktest(engine, timeline, *opts);

    if (opts->ratings_path) {
      turf::io::writeJson(
          turf::io::ratingRowsToJson(engine.ratingHistory(timeline)),
          *opts->ratings_path);
      std::cout << "[main] rating history written to " << *opts->ratings_path
                << "\n";
    }
    return rc;
  } catch (const turf::LeakageError& e) {
    std::cerr << "[main] FATAL: " << e.what() << "\n";
    return 3;
  } catch (const turf::OrderingError& e) {
    std::cerr << "[main] FATAL: " << e.what() << "\n";
    return 3;
  } catch (const turf::TurfError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 2;
  }
}
