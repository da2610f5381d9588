/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 */

#include "../include/service_controller.hpp"

#include <signal.h>

#include <iomanip>
#include <iostream>

#include "../include/configloader.hpp"
#include "../include/configmanager.hpp"
#include "../include/errors.hpp"
#include "steward/SignalRouter.hpp"
#include "steward/compositelogger.hpp"
#include "steward/consolelogger.hpp"
#include "steward/syncfilelogger.hpp"

namespace {

int exitCodeFor(const ReconcileResult &result) {
  switch (result.outcome) {
    case ReconcileOutcome::Converged:
      return EXIT_OK;
    case ReconcileOutcome::TimedOut:
      return EXIT_TIMEOUT;
    case ReconcileOutcome::Cancelled:
      return EXIT_CANCELLED;
  }
  return EXIT_FAILED;
}

}  // namespace

ServiceController::~ServiceController() {
  if (signalsRegistered_) {
    auto &router = steward::SignalRouter::instance();
    router.stop();
    router.unregisterHandler(SIGINT);
    router.unregisterHandler(SIGTERM);
  }
  session_.close();
}

int ServiceController::run(int argc, char **argv) {
  ParsedArgs args;
  try {
    ArgumentParser parser;
    args = parser.parse(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n\n";
    printHelp();
    return EXIT_BAD_ARGS;
  }

  if (args.help_message) {
    printHelp();
    return EXIT_OK;
  }
  if (args.version_message) {
    printVersion();
    return EXIT_OK;
  }

  try {
    auto &config = ConfigManager::instance();
    config.initialize(args.config_path);
    if (!args.overrides.empty()) config.applyCliOverrides(args.overrides);
    initLogger(args);

    buildOrchestrator(args);
    registerSignals();
    return dispatch(args);
  } catch (const ConflictError &e) {
    steward::CompositeLogger::instance().error(e.what());
    printValidation(e.result());
    return EXIT_CONFLICT;
  } catch (const GuardViolation &e) {
    steward::CompositeLogger::instance().error(e.what());
    std::cerr << e.what() << '\n';
    return EXIT_GUARD;
  } catch (const StewardError &e) {
    steward::CompositeLogger::instance().error(e.what());
    std::cerr << errorKindToString(e.kind()) << ": " << e.what() << '\n';
    switch (e.kind()) {
      case ErrorKind::InvalidArgument:
        return EXIT_BAD_ARGS;
      case ErrorKind::Timeout:
        return EXIT_TIMEOUT;
      default:
        return EXIT_FAILED;
    }
  } catch (const std::invalid_argument &e) {
    steward::CompositeLogger::instance().error(e.what());
    std::cerr << e.what() << '\n';
    return EXIT_BAD_ARGS;
  } catch (const std::exception &e) {
    steward::CompositeLogger::instance().critical(e.what());
    std::cerr << e.what() << '\n';
    return EXIT_FAILED;
  }
}

void ServiceController::initLogger(const ParsedArgs &args) {
  auto &composite_logger = steward::CompositeLogger::instance();
  composite_logger.clear();

  auto getSingletonPtr = [](auto &singleton) {
    return std::shared_ptr<std::remove_reference_t<decltype(singleton)>>(
        &singleton, [](auto *) {});
  };

  if (!args.use_cli_logging) {
    auto config = ConfigManager::instance().getMergedConfig(args.environment);
    if (config.contains("logging") && config["logging"].is_array()) {
      for (auto &entry : config["logging"]) {
        std::string type = entry.value("type", "console");
        auto level = steward::stringToLogLevel(entry.value("level", "info"));

        if (type == "console") {
          auto &logger = steward::ConsoleLogger::instance();
          logger.setLogLevel(level);
          logger.setColorEnabled(entry.value("color", true));
          composite_logger.addLogger(getSingletonPtr(logger));
        } else if (type == "sync_file") {
          auto &logger = steward::SyncFileLogger::instance();
          logger.setMainLogPath(entry.value("file", "nodesteward.log"));
          if (entry.contains("fallback_file")) {
            logger.setFallbackLogPath(entry["fallback_file"].get<std::string>());
          }
          if (entry.contains("max_size_bytes")) {
            logger.setRotationConfig(
                {true, entry["max_size_bytes"].get<std::size_t>()});
          }
          logger.setLogLevel(level);
          composite_logger.addLogger(getSingletonPtr(logger));
        }
      }
    }
    if (config.contains("time_format") && config["time_format"].is_string()) {
      steward::TimeFormatter::setGlobalFormat(
          config["time_format"].get<std::string>());
    }
  } else if (!args.logger_types.empty()) {
    for (const auto &type : args.logger_types) {
      if (type == "console") {
        composite_logger.addLogger(
            getSingletonPtr(steward::ConsoleLogger::instance()));
      } else if (type == "sync_file") {
        composite_logger.addLogger(
            getSingletonPtr(steward::SyncFileLogger::instance()));
      }
    }
  } else {
    composite_logger.addLogger(
        getSingletonPtr(steward::ConsoleLogger::instance()));
  }

  if (args.log_level.has_value()) {
    composite_logger.setLogLevel(steward::stringToLogLevel(*args.log_level));
  }
}

void ServiceController::buildOrchestrator(const ParsedArgs &args) {
  const auto merged = ConfigManager::instance().getMergedConfig(args.environment);
  auto settings = OrchestratorSettings::fromConfig(merged);

  registry_ = std::make_unique<NodeRegistry>(settings.resolvedRegistryFile());
  supervisor_ = std::make_unique<PosixProcessSupervisor>(settings.probePort);
  memory_ = std::make_unique<SysconfMemoryReporter>();
  wait_ = std::make_unique<SteadyWaitStrategy>();
  orchestrator_ = std::make_unique<NodeOrchestrator>(
      std::move(settings), *registry_, *supervisor_, *memory_, *wait_);

  steward::CompositeLogger::instance().debug(
      "ServiceController: Registry " + registry_->registryFile() + " with " +
      std::to_string(registry_->size()) + " nodes");
}

void ServiceController::registerSignals() {
  auto &router = steward::SignalRouter::instance();
  auto onSignal = [this](int signum) {
    steward::CompositeLogger::instance().info(
        "ServiceController: Signal " + std::to_string(signum) +
        " received, closing management session");
    session_.close();
  };
  router.registerHandler(SIGINT, onSignal);
  router.registerHandler(SIGTERM, onSignal);
  router.start();
  signalsRegistered_ = true;
}

nlohmann::json ServiceController::readJsonFile(const std::string &path) const {
  ConfigLoader loader;
  return loader.loadFromFile(path);
}

void ServiceController::printNode(const NodeConfig &config,
                                  const ParsedArgs &args) const {
  if (args.json_output) {
    std::cout << config.toJson().dump(2) << '\n';
  } else {
    std::cout << config.name << " (" << config.cluster << ") "
              << config.nodeUrl() << " transport " << config.transportPort
              << "\n  config: " << config.configPath
              << "\n  data:   " << config.dataPath
              << "\n  logs:   " << config.logsPath << '\n';
  }
}

void ServiceController::printValidation(const ValidationResult &result) const {
  std::cout << result.toJson().dump(2) << '\n';
}

int ServiceController::awaitTicket(const ReconcileTicket &ticket,
                                   const ParsedArgs &args) {
  if (ticket.alreadyInState) {
    std::cout << "Node \"" << ticket.node << "\" is already in the requested "
              << "state\n";
    return EXIT_OK;
  }
  if (!args.wait) {
    std::cout << "Command accepted for node \"" << ticket.node << "\""
              << (ticket.joined ? " (joined running reconciliation)" : "")
              << '\n';
    return EXIT_OK;
  }

  const ReconcileResult result = ticket.result.get();
  if (args.json_output) {
    std::cout << nlohmann::json{{"node", result.node},
                                {"outcome", reconcileOutcomeToString(result.outcome)},
                                {"attempts", result.attempts},
                                {"state", nodeStateToString(result.finalState)}}
                     .dump(2)
              << '\n';
  } else {
    std::cout << "Node \"" << result.node << "\": "
              << reconcileOutcomeToString(result.outcome) << " after "
              << result.attempts << " attempts, state "
              << nodeStateToString(result.finalState) << '\n';
  }
  return exitCodeFor(result);
}

int ServiceController::dispatch(const ParsedArgs &args) {
  const auto &cmd = args.command;
  const auto &pos = args.positional;
  auto &orchestrator = *orchestrator_;

  if (cmd == "list") {
    const auto views = orchestrator.list();
    if (args.json_output) {
      nlohmann::json out = nlohmann::json::array();
      for (const auto &view : views) out.push_back(view.toJson());
      std::cout << out.dump(2) << '\n';
    } else {
      for (const auto &view : views) {
        std::cout << std::left << std::setw(24) << view.config.name
                  << std::setw(24) << view.config.cluster << std::setw(7)
                  << view.config.httpPort << std::setw(7)
                  << view.config.transportPort
                  << nodeStateToString(view.observation.state) << '\n';
      }
    }
    return EXIT_OK;
  }

  if (cmd == "clusters") {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &cluster : orchestrator.clusterStatus()) {
      out.push_back(cluster.toJson());
    }
    std::cout << out.dump(2) << '\n';
    return EXIT_OK;
  }

  if (cmd == "show") {
    std::cout << orchestrator.getNode(pos[0]).toJson().dump(2) << '\n';
    return EXIT_OK;
  }

  if (cmd == "validate") {
    const auto candidate = NodeConfig::fromJson(readJsonFile(pos[0]));
    const auto result = orchestrator.validate(candidate, args.original_name);
    printValidation(result);
    return result.valid ? EXIT_OK : EXIT_CONFLICT;
  }

  if (cmd == "create") {
    printNode(orchestrator.create(NodeConfig::fromJson(readJsonFile(pos[0]))),
              args);
    return EXIT_OK;
  }

  if (cmd == "update") {
    printNode(orchestrator.update(pos[0], readJsonFile(pos[1])), args);
    return EXIT_OK;
  }

  if (cmd == "set-cluster") {
    printNode(orchestrator.setCluster(pos[0], pos[1]), args);
    return EXIT_OK;
  }

  if (cmd == "move") {
    printNode(orchestrator.move(pos[0], pos[1], !args.discard_data), args);
    return EXIT_OK;
  }

  if (cmd == "copy") {
    const std::string base = pos.size() > 2 ? pos[2] : std::string();
    printNode(orchestrator.copy(pos[0], pos[1], base, args.copy_data), args);
    return EXIT_OK;
  }

  if (cmd == "delete") {
    orchestrator.remove(pos[0], args.preserve_data);
    std::cout << "Node \"" << pos[0] << "\" deleted\n";
    return EXIT_OK;
  }

  if (cmd == "start") {
    return awaitTicket(orchestrator.start(pos[0], session_.newToken()), args);
  }

  if (cmd == "stop") {
    return awaitTicket(orchestrator.stop(pos[0], session_.newToken()), args);
  }

  if (cmd == "verify") {
    const auto report = orchestrator.verify();
    std::cout << nlohmann::json{{"valid", report.valid},
                                {"issues", report.issues}}
                     .dump(2)
              << '\n';
    return report.valid ? EXIT_OK : EXIT_FAILED;
  }

  throw InvalidRequestError("ServiceController: Unknown command: " + cmd);
}

void ServiceController::printHelp() const {
  std::cout << "NodeSteward: search engine node orchestrator\n\n"
            << "Usage:\n"
            << " nodesteward [options] <command> [args]\n\n"
            << "Commands:\n"
            << " list                          List nodes with observed state\n"
            << " clusters                      List clusters with node counts\n"
            << " show NAME                     Show one node\n"
            << " validate FILE [--original N]  Validate a node configuration\n"
            << " create FILE                   Create a node\n"
            << " update NAME FILE              Apply a partial update\n"
            << " set-cluster NAME CLUSTER      Move a node to another cluster\n"
            << " move NAME DIR [--discard-data]\n"
            << "                               Relocate node files to DIR\n"
            << " copy NAME NEW [DIR] [--copy-data]\n"
            << "                               Duplicate a node\n"
            << " delete NAME [--preserve-data] Delete a node\n"
            << " start NAME [--wait]           Start a node\n"
            << " stop NAME [--wait]            Stop a node\n"
            << " verify                        Check registry against disk\n\n"
            << "Options:\n"
            << " --help, -h          Show this help message\n"
            << " --version, -v       Show version info\n"
            << " --config-file=FILE  Configuration file path\n"
            << " --environment=NAME  Configuration environment\n"
            << " --override=KEY:VAL  Override config parameter (dotted KEY)\n"
            << " --log-type=TYPES    Logger types (console,sync_file)\n"
            << " --log-level=LEVEL   Logging level "
               "[debug|info|warning|error|critical]\n"
            << " --json              JSON output\n";
}

void ServiceController::printVersion() const {
  std::cout << "NodeSteward v1.0.0\n";
}
