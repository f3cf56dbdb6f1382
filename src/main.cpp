#include "core/Config.h"
#include "core/logger.h"
#include "engines/elasticsearch_client.h"
#include "sync/SyncEngine.h"
#include "utils/engine_factory.h"
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_EXECUTION_ERROR = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_UNKNOWN_ERROR = 5;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_SIGNAL_ERROR = 7;

constexpr std::chrono::milliseconds POLL_INTERVAL{500};

std::atomic<bool> g_shutdownRequested{false};
std::atomic<bool> g_pauseRequested{false};
std::atomic<bool> g_resumeRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  } else if (signal == SIGUSR1) {
    g_pauseRequested.store(true);
  } else if (signal == SIGUSR2) {
    g_resumeRequested.store(true);
  }
}

bool installSignalHandlers() {
  for (int signal : {SIGINT, SIGTERM, SIGUSR1, SIGUSR2}) {
    if (std::signal(signal, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register handler for signal " << signal
                << std::endl;
      return false;
    }
  }
  return true;
}

void logEvents(std::vector<SyncEvent> events) {
  for (const auto &event : events) {
    std::string text = event.payload.dump();
    switch (event.kind) {
    case SyncEventKind::Progress:
      Logger::info(LogCategory::PROGRESS, "main", text);
      break;
    case SyncEventKind::ErrorLog:
      Logger::warning(LogCategory::TRANSFER, "main", text);
      break;
    case SyncEventKind::StatusChange:
      Logger::info(LogCategory::SYSTEM, "main", text);
      break;
    }
  }
}

// Drives one task until it completes, fails or the process is interrupted.
// SIGUSR1 pauses at the next batch boundary and SIGUSR2 resumes; a task
// paused by an error policy also waits here for SIGUSR2.
TaskStatus superviseTask(SyncEngine &engine, EventChannel &events,
                         const std::string &taskId) {
  while (true) {
    logEvents(events.drain());

    if (g_shutdownRequested.load()) {
      Logger::warning(LogCategory::SYSTEM, "main",
                      "Shutdown requested, stopping task '" + taskId + "'");
      engine.stop(taskId);
      logEvents(events.drain());
      return TaskStatus::Idle;
    }
    if (g_pauseRequested.exchange(false) && !engine.pause(taskId)) {
      Logger::warning(LogCategory::SYSTEM, "main",
                      "Pause ignored: task is not running");
    }
    if (g_resumeRequested.exchange(false) && !engine.resume(taskId)) {
      Logger::warning(LogCategory::SYSTEM, "main",
                      "Resume ignored: task is not paused");
    }

    if (engine.waitFor(taskId, POLL_INTERVAL)) {
      TaskStatus status = engine.status(taskId);
      if (status != TaskStatus::Paused)
        return status;
      std::this_thread::sleep_for(POLL_INTERVAL);
    }
  }
}
} // namespace

int main(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <task.json>" << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  try {
    TaskDefinition task;
    try {
      task = TaskConfigLoader::loadFromFile(argv[1]);
    } catch (const std::exception &e) {
      std::cerr << "Configuration error: " << e.what() << std::endl;
      return EXIT_CONFIG_ERROR;
    }

    Logger::initialize(task.logFile);
    ElasticsearchClient::globalInit();

    if (!installSignalHandlers()) {
      Logger::shutdown();
      return EXIT_SIGNAL_ERROR;
    }

    Logger::info(LogCategory::SYSTEM, "main",
                 "DocBridge started for task '" + task.taskId + "': " +
                     task.source.toSafeString() + " -> " +
                     task.target.toSafeString());

    EventChannel events;
    SyncEngine engine(events);
    const std::string taskId = task.taskId;

    try {
      auto source = EngineFactory::createSource(task.source);
      auto destination = EngineFactory::createDestination(task.target);
      engine.registerTask(std::move(task), source, destination);
      engine.start(taskId);
    } catch (const SyncError &e) {
      Logger::error(LogCategory::SYSTEM, "main", e.describe());
      std::cerr << "Initialization error: " << e.what() << std::endl;
      Logger::shutdown();
      return EXIT_INIT_ERROR;
    } catch (const std::invalid_argument &e) {
      Logger::error(LogCategory::CONFIG, "main", e.what());
      std::cerr << "Configuration error: " << e.what() << std::endl;
      Logger::shutdown();
      return EXIT_CONFIG_ERROR;
    }

    TaskStatus status = superviseTask(engine, events, taskId);

    TaskProgress progress = engine.progress(taskId);
    auto errors = engine.errors(taskId);
    Logger::info(LogCategory::SYSTEM, "main",
                 "Task '" + taskId + "' finished as " +
                     taskStatusToString(status) + ": " +
                     progress.toJson().dump());
    for (const auto &entry : errors)
      Logger::error(LogCategory::TRANSFER, "main", entry.toJson().dump());

    engine.shutdown();
    Logger::shutdown();

    switch (status) {
    case TaskStatus::Completed:
      return EXIT_SUCCESS_CODE;
    case TaskStatus::Idle:
      return EXIT_SIGNAL_ERROR;
    default:
      return EXIT_EXECUTION_ERROR;
    }
  } catch (const std::exception &e) {
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    Logger::shutdown();
    return EXIT_CRITICAL_ERROR;
  } catch (...) {
    std::cerr << "Unknown critical error in main" << std::endl;
    Logger::shutdown();
    return EXIT_UNKNOWN_ERROR;
  }
}
