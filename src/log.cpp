#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLogger = "hostlogin";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::once_flag g_thread_pool_once;

void ensure_thread_pool() {
  std::call_once(g_thread_pool_once, [] {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  });
}

std::shared_ptr<spdlog::details::thread_pool> logging_pool() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    ensure_thread_pool();
    pool = spdlog::thread_pool();
  }
  return pool;
}

/**
 * Sink shared by the root logger and every category logger.
 *
 * Re-initialising the logger replaces the children of this sink, so loggers
 * cached by other translation units pick up new destinations.
 */
std::shared_ptr<spdlog::sinks::dist_sink_mt> shared_sink() {
  static auto sink = [] {
    auto dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
    dist->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    return dist;
  }();
  return sink;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string &name) {
  return std::make_shared<spdlog::async_logger>(
      name, shared_sink(), logging_pool(),
      spdlog::async_overflow_policy::block);
}
} // namespace

namespace hostlogin {

/**
 * Initialize (or re-initialize) the hostlogin root logger.
 *
 * @param level Logging verbosity level for the default logger.
 * @param pattern Log message pattern; empty string retains the default.
 * @param file Optional log file path.
 * @param rotate_files Maximum number of rotated files to keep.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  ensure_thread_pool();
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!file.empty()) {
    if (rotate_files > 0) {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          file, kMaxLogFileSize, rotate_files));
    } else {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
    }
  }
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLogger);
  if (logger) {
    logger->flush();
  }
  shared_sink()->set_sinks(std::move(sinks));
  if (!logger) {
    logger = make_logger(kRootLogger);
    spdlog::register_logger(logger);
  }
  spdlog::set_default_logger(logger);
  g_logger = logger;
  lock.unlock();
  const std::string prefix = kRootLogger;
  spdlog::apply_all([&](std::shared_ptr<spdlog::logger> l) {
    if (l->name().rfind(prefix, 0) == 0) {
      l->set_level(level);
    }
  });
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

/**
 * Ensure that the default logger exists before logging.
 *
 * Creates the root logger at warning level when initialization was skipped.
 */
void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::warn);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  const std::string name = std::string(kRootLogger) + "." + category;
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto root = spdlog::get(kRootLogger);
  auto new_logger = make_logger(name);
  new_logger->set_level(root ? root->level() : spdlog::level::warn);
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")->debug("Applied {} log category override(s)",
                                    overrides.size());
}

} // namespace hostlogin
