#include "logger.hpp"
#include <cstdlib>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include "config.hpp"

bool init_logging(const std::string& path, const std::string& level, std::string& msg) {
  std::shared_ptr<spdlog::logger> logger;
  if (path.empty()) {
    logger = std::make_shared<spdlog::logger>(MPAGE_LOGGER_NAME, std::make_shared<spdlog::sinks::null_sink_mt>());
  } else {
    try {
      auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
      logger = std::make_shared<spdlog::logger>(MPAGE_LOGGER_NAME, std::move(sink));
    } catch (const spdlog::spdlog_ex& e) {
      msg = std::string("can not open log file: ") + e.what();
      return false;
    }
  }
  std::string lv = level;
  if (lv.empty()) {
    const char* env = std::getenv("MPAGE_LOG_LEVEL");
    lv = env ? env : "info";
  }
  logger->set_level(spdlog::level::from_str(lv));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  return true;
}

// Flush only; detached producer threads may still log during exit.
void shutdown_logging() {
  spdlog::default_logger()->flush();
}
