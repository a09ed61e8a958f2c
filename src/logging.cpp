#include "libmarc/logging.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace libmarc {

namespace {

constexpr const char* FILE_LOGGER_NAME = "libmarc_file";
constexpr const char* CONSOLE_LOGGER_NAME = "libmarc";

} // namespace

void init_logging() {
  spdlog::cfg::load_env_levels();
}

Result<void> log_to_file(const std::string& path, bool debug) {
  try {
    spdlog::drop(FILE_LOGGER_NAME);
    auto log = spdlog::basic_logger_mt(FILE_LOGGER_NAME, path, true);
    log->set_level(debug ? spdlog::level::debug : spdlog::level::info);
    log->flush_on(spdlog::level::debug);
    spdlog::set_default_logger(log);
  } catch (const spdlog::spdlog_ex& e) {
    return Result<void>::failure(std::string("Failed to open log file ") + path + ": " + e.what());
  }
  return Result<void>::success();
}

void reset_logging() {
  spdlog::drop(FILE_LOGGER_NAME);
  spdlog::drop(CONSOLE_LOGGER_NAME);
  spdlog::set_default_logger(spdlog::stderr_color_mt(CONSOLE_LOGGER_NAME));
}

} // namespace libmarc
