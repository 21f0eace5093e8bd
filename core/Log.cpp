#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;

void Init(spdlog::level::level_enum level) {
  if (s_Logger) {
    spdlog::drop(s_Logger->name());
    s_Logger.reset();
  }

  std::vector<spdlog::sink_ptr> sinks;

  // Console sink with color
  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  sinks.push_back(consoleSink);

  // File sink
  auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "streetdash.log", true);
  fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
  sinks.push_back(fileSink);

  s_Logger = std::make_shared<spdlog::logger>("STREETDASH", sinks.begin(),
                                              sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(level);
  s_Logger->flush_on(spdlog::level::trace);

  LOG_INFO("Logging initialized");
}

void Shutdown() {
  s_Logger.reset();
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  if (!s_Logger) {
    s_Logger = spdlog::get("STREETDASH_FALLBACK");
    if (!s_Logger) {
      s_Logger = spdlog::stdout_color_mt("STREETDASH_FALLBACK");
    }
  }
  return s_Logger;
}

} // namespace Log
