#include <pitwall/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pitwall {

static std::shared_ptr<spdlog::logger> make_logger_() {
  if (auto existing = spdlog::get("pitwall")) return existing;
  try {
    auto lg = spdlog::stdout_color_mt("pitwall");
    lg->set_level(spdlog::level::info);
    return lg;
  } catch (const spdlog::spdlog_ex&) {
    // Registered concurrently by someone else between get() and creation.
    return spdlog::get("pitwall");
  }
}

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> lg = make_logger_();
  return lg;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

bool set_log_level(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept that when asked for.
  if (level == spdlog::level::off && name != "off") return false;
  set_log_level(level);
  return true;
}

} // namespace pitwall
