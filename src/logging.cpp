#include "olr/logging.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <array>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <map>

#include "olr/error.hpp"

namespace olr {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

using FileSink =
    logging::sinks::synchronous_sink<logging::sinks::text_file_backend>;

static boost::shared_ptr<FileSink> g_log_sink;

auto parse_severity(const std::string &name)
    -> logging::trivial::severity_level {
  static const auto levels =
      std::map<std::string, logging::trivial::severity_level>{
          {"trace", logging::trivial::trace},
          {"debug", logging::trivial::debug},
          {"info", logging::trivial::info},
          {"warning", logging::trivial::warning},
          {"error", logging::trivial::error},
          {"fatal", logging::trivial::fatal}};
  auto it = levels.find(name);
  if (it == levels.end()) {
    throw ConfigurationError("unknown log level '" + name + "'");
  }
  return it->second;
}

auto set_logging_level(logging::trivial::severity_level level) -> void {
  logging::core::get()->set_filter(logging::trivial::severity >= level);
}

auto init_logging(logging::trivial::severity_level level,
                  const std::string &directory) -> std::string {
  logging::add_console_log(
      std::clog, keywords::format = (expr::stream
                                     << "[" << logging::trivial::severity
                                     << "] " << expr::smessage));

  auto path = std::string();
  if (!directory.empty()) {
    std::filesystem::create_directories(directory);

    auto now = std::time(nullptr);
    std::tm tms = {};
    localtime_r(&now, &tms);
    std::array<char, 32> stamp{};
    std::strftime(stamp.data(), stamp.size(), "%Y%m%d_%H%M%S", &tms);
    path = (std::filesystem::path(directory) /
            ("olr_" + std::string(stamp.data()) + ".log"))
               .string();

    g_log_sink = logging::add_file_log(
        keywords::file_name = path, keywords::auto_flush = true,
        keywords::format =
            (expr::stream << expr::format_date_time<boost::posix_time::ptime>(
                                 "TimeStamp", "%Y-%m-%d %H:%M:%S")
                          << " - " << logging::trivial::severity << " - "
                          << expr::smessage));
  }

  logging::add_common_attributes();
  set_logging_level(level);
  return path;
}

auto flush_logs() -> void {
  if (g_log_sink) {
    g_log_sink->flush();
  }
}

}  // namespace olr
