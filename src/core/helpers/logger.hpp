#pragma once

#include "fmt/chrono.h"
#include "fmt/core.h"
#include "fmt/format.h"
#include "fmt/ranges.h"
#include <algorithm>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/exception_handler_feature.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/exception_handler.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <string>

namespace logs {

using namespace boost::log::trivial;
namespace src = boost::log::sources;

struct level_style {
  const char *name;
  const char *color;
};

inline level_style get_style(severity_level level) {
  switch (level) {
  case trace:
    return {"TRACE", "\033[37m"};
  case debug:
    return {"DEBUG", "\033[37m"};
  case info:
    return {"INFO", "\033[37;1m"};
  case warning:
    return {"WARN", "\033[33;1m"};
  case error:
    return {"ERROR", "\033[31;1m"};
  case fatal:
    return {"FATAL", "\033[31;1m"};
  default:
    return {"", "\033[0m"};
  }
}

/**
 * @brief first time Boost log system initialization, call it once at the very start of main()
 *
 * @param min_log_level: anything below this level will not be printed
 */
inline void init(severity_level min_log_level) {
  boost::log::add_common_attributes();
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_log_level);

  auto console_sink = boost::log::add_console_log(std::clog);
  console_sink->set_formatter([](boost::log::record_view const &rec, boost::log::formatting_ostream &strm) {
    auto style = get_style(rec[boost::log::trivial::severity].get());
    auto msg = rec[boost::log::expressions::smessage];
    auto now = std::chrono::system_clock::now();

    strm << style.color;
    strm << fmt::format("{:%T} {:<5} | {}", now.time_since_epoch(), style.name, msg.get());
    strm << "\033[0m";
  });
}

/**
 * A thread safe (_mt) logger that swallows exceptions raised while formatting a record,
 * see: https://www.boost.org/doc/libs/1_85_0/libs/log/doc/html/log/detailed/sources.html
 */
class lynx_logger_mt
    : public src::basic_composite_logger<char,
                                         lynx_logger_mt,
                                         src::multi_thread_model<boost::shared_mutex>,
                                         src::features<src::severity<severity_level>, src::exception_handler>> {
  BOOST_LOG_FORWARD_LOGGER_MEMBERS(lynx_logger_mt)
};

BOOST_LOG_INLINE_GLOBAL_LOGGER_INIT(lynx_logger, lynx_logger_mt) {
  lynx_logger_mt lg;
  lg.set_exception_handler(boost::log::make_exception_suppressor());
  return lg;
}

/**
 * @brief output a log message with optional format
 *
 * @param lvl: log level
 * @param format_str: a valid fmt::format string
 * @param args: optional additional args to be formatted
 */
template <typename... Args>
inline void log(severity_level lvl, fmt::format_string<Args...> format_str, Args &&...args) {
  auto msg = fmt::format(format_str, std::forward<Args>(args)...);
  BOOST_LOG_SEV(lynx_logger::get(), lvl) << msg;
}

/**
 * @brief parses a level name (case insensitive), unknown values will only report fatal errors
 */
inline severity_level parse_level(const std::string &level) {
  std::string lvl = level;
  std::transform(level.begin(), level.end(), lvl.begin(), [](unsigned char c) { return std::toupper(c); });
  if (lvl == "TRACE") {
    return trace;
  } else if (lvl == "DEBUG") {
    return debug;
  } else if (lvl == "INFO") {
    return info;
  } else if (lvl == "WARN" || lvl == "WARNING") {
    return warning;
  } else if (lvl == "ERROR") {
    return error;
  } else {
    return fatal;
  }
}
} // namespace logs
