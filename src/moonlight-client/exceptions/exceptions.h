/**
 * Crash reporting for the lynx executable.
 *
 * A fatal signal writes the raw stack frames to `$LYNX_CFG_FOLDER/backtrace.dump`,
 * the next run resolves and prints them.
 * Only async-signal-safe functions are used while dumping, see:
 * https://man7.org/linux/man-pages/man7/signal-safety.7.html
 */
#pragma once

#include <array>
#include <chrono>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <filesystem>
#include <fmt/chrono.h>
#include <helpers/logger.hpp>
#include <helpers/utils.hpp>
#include <memory>
#include <string>
#include <unistd.h>

namespace lynx::crash {

constexpr std::size_t MAX_FRAMES = 100;

/* Filled by install_handlers(), the signal handler can't build strings */
inline std::array<char, 4096> dump_path{};

inline std::string cfg_folder() {
  return utils::get_env("LYNX_CFG_FOLDER", ".");
}

inline std::string dump_file() {
  return cfg_folder() + "/backtrace.dump";
}

inline void write_raw_trace(const char *file_name) {
  cpptrace::frame_ptr buffer[MAX_FRAMES];
  std::size_t count = cpptrace::safe_generate_raw_trace(buffer, MAX_FRAMES);
  if (count == 0) {
    return;
  }

  int fd = open(file_name, O_WRONLY | O_CREAT | O_TRUNC | O_DSYNC, 0600);
  if (fd < 0) {
    return;
  }
  bool ok = write(fd, &count, sizeof(count)) == sizeof(count);
  for (std::size_t i = 0; ok && i < count; i++) {
    cpptrace::safe_object_frame frame{};
    cpptrace::get_safe_object_frame(buffer[i], &frame);
    ok = write(fd, &frame, sizeof(frame)) == sizeof(frame);
  }
  close(fd);
}

inline std::unique_ptr<cpptrace::object_trace> read_raw_trace(const std::string &file_name) {
  int fd = open(file_name.c_str(), O_RDONLY);
  if (fd < 0) {
    logs::log(logs::warning, "Unable to open stacktrace file {}", file_name);
    return {};
  }

  std::size_t count = 0;
  if (read(fd, &count, sizeof(count)) != sizeof(count)) {
    logs::log(logs::warning, "Truncated stacktrace file {}", file_name);
    close(fd);
    return {};
  }

  auto trace = std::make_unique<cpptrace::object_trace>();
  for (std::size_t i = 0; i < count && i < MAX_FRAMES; i++) {
    cpptrace::safe_object_frame frame{};
    if (read(fd, &frame, sizeof(frame)) != sizeof(frame)) {
      logs::log(logs::debug, "Stacktrace file ended after {} frames", i);
      break;
    }
    try {
      trace->frames.push_back(frame.resolve());
    } catch (const std::exception &ex) {
      logs::log(logs::debug, "Unable to resolve stacktrace frame {}: {}", i, ex.what());
    }
  }
  close(fd);
  return trace;
}

inline void on_signal(int signum) {
  if ((signum == SIGABRT || signum == SIGSEGV) && dump_path[0] != '\0') {
    write_raw_trace(dump_path.data());
  }
  _exit(128 + signum);
}

inline void on_terminate() {
  if (auto eptr = std::current_exception()) {
    try {
      std::rethrow_exception(eptr);
    } catch (const std::exception &e) {
      logs::log(logs::error, "Unhandled exception: {}", e.what());
    } catch (...) {
      logs::log(logs::error, "Unhandled exception of unknown type");
    }
  }

  on_signal(SIGABRT);
}

/**
 * @brief logs an error that reached main() and returns the process exit code
 *
 * Only exceptions that don't derive from std::exception are treated as a crash.
 */
inline int exit_code(const std::exception_ptr &eptr) {
  try {
    std::rethrow_exception(eptr);
  } catch (const std::exception &e) {
    logs::log(logs::error, "{}", e.what());
    return EXIT_FAILURE;
  } catch (...) {
    on_terminate();
  }
  return EXIT_FAILURE;
}

/**
 * @brief if the previous run crashed it left a dump behind: print it and move it out of the way
 */
inline void report_previous_crash() {
  auto stack_file = dump_file();
  if (!std::filesystem::exists(stack_file)) {
    return;
  }

  logs::log(logs::warning, "Found a stacktrace from a previous crash:");
  if (auto trace = read_raw_trace(stack_file)) {
    trace->resolve().print();
  }

  auto archived = fmt::format("{}/backtrace.{:%Y-%m-%d-%H-%M-%S}.dump", cfg_folder(), std::chrono::system_clock::now());
  std::error_code ec;
  std::filesystem::rename(stack_file, archived, ec);
  if (ec) {
    logs::log(logs::warning, "Unable to rename {}: {}", stack_file, ec.message());
  }
}

inline void install_handlers() {
  auto path = dump_file();
  std::strncpy(dump_path.data(), path.c_str(), dump_path.size() - 1);

  for (auto signum : {SIGINT, SIGTERM, SIGQUIT, SIGSEGV, SIGABRT}) {
    std::signal(signum, on_signal);
  }
  std::set_terminate(on_terminate);
}

} // namespace lynx::crash
