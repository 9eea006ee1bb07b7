#pragma once

#include <chrono>
#include <fmt/chrono.h> // IWYU pragma: keep
#include <fmt/format.h>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace crackbank {

// simple logging

extern std::mutex cerr_mutex; // threaded server needs mutex for stdio

struct thread_logger {
  // only with --debug
  void log(const std::string& msg) const {
    if (debug) write("debug", msg);
  }

  void warn(const std::string& msg) const { write("warning", msg); }

  void error(const std::string& msg) const { write("error", msg); }

  bool debug = false;

private:
  static void write(std::string_view level, const std::string& msg) {
    const std::lock_guard lk(cerr_mutex);
    // can't portably use high resolution clock here
    auto timestamp = std::chrono::system_clock::now();
    std::cerr << fmt::format("{:%Y-%m-%d %H:%M:%S} {:>7}: {}\n", timestamp, level, msg);
  }
};

extern thread_logger logger;

} // namespace crackbank
