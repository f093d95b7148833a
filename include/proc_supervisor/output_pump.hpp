/**
 * @file output_pump.hpp
 * @brief Line-oriented readers for a child's stdout/stderr pipes.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "proc_supervisor/process_handle.hpp"

/**
 * @brief Replaces every invalid UTF-8 sequence in @p bytes with U+FFFD.
 */
[[nodiscard]] std::string sanitizeUtf8(const std::string &bytes);

/**
 * @class LineSplitter
 * @brief Accumulates raw pipe bytes and cuts them into complete lines.
 *
 * Lines are returned without the trailing "\n" or "\r\n" and decoded
 * leniently. A final line without a terminator is returned by finish().
 */
class LineSplitter {
 public:
  std::vector<std::string> feed(const char *data, std::size_t size);
  std::optional<std::string> finish();

 private:
  std::string pending_;
};

/**
 * @brief Reads @p fd until end of stream and calls @p on_line for every line.
 *
 * The read end is polled with @p poll_timeout so that @p should_stop is
 * re-checked even when the child stays silent; once it returns true the loop
 * ends without flushing the partial line. Read errors end the loop and are
 * logged, never thrown.
 */
void pumpLines(UniqueFd fd, const std::function<void(std::string)> &on_line,
               const std::function<bool()> &should_stop,
               std::chrono::milliseconds poll_timeout);
