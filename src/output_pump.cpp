#include "proc_supervisor/output_pump.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <rclcpp/rclcpp.hpp>
#include <string>
#include <utility>

namespace {

constexpr const char kReplacementChar[] = "\xEF\xBF\xBD";  // U+FFFD
constexpr std::size_t kReadChunk = 4096;

}  // namespace

std::string sanitizeUtf8(const std::string &bytes) {
  std::string out;
  out.reserve(bytes.size());
  const auto *s = reinterpret_cast<const unsigned char *>(bytes.data());
  const std::size_t n = bytes.size();

  std::size_t i = 0;
  while (i < n) {
    const unsigned char c = s[i];
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
      ++i;
      continue;
    }

    // Lead byte decides the length and the range of the first continuation
    // byte (rules out overlong forms, surrogates and code points > U+10FFFF).
    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c == 0xE0) {
      len = 3;
      lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
      len = 3;
    } else if (c == 0xED) {
      len = 3;
      hi = 0x9F;
    } else if (c == 0xF0) {
      len = 4;
      lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
      len = 4;
    } else if (c == 0xF4) {
      len = 4;
      hi = 0x8F;
    }

    if (len == 0) {
      out += kReplacementChar;
      ++i;
      continue;
    }

    std::size_t j = 1;
    for (; j < len; ++j) {
      if (i + j >= n) {
        break;
      }
      const unsigned char cc = s[i + j];
      const unsigned char min = j == 1 ? lo : 0x80;
      const unsigned char max = j == 1 ? hi : 0xBF;
      if (cc < min || cc > max) {
        break;
      }
    }

    if (j == len) {
      out.append(bytes, i, len);
    } else {
      // One replacement for the maximal valid prefix.
      out += kReplacementChar;
    }
    i += j;
  }
  return out;
}

std::vector<std::string> LineSplitter::feed(const char *data,
                                            std::size_t size) {
  std::vector<std::string> lines;
  pending_.append(data, size);

  std::size_t start = 0;
  for (;;) {
    const auto nl = pending_.find('\n', start);
    if (nl == std::string::npos) {
      break;
    }
    std::size_t end = nl;
    if (end > start && pending_[end - 1] == '\r') {
      --end;
    }
    lines.push_back(sanitizeUtf8(pending_.substr(start, end - start)));
    start = nl + 1;
  }
  pending_.erase(0, start);
  return lines;
}

std::optional<std::string> LineSplitter::finish() {
  if (pending_.empty()) {
    return std::nullopt;
  }
  std::string rest;
  rest.swap(pending_);
  if (!rest.empty() && rest.back() == '\r') {
    rest.pop_back();
  }
  return sanitizeUtf8(rest);
}

void pumpLines(UniqueFd fd, const std::function<void(std::string)> &on_line,
               const std::function<bool()> &should_stop,
               std::chrono::milliseconds poll_timeout) {
  const auto logger = rclcpp::get_logger("proc_supervisor.pump");
  if (!fd.valid()) {
    return;
  }

  LineSplitter splitter;
  char buffer[kReadChunk];
  const int timeout_ms = static_cast<int>(poll_timeout.count());

  while (!should_stop()) {
    pollfd pfd{fd.get(), POLLIN, 0};
    const int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      RCLCPP_ERROR(logger, "poll() on fd %d failed: %s", fd.get(),
                   std::strerror(errno));
      return;
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      RCLCPP_ERROR(logger, "read() on fd %d failed: %s", fd.get(),
                   std::strerror(errno));
      return;
    }
    if (n == 0) {
      if (auto rest = splitter.finish()) {
        on_line(std::move(*rest));
      }
      return;
    }
    for (auto &line : splitter.feed(buffer, static_cast<std::size_t>(n))) {
      on_line(std::move(line));
    }
  }
}
