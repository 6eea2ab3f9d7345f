#pragma once

#include <cerrno>
#include <cstddef>
#include <string>
#include <unistd.h>
#include <sys/select.h>

// Longest accepted message line; anything longer is discarded up to its newline.
constexpr size_t kMaxLineBytes = 16u * 1024u * 1024u;

// Newline-delimited reader over a file descriptor. Polls with select() so the
// caller can check a shutdown flag between messages.
class LineReader {
public:
  enum class Status { Line, Idle, Eof, Overflow, Error };

  explicit LineReader(int fd) : fd_(fd) {}

  // Waits at most timeoutMs for data. On Line, `out` holds the message with
  // the trailing "\n" or "\r\n" removed.
  Status next(std::string& out, int timeoutMs) {
    for (;;) {
      if (takeLine(out)) return overflowed_ ? finishOverflow() : Status::Line;
      if (eof_) {
        if (buf_.empty()) return Status::Eof;
        out.swap(buf_);
        buf_.clear();
        stripCr(out);
        return Status::Line;
      }
      if (!isReady(timeoutMs)) return Status::Idle;
      char chunk[4096];
      const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return Status::Idle;
        return Status::Error;
      }
      if (n == 0) { eof_ = true; continue; }
      if (!overflowed_) buf_.append(chunk, static_cast<size_t>(n));
      else dropUntilNewline(chunk, static_cast<size_t>(n));
      if (!overflowed_ && buf_.size() > kMaxLineBytes && buf_.find('\n') == std::string::npos) {
        overflowed_ = true;
        buf_.clear();
      }
    }
  }

private:
  bool isReady(int timeoutMs) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(fd_, &readfds);
    timeval tv{timeoutMs / 1000, (timeoutMs % 1000) * 1000};
    const int rv = select(fd_ + 1, &readfds, nullptr, nullptr, &tv);
    return (rv > 0) && FD_ISSET(fd_, &readfds);
  }

  bool takeLine(std::string& out) {
    const size_t nl = buf_.find('\n');
    if (nl == std::string::npos) return false;
    out.assign(buf_, 0, nl);
    buf_.erase(0, nl + 1);
    stripCr(out);
    return true;
  }

  void dropUntilNewline(const char* data, size_t n) {
    for (size_t i = 0; i < n; ++i) {
      if (data[i] == '\n') {
        buf_.assign("\n");
        buf_.append(data + i + 1, n - i - 1);
        return;
      }
    }
  }

  // The marker newline left by dropUntilNewline ends the oversized line.
  Status finishOverflow() {
    overflowed_ = false;
    return Status::Overflow;
  }

  static void stripCr(std::string& s) {
    if (!s.empty() && s.back() == '\r') s.pop_back();
  }

  int fd_;
  std::string buf_;
  bool eof_ = false;
  bool overflowed_ = false;
};

// Writes the line plus "\n", retrying short writes. False on a write error.
inline bool writeLine(int fd, const std::string& line) {
  std::string data = line;
  data.push_back('\n');
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}
