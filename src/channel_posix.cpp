#ifndef _WIN32

#include "hostcall/channel.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace hostcall {

FdChannel::FdChannel(int read_fd, int write_fd, bool owns_fds)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds) {}

FdChannel::~FdChannel() {
  if (!owns_fds_) return;
  if (read_fd_ >= 0) ::close(read_fd_);
  if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
}

std::optional<std::string> FdChannel::receive() {
  char buf[65536];
  while (true) {
    const auto nl = buffer_.find('\n');
    if (nl != std::string::npos) {
      std::string line = buffer_.substr(0, nl);
      buffer_.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      return line;
    }
    if (eof_) {
      // A final frame without terminator still counts.
      if (buffer_.empty()) return std::nullopt;
      std::string line;
      line.swap(buffer_);
      return line;
    }
    if (buffer_.size() > kMaxFrameBytes) {
      last_error_ = "frame exceeds " + std::to_string(kMaxFrameBytes) + " bytes";
      return std::nullopt;
    }
    const ssize_t n = ::read(read_fd_, buf, sizeof(buf));
    if (n > 0) {
      buffer_.append(buf, static_cast<std::size_t>(n));
    } else if (n == 0) {
      eof_ = true;
    } else if (errno != EINTR) {
      last_error_ = std::string("read failed: ") + std::strerror(errno);
      return std::nullopt;
    }
  }
}

bool FdChannel::send(const std::string& line) {
  if (write_fd_ < 0) {
    last_error_ = "channel closed for writing";
    return false;
  }
  std::string frame = line;
  frame += '\n';
  std::size_t off = 0;
  while (off < frame.size()) {
    const ssize_t n = ::write(write_fd_, frame.data() + off, frame.size() - off);
    if (n > 0) {
      off += static_cast<std::size_t>(n);
    } else if (n < 0 && errno == EINTR) {
      continue;
    } else {
      last_error_ = std::string("write failed: ") + std::strerror(errno);
      return false;
    }
  }
  return true;
}

void FdChannel::close_write() {
  if (write_fd_ >= 0) {
    if (owns_fds_ && write_fd_ != read_fd_) ::close(write_fd_);
    write_fd_ = -1;
  }
}

}  // namespace hostcall

#endif
