#pragma once

// hostcall/channel.hpp — Line-framed transport between the bridge and a guest.
//
// One frame = one line of UTF-8 JSON terminated by '\n'. The bridge receives
// requests and sends responses; receive() blocks, which is what keeps exactly
// one request in flight.

#include <cstddef>
#include <optional>
#include <string>

namespace hostcall {

class Channel {
 public:
  virtual ~Channel() = default;

  // Next frame without its terminator. nullopt on end of stream or error;
  // last_error() tells the two apart (empty on clean end of stream).
  virtual std::optional<std::string> receive() = 0;

  // Writes line + '\n'. False when the peer is gone.
  virtual bool send(const std::string& line) = 0;

  virtual std::string last_error() const = 0;
};

// Frames larger than this are refused.
constexpr std::size_t kMaxFrameBytes = 256u * 1024u * 1024u;

// Channel over a pair of POSIX file descriptors (usually pipes to the guest).
class FdChannel : public Channel {
 public:
  // When owns_fds is true both descriptors are closed on destruction.
  FdChannel(int read_fd, int write_fd, bool owns_fds);
  ~FdChannel() override;
  FdChannel(const FdChannel&) = delete;
  FdChannel& operator=(const FdChannel&) = delete;

  std::optional<std::string> receive() override;
  bool send(const std::string& line) override;
  std::string last_error() const override { return last_error_; }

  // Closes the write side so the peer sees end of stream.
  void close_write();

 private:
  int read_fd_{-1};
  int write_fd_{-1};
  bool owns_fds_{false};
  std::string buffer_;
  std::string last_error_;
  bool eof_{false};
};

}  // namespace hostcall
