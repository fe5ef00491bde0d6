#pragma once

// hostcall/hash.hpp — BLAKE3 digests for the event log.
//
// Every request and response frame exchanged during a session is fed into a
// TranscriptHasher with domain separation ("req:" / "res:"), and the final
// transcript digest is written to the session_end event. Two runs of the same
// guest against the same filesystem state produce the same digest, which makes
// divergent runs easy to spot in the event log.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace hostcall {

// 64-char lowercase hex BLAKE3-256 digest.
std::string blake3_hex(std::string_view payload);

// blake3_hex(domain || payload). Domains in use: "req:", "res:".
std::string hash_domain(std::string_view domain, std::string_view payload);

// Incremental digest over a sequence of domain-tagged frames. Each frame is
// length-prefixed so frame boundaries are part of the digest.
class TranscriptHasher {
 public:
  TranscriptHasher();
  ~TranscriptHasher();
  TranscriptHasher(const TranscriptHasher&) = delete;
  TranscriptHasher& operator=(const TranscriptHasher&) = delete;

  void update(std::string_view domain, std::string_view frame);

  // Digest of everything fed so far. Does not reset the hasher.
  std::string hex_digest() const;

  std::size_t frames() const { return frames_; }

 private:
  struct State;
  std::unique_ptr<State> state_;
  std::size_t frames_{0};
};

}  // namespace hostcall
