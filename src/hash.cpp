#include "hostcall/hash.hpp"

// BLAKE3 is the only hash primitive. The transcript hasher keeps one
// blake3_hasher for the whole session; hex_digest() finalizes a copy, which
// BLAKE3 permits without disturbing the running state.

#include <array>
#include <cstdint>
#include <string>

extern "C" {
#include <blake3.h>
}

namespace hostcall {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

struct TranscriptHasher::State {
  blake3_hasher hasher;
};

TranscriptHasher::TranscriptHasher() : state_(std::make_unique<State>()) {
  blake3_hasher_init(&state_->hasher);
}

TranscriptHasher::~TranscriptHasher() = default;

void TranscriptHasher::update(std::string_view domain, std::string_view frame) {
  // 8-byte little-endian length prefix.
  std::array<unsigned char, 8> len{};
  std::uint64_t n = frame.size();
  for (auto& b : len) {
    b = static_cast<unsigned char>(n & 0xff);
    n >>= 8;
  }
  blake3_hasher_update(&state_->hasher, domain.data(), domain.size());
  blake3_hasher_update(&state_->hasher, len.data(), len.size());
  blake3_hasher_update(&state_->hasher, frame.data(), frame.size());
  ++frames_;
}

std::string TranscriptHasher::hex_digest() const {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&state_->hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace hostcall
