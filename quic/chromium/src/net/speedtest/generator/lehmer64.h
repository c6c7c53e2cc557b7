#ifndef SPEEDTEST_GENERATOR_LEHMER64_H_
#define SPEEDTEST_GENERATOR_LEHMER64_H_

#include <stddef.h>
#include <stdint.h>

#include "base/optional.h"

#include "net/third_party/quiche/src/quic/platform/api/quic_string_piece.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_uint128.h"

namespace speedtest {

// Lehmer64 is a multiplicative congruential generator over a 128-bit state:
// each step multiplies the state by a fixed odd constant (mod 2^128) and
// returns the upper 64 bits of the product.
//
// Words are written to byte buffers little-endian. The output is only meant
// to look like noise to a byte counting client; it is not a secure source.
class Lehmer64 {
 public:
  static const size_t kSeedSize = 8;

  // Seeds from exactly `kSeedSize` bytes, big-endian. Returns an empty
  // Optional if the seed has the wrong length.
  static base::Optional<Lehmer64> FromSeed(quic::QuicStringPiece seed);
  // Expands `value` into a full seed with a PCG32 sequence.
  static Lehmer64 FromUint64(uint64_t value);

  uint64_t Next();
  void Fill(char* dest, size_t length);

 private:
  explicit Lehmer64(uint64_t seed);

  quic::QuicUint128 state_;
};

// Lehmer64x3 runs three independent Lehmer64 states. Every third call to
// Next() multiplies all three states at once, and the three fresh outputs
// are handed out one per call. The three multiplies do not depend on each
// other, so they pipeline on the CPU.
class Lehmer64x3 {
 public:
  static const size_t kSeedSize = 24;

  // Seeds from exactly `kSeedSize` bytes: three big-endian words, one per
  // state. Returns an empty Optional if the seed has the wrong length.
  static base::Optional<Lehmer64x3> FromSeed(quic::QuicStringPiece seed);
  static Lehmer64x3 FromUint64(uint64_t value);

  uint64_t Next();
  void Fill(char* dest, size_t length);

 private:
  Lehmer64x3(uint64_t seed0, uint64_t seed1, uint64_t seed2);

  quic::QuicUint128 state_[3];
  int pos_;
};

}

#endif
