#include "net/speedtest/generator/lehmer64.h"

#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"

namespace {

const uint64_t kMultiplier = 0xda942042e4dd58b5ULL;

// PCG32 constants used to expand a single 64-bit value into a seed.
const uint64_t kPcgMultiplier = 6364136223846793005ULL;
const uint64_t kPcgIncrement = 11634580027462260723ULL;

uint64_t ReadBigEndian64(const char* data) {
  uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value = (value << 8) | static_cast<uint8_t>(data[i]);
  }
  return value;
}

// Fills `seed` with successive PCG32 outputs, each stored little-endian.
void ExpandSeed(uint64_t state, char* seed, size_t length) {
  for (size_t offset = 0; offset < length; offset += 4) {
    state = state * kPcgMultiplier + kPcgIncrement;
    uint32_t xorshifted = static_cast<uint32_t>(((state >> 18) ^ state) >> 27);
    uint32_t rot = static_cast<uint32_t>(state >> 59);
    uint32_t x = (xorshifted >> rot) | (xorshifted << ((32 - rot) & 31));
    for (size_t i = 0; i < 4 && offset + i < length; ++i) {
      seed[offset + i] = static_cast<char>(x >> (8 * i));
    }
  }
}

inline void WriteLittleEndian(uint64_t word, char* dest, size_t length) {
  for (size_t i = 0; i < length; ++i) {
    dest[i] = static_cast<char>(word >> (8 * i));
  }
}

// Shared byte filler: full words first, then the low bytes of one more word.
template <typename Generator>
void FillFromWords(Generator* generator, char* dest, size_t length) {
  size_t offset = 0;
  for (; offset + 8 <= length; offset += 8) {
    WriteLittleEndian(generator->Next(), dest + offset, 8);
  }
  if (offset < length) {
    WriteLittleEndian(generator->Next(), dest + offset, length - offset);
  }
}

}

namespace speedtest {

const size_t Lehmer64::kSeedSize;
const size_t Lehmer64x3::kSeedSize;

Lehmer64::Lehmer64(uint64_t seed) : state_(quic::MakeQuicUint128(0, seed)) {}

// static
base::Optional<Lehmer64> Lehmer64::FromSeed(quic::QuicStringPiece seed) {
  if (seed.size() != kSeedSize) {
    QUIC_LOG(ERROR) << "Invalid seed length for Lehmer64: " << seed.size()
                    << ", expected " << kSeedSize;
    return base::nullopt;
  }
  return Lehmer64(ReadBigEndian64(seed.data()));
}

// static
Lehmer64 Lehmer64::FromUint64(uint64_t value) {
  char seed[kSeedSize];
  ExpandSeed(value, seed, kSeedSize);
  return Lehmer64(ReadBigEndian64(seed));
}

uint64_t Lehmer64::Next() {
  state_ *= quic::MakeQuicUint128(0, kMultiplier);
  return quic::QuicUint128High64(state_);
}

void Lehmer64::Fill(char* dest, size_t length) {
  FillFromWords(this, dest, length);
}

Lehmer64x3::Lehmer64x3(uint64_t seed0, uint64_t seed1, uint64_t seed2)
  : pos_(2) {
  state_[0] = quic::MakeQuicUint128(0, seed0);
  state_[1] = quic::MakeQuicUint128(0, seed1);
  state_[2] = quic::MakeQuicUint128(0, seed2);
}

// static
base::Optional<Lehmer64x3> Lehmer64x3::FromSeed(quic::QuicStringPiece seed) {
  if (seed.size() != kSeedSize) {
    QUIC_LOG(ERROR) << "Invalid seed length for Lehmer64x3: " << seed.size()
                    << ", expected " << kSeedSize;
    return base::nullopt;
  }
  return Lehmer64x3(ReadBigEndian64(seed.data()),
                    ReadBigEndian64(seed.data() + 8),
                    ReadBigEndian64(seed.data() + 16));
}

// static
Lehmer64x3 Lehmer64x3::FromUint64(uint64_t value) {
  char seed[kSeedSize];
  ExpandSeed(value, seed, kSeedSize);
  return Lehmer64x3(ReadBigEndian64(seed),
                    ReadBigEndian64(seed + 8),
                    ReadBigEndian64(seed + 16));
}

uint64_t Lehmer64x3::Next() {
  if (++pos_ == 3) {
    const quic::QuicUint128 multiplier = quic::MakeQuicUint128(0, kMultiplier);
    state_[0] *= multiplier;
    state_[1] *= multiplier;
    state_[2] *= multiplier;
    pos_ = 0;
  }
  return quic::QuicUint128High64(state_[pos_]);
}

void Lehmer64x3::Fill(char* dest, size_t length) {
  FillFromWords(this, dest, length);
}

}
