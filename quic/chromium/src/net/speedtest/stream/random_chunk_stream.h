#ifndef SPEEDTEST_STREAM_RANDOM_CHUNK_STREAM_H_
#define SPEEDTEST_STREAM_RANDOM_CHUNK_STREAM_H_

#include <stddef.h>
#include <stdint.h>

#include "net/speedtest/stream/chunk_stream.h"

namespace speedtest {

// RandomChunkStream turns a generator into exactly `length` bytes of data,
// delivered in blocks of at most `kBufferSize` bytes. The last block is
// truncated so that the total matches `length`.
//
// The buffer is regenerated in full on every step, also when only a part of
// it is emitted, so the byte at offset `i` only depends on the seed.
template <typename Generator>
class RandomChunkStream : public ChunkStream {
 public:
  static const size_t kSubChunkSize = 4096;
  static const size_t kNumSubChunks = 4;
  static const size_t kBufferSize = kSubChunkSize * kNumSubChunks;

  RandomChunkStream(const Generator& generator, uint64_t length);
  RandomChunkStream(const RandomChunkStream&) = delete;
  RandomChunkStream& operator=(const RandomChunkStream&) = delete;
  ~RandomChunkStream() override;

  bool Next(std::string* chunk) override;

  uint64_t length() const { return length_; }
  uint64_t done() const { return done_; }

 private:
  Generator generator_;
  uint64_t length_;
  uint64_t done_;
  char buffer_[kBufferSize];
};

}

#endif
