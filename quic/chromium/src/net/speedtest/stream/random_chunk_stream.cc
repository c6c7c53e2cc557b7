#include "net/speedtest/stream/random_chunk_stream.h"

#include <algorithm>

#include "net/speedtest/generator/lehmer64.h"

namespace speedtest {

template <typename Generator>
const size_t RandomChunkStream<Generator>::kSubChunkSize;
template <typename Generator>
const size_t RandomChunkStream<Generator>::kNumSubChunks;
template <typename Generator>
const size_t RandomChunkStream<Generator>::kBufferSize;

template <typename Generator>
RandomChunkStream<Generator>::RandomChunkStream(const Generator& generator,
                                                uint64_t length)
  : generator_(generator)
  , length_(length)
  , done_(0) {}

template <typename Generator>
RandomChunkStream<Generator>::~RandomChunkStream() {}

template <typename Generator>
bool RandomChunkStream<Generator>::Next(std::string* chunk) {
  if (done_ >= length_) {
    return false;
  }

  // generate a full buffer of random data
  for (size_t i = 0; i < kNumSubChunks; ++i) {
    generator_.Fill(buffer_ + i * kSubChunkSize, kSubChunkSize);
  }

  size_t count = static_cast<size_t>(
      std::min<uint64_t>(length_ - done_, kBufferSize));
  chunk->assign(buffer_, count);
  done_ += count;
  return true;
}

template class RandomChunkStream<Lehmer64>;
template class RandomChunkStream<Lehmer64x3>;

}
