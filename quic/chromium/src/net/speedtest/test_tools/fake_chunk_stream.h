#ifndef SPEEDTEST_TEST_TOOLS_FAKE_CHUNK_STREAM_H_
#define SPEEDTEST_TEST_TOOLS_FAKE_CHUNK_STREAM_H_

#include <stddef.h>

#include <string>
#include <vector>

#include "net/speedtest/stream/chunk_stream.h"

namespace speedtest {
namespace test {

// Hands out a fixed list of chunks. Optionally records its own destruction
// in `*destroyed`.
class FakeChunkStream : public ChunkStream {
 public:
  FakeChunkStream(const std::vector<std::string>& chunks, bool* destroyed);
  FakeChunkStream(const FakeChunkStream&) = delete;
  FakeChunkStream& operator=(const FakeChunkStream&) = delete;
  ~FakeChunkStream() override;

  bool Next(std::string* chunk) override;

  // Number of chunks handed out so far.
  size_t pulled() const { return next_; }

 private:
  std::vector<std::string> chunks_;
  size_t next_;
  bool* destroyed_;
};

// Returns `count` chunks, the i-th made of `size` copies of 'a' + i.
std::vector<std::string> MakeChunks(size_t count, size_t size);

}
}

#endif
