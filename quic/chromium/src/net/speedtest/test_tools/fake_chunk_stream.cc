#include "net/speedtest/test_tools/fake_chunk_stream.h"

namespace speedtest {
namespace test {

FakeChunkStream::FakeChunkStream(const std::vector<std::string>& chunks,
                                 bool* destroyed)
  : chunks_(chunks)
  , next_(0)
  , destroyed_(destroyed) {
  if (destroyed_ != nullptr) {
    *destroyed_ = false;
  }
}

FakeChunkStream::~FakeChunkStream() {
  if (destroyed_ != nullptr) {
    *destroyed_ = true;
  }
}

bool FakeChunkStream::Next(std::string* chunk) {
  if (next_ >= chunks_.size()) {
    return false;
  }
  *chunk = chunks_[next_++];
  return true;
}

std::vector<std::string> MakeChunks(size_t count, size_t size) {
  std::vector<std::string> chunks;
  for (size_t i = 0; i < count; ++i) {
    chunks.push_back(std::string(size, static_cast<char>('a' + i % 26)));
  }
  return chunks;
}

}
}
