#ifndef SPEEDTEST_STREAM_CHUNK_STREAM_H_
#define SPEEDTEST_STREAM_CHUNK_STREAM_H_

#include <string>

namespace speedtest {

// ChunkStream is a lazy, finite and non-restartable sequence of byte blocks.
// Consumers pull blocks one at a time; every block is a copy owned by the
// consumer, so a stream may reuse its internal buffers between steps.
class ChunkStream {
 public:
  virtual ~ChunkStream();

  // Stores the next block in `chunk` and returns true, or returns false once
  // the sequence has ended. After the first false every later call returns
  // false as well.
  virtual bool Next(std::string* chunk) = 0;
};

}

#endif
