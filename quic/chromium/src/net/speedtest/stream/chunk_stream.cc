#include "net/speedtest/stream/chunk_stream.h"

namespace speedtest {

ChunkStream::~ChunkStream() {}

}
