#ifndef SPEEDTEST_STREAM_TRANSFER_ACCOUNT_H_
#define SPEEDTEST_STREAM_TRANSFER_ACCOUNT_H_

#include <stdint.h>

#include <memory>
#include <string>

#include "base/callback.h"

#include "net/speedtest/stream/chunk_stream.h"

namespace speedtest {

// TransferAccount counts the bytes of every block that passes through it and
// reports the total exactly once, whichever way the transfer ends:
//  -- the wrapped stream runs out of data,
//  -- the owner calls Finalize() (e.g. after a send timeout),
//  -- the account is destroyed (stream reset, connection closed).
class TransferAccount : public ChunkStream {
 public:
  typedef base::OnceCallback<void(uint64_t bytes_sent)> FinalizeCallback;

  TransferAccount(std::unique_ptr<ChunkStream> stream,
                  FinalizeCallback on_finalize);
  TransferAccount(const TransferAccount&) = delete;
  TransferAccount& operator=(const TransferAccount&) = delete;
  ~TransferAccount() override;

  bool Next(std::string* chunk) override;

  // Releases the wrapped stream and runs the finalize callback. Only the
  // first call has any effect.
  void Finalize();

  uint64_t bytes_sent() const { return bytes_sent_; }
  bool finalized() const { return finalized_; }

 private:
  std::unique_ptr<ChunkStream> stream_;
  FinalizeCallback on_finalize_;
  uint64_t bytes_sent_;
  bool finalized_;
};

}

#endif
