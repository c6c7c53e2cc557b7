#include "net/speedtest/stream/transfer_account.h"

#include <utility>

namespace speedtest {

TransferAccount::TransferAccount(
  std::unique_ptr<ChunkStream> stream,
  FinalizeCallback on_finalize
) : stream_(std::move(stream))
  , on_finalize_(std::move(on_finalize))
  , bytes_sent_(0)
  , finalized_(false) {}

TransferAccount::~TransferAccount() {
  Finalize();
}

bool TransferAccount::Next(std::string* chunk) {
  if (finalized_) {
    return false;
  }
  if (!stream_->Next(chunk)) {
    Finalize();
    return false;
  }
  bytes_sent_ += chunk->size();
  return true;
}

void TransferAccount::Finalize() {
  if (finalized_) {
    return;
  }
  finalized_ = true;
  stream_.reset();
  if (!on_finalize_.is_null()) {
    std::move(on_finalize_).Run(bytes_sent_);
  }
}

}
