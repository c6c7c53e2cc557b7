#ifndef SPEEDTEST_SERVICE_ACCESS_LOG_SERVICE_H_
#define SPEEDTEST_SERVICE_ACCESS_LOG_SERVICE_H_

#include <string>

#include "net/speedtest/service/transfer_record.h"

#include "net/third_party/quiche/src/quic/platform/api/quic_mutex.h"

namespace speedtest {

// Access log in the combined log format. Every call to Log appends a single
// line to the file at `path`; the file is created when missing.
//
// Log is safe to call from any thread, lines never interleave. Write failures
// are reported through QUIC_LOG and otherwise ignored.
class AccessLogService {
 public:
  // An empty `path` disables the log.
  AccessLogService(const std::string& path, bool trust_forwarded_headers);
  AccessLogService(const AccessLogService&) = delete;
  AccessLogService& operator=(const AccessLogService&) = delete;
  ~AccessLogService();

  bool enabled() const { return !path_.empty(); }
  const std::string& path() const { return path_; }

  void Log(const TransferRecord& record);

  // Client used when writing `record`, "unknown" if none resolves.
  std::string ClientOf(const TransferRecord& record) const;

  // <client> - - [<date>] "<method> <path> <version>" <status> <length>
  // "<referer>" "<agent>", without the trailing newline.
  static std::string FormatLine(const TransferRecord& record,
                                const std::string& client);
 private:
  mutable quic::QuicMutex mutex_;

  const std::string path_;
  const bool trust_forwarded_headers_;
};

}

#endif
