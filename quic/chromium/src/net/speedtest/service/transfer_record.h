#ifndef SPEEDTEST_SERVICE_TRANSFER_RECORD_H_
#define SPEEDTEST_SERVICE_TRANSFER_RECORD_H_

#include <stdint.h>

#include <string>

#include "base/time/time.h"

#include "net/third_party/quiche/src/quic/core/http/spdy_utils.h"

namespace speedtest {

// Everything the access log needs to know about one request. Missing
// request headers are kept as empty strings.
struct TransferRecord {
  base::Time start;
  std::string peer_host;
  std::string method;
  std::string path;
  std::string version;
  int status;
  std::string referer;
  std::string agent;

  // proxy headers, only looked at when they are trusted
  std::string forwarded_for;
  std::string real_ip;
  std::string forwarded;

  // bytes of the body handed to the transport
  uint64_t length;

  TransferRecord();
  TransferRecord(const TransferRecord&);
  TransferRecord& operator=(const TransferRecord&);
  ~TransferRecord();

  // Fills in the request part of a record from HTTP/2 style request headers.
  static TransferRecord FromRequestHeaders(
    const spdy::SpdyHeaderBlock& request_headers,
    const std::string& peer_host,
    const std::string& version);
};

}

#endif
