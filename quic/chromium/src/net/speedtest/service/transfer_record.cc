#include "net/speedtest/service/transfer_record.h"

namespace {

std::string HeaderOrEmpty(const spdy::SpdyHeaderBlock& headers,
                          const std::string& name) {
  auto header = headers.find(name);
  if (header == headers.end()) {
    return std::string();
  }
  return header->second.as_string();
}

}

namespace speedtest {

TransferRecord::TransferRecord() : status(0), length(0) {}
TransferRecord::TransferRecord(const TransferRecord&) = default;
TransferRecord& TransferRecord::operator=(const TransferRecord&) = default;
TransferRecord::~TransferRecord() {}

// static
TransferRecord TransferRecord::FromRequestHeaders(
  const spdy::SpdyHeaderBlock& request_headers,
  const std::string& peer_host,
  const std::string& version
) {
  TransferRecord record;
  record.start = base::Time::Now();
  record.peer_host = peer_host;
  record.method = HeaderOrEmpty(request_headers, ":method");
  record.path = HeaderOrEmpty(request_headers, ":path");
  record.version = version;
  record.referer = HeaderOrEmpty(request_headers, "referer");
  record.agent = HeaderOrEmpty(request_headers, "user-agent");
  record.forwarded_for = HeaderOrEmpty(request_headers, "x-forwarded-for");
  record.real_ip = HeaderOrEmpty(request_headers, "x-real-ip");
  record.forwarded = HeaderOrEmpty(request_headers, "forwarded");
  return record;
}

}
