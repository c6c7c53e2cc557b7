#include "net/speedtest/service/access_log_service.h"
#include "net/speedtest/service/client_address.h"

#include <fstream>

#include "base/strings/stringprintf.h"
#include "base/time/time.h"

#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"

namespace {

const char* const kMonths[] = {
  "Jan", "Feb", "Mar", "Apr", "May", "Jun",
  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
};

std::string FormatDate(const base::Time& time) {
  base::Time::Exploded exploded;
  time.UTCExplode(&exploded);
  if (!exploded.HasValidValues()) {
    return std::string();
  }
  return base::StringPrintf("%02d/%s/%04d:%02d:%02d:%02d +0000",
                            exploded.day_of_month,
                            kMonths[exploded.month - 1],
                            exploded.year,
                            exploded.hour,
                            exploded.minute,
                            exploded.second);
}

}

namespace speedtest {

AccessLogService::AccessLogService(
  const std::string& path,
  bool trust_forwarded_headers
) : path_(path)
  , trust_forwarded_headers_(trust_forwarded_headers) {}

AccessLogService::~AccessLogService() {}

std::string AccessLogService::ClientOf(const TransferRecord& record) const {
  quic::QuicIpAddress address = ResolveClientAddress(
    record.peer_host,
    trust_forwarded_headers_,
    record.forwarded_for,
    record.real_ip,
    record.forwarded
  );
  if (!address.IsInitialized()) {
    return "unknown";
  }
  return address.ToString();
}

// static
std::string AccessLogService::FormatLine(
  const TransferRecord& record,
  const std::string& client
) {
  std::string length = record.length == 0
    ? std::string("-")
    : base::StringPrintf("%llu",
                         static_cast<unsigned long long>(record.length));
  return base::StringPrintf("%s - - [%s] \"%s %s %s\" %d %s \"%s\" \"%s\"",
                            client.c_str(),
                            FormatDate(record.start).c_str(),
                            record.method.c_str(),
                            record.path.c_str(),
                            record.version.c_str(),
                            record.status,
                            length.c_str(),
                            record.referer.c_str(),
                            record.agent.c_str());
}

void AccessLogService::Log(const TransferRecord& record) {
  if (!enabled()) {
    return;
  }
  std::string line = FormatLine(record, ClientOf(record));

  quic::QuicWriterMutexLock lock(&mutex_);
  std::ofstream out(path_, std::ios::out | std::ios::app | std::ios::binary);
  if (!out.is_open()) {
    QUIC_LOG_FIRST_N(WARNING, 10) << "Cannot open access log " << path_;
    return;
  }
  out << line << '\n';
  out.flush();
  if (!out) {
    QUIC_LOG_FIRST_N(WARNING, 10) << "Failed writing access log " << path_;
  }
}

}
