#include "net/speedtest/speedtest_backend.h"

#include "net/speedtest/generator/lehmer64.h"
#include "net/speedtest/size_name.h"
#include "net/speedtest/stream/random_chunk_stream.h"

#include <list>
#include <utility>

#include "base/bind.h"

#include "net/third_party/quiche/src/quic/core/http/spdy_utils.h"
#include "net/third_party/quiche/src/quic/core/quic_time.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_text_utils.h"

const std::string INDEX_PATH = "/";
const std::string DEFAULT_HTTP_VERSION = "HTTP/3";

using quic::QuicBackendResponse;
using quic::QuicSimpleServerBackend;
using quic::QuicTextUtils;
using spdy::SpdyHeaderBlock;

namespace {

void LogTransfer(std::shared_ptr<speedtest::AccessLogService> access_log,
                 const speedtest::TransferRecord& record,
                 uint64_t bytes_sent) {
  speedtest::TransferRecord finished = record;
  finished.length = bytes_sent;
  access_log->Log(finished);
}

// Path without query string.
std::string RequestPath(const SpdyHeaderBlock& request_headers) {
  auto path = request_headers.find(":path");
  if (path == request_headers.end()) {
    return std::string();
  }
  std::string value = path->second.as_string();
  return value.substr(0, value.find('?'));
}

}

namespace speedtest {

SpeedtestBackend::SpeedtestBackend(std::shared_ptr<SpeedtestConfig> config)
  : config_(config)
  , access_log_(new AccessLogService(config->access_log, config->xff))
  , index_(new IndexService(config->index.file, config->IndexSizes()))
  , backend_initialized_(false) {}

SpeedtestBackend::~SpeedtestBackend() {}

bool SpeedtestBackend::InitializeBackend(const std::string& _unused) {
  if (!index_->Initialize()) {
    return false;
  }
  if (access_log_->enabled()) {
    QUIC_LOG(INFO) << "Access log at " << access_log_->path();
  }
  QUIC_LOG(INFO) << "Serving random data up to " << config_->max_file_size
                 << " bytes, send timeout " << config_->send_timeout_secs
                 << "s, seed " << config_->seed;

  backend_initialized_ = true;
  return true;
}

bool SpeedtestBackend::IsBackendInitialized() const {
  return backend_initialized_;
}

void SpeedtestBackend::RegisterSink(
  QuicSimpleServerBackend::RequestHandler* quic_stream,
  ResponseSink* sink
) {
  sinks_[quic_stream] = sink;
}

ResponseSink* SpeedtestBackend::FindSink(
  QuicSimpleServerBackend::RequestHandler* quic_stream
) const {
  auto sink = sinks_.find(quic_stream);
  if (sink == sinks_.end()) {
    return nullptr;
  }
  return sink->second;
}

void SpeedtestBackend::FetchResponseFromBackend(
  const SpdyHeaderBlock& request_headers,
  const std::string& request_body,
  QuicSimpleServerBackend::RequestHandler* quic_stream
) {
  ResponseSink* sink = FindSink(quic_stream);
  TransferRecord record = TransferRecord::FromRequestHeaders(
    request_headers,
    quic_stream->peer_host(),
    sink != nullptr ? sink->http_version() : DEFAULT_HTTP_VERSION
  );

  std::string path = RequestPath(request_headers);
  QUIC_DVLOG(1) << "[request] " << record.method << " " << path;

  if (path == INDEX_PATH) {
    SendResponse(quic_stream, record, 200, "text/html; charset=utf-8",
                 index_->page());
    return;
  }

  // "/<name>", a single path segment
  if (path.size() > 1 && path[0] == '/' &&
      path.find('/', 1) == std::string::npos) {
    SendDownload(quic_stream, record, path.substr(1));
    return;
  }

  SendResponse(quic_stream, record, 404, "text/plain", "Not Found");
}

void SpeedtestBackend::SendDownload(
  QuicSimpleServerBackend::RequestHandler* quic_stream,
  TransferRecord record,
  const std::string& name
) {
  uint64_t size = 0;
  SizeParseResult result = ParseSizeName(name, &size);
  if (result == SIZE_OVERFLOW ||
      (result == SIZE_OK && size > config_->max_file_size)) {
    SendResponse(quic_stream, record, 400, "text/plain", "too big");
    return;
  }
  if (result == SIZE_INVALID) {
    if (name[0] >= '0' && name[0] <= '9') {
      SendResponse(quic_stream, record, 400, "text/plain", "cannot parse size");
    } else {
      SendResponse(quic_stream, record, 404, "text/plain", "Not Found");
    }
    return;
  }

  ResponseSink* sink = FindSink(quic_stream);
  if (sink == nullptr) {
    QUIC_LOG(ERROR) << "No response sink for stream " << quic_stream->stream_id();
    SendResponse(quic_stream, record, 500, "text/plain", "Internal Server Error");
    return;
  }

  SpdyHeaderBlock response_headers;
  response_headers[":status"] = QuicTextUtils::Uint64ToString(200);
  response_headers["content-type"] = "application/binary";
  response_headers["content-disposition"] = "attachment; filename=" + name;
  response_headers["content-length"] = QuicTextUtils::Uint64ToString(size);
  response_headers["cache-control"] =
    "no-cache, no-store, no-transform, must-revalidate";
  response_headers["pragma"] = "no-cache";

  // generator -> fixed size stream -> send deadline -> byte accounting
  Lehmer64x3 generator =
    Lehmer64x3::FromUint64(static_cast<uint64_t>(config_->seed));
  std::unique_ptr<ChunkStream> stream(
    new RandomChunkStream<Lehmer64x3>(generator, size));
  stream.reset(new TimeoutGuardedStream(
    std::move(stream),
    quic::QuicTime::Delta::FromSeconds(config_->send_timeout_secs),
    sink->clock(),
    sink->alarm_factory(),
    sink
  ));

  record.status = 200;
  std::unique_ptr<TransferAccount> body(new TransferAccount(
    std::move(stream),
    base::BindOnce(&LogTransfer, access_log_, record)
  ));

  QUIC_DVLOG(1) << "[download] " << name << " : " << size << " bytes";
  sink->OnStreamingResponse(std::move(response_headers), std::move(body));
}

void SpeedtestBackend::SendResponse(
  QuicSimpleServerBackend::RequestHandler* quic_stream,
  TransferRecord record,
  int status,
  const std::string& content_type,
  const std::string& body
) {
  SpdyHeaderBlock response_headers;
  response_headers[":status"] = QuicTextUtils::Uint64ToString(status);
  response_headers["content-type"] = content_type;
  response_headers["content-length"] = QuicTextUtils::Uint64ToString(body.size());

  QuicBackendResponse quic_response;
  quic_response.set_response_type(QuicBackendResponse::REGULAR_RESPONSE);
  quic_response.set_headers(std::move(response_headers));
  quic_response.set_body(body);
  quic_response.set_trailers(SpdyHeaderBlock());
  quic_response.set_stop_sending_code(0);

  record.status = status;
  record.length = body.size();
  access_log_->Log(record);

  auto push_info = std::list<QuicBackendResponse::ServerPushInfo>();
  quic_stream->OnResponseBackendComplete(&quic_response, push_info);
}

void SpeedtestBackend::CloseBackendResponseStream(
  QuicSimpleServerBackend::RequestHandler* quic_stream
) {
  sinks_.erase(quic_stream);
}

}
