#ifndef SPEEDTEST_SPEEDTEST_BACKEND_H_
#define SPEEDTEST_SPEEDTEST_BACKEND_H_

#include <map>
#include <memory>
#include <string>

#include "net/speedtest/speedtest_config.h"
#include "net/speedtest/service/access_log_service.h"
#include "net/speedtest/service/index_service.h"
#include "net/speedtest/service/transfer_record.h"
#include "net/speedtest/stream/timeout_guarded_stream.h"
#include "net/speedtest/stream/transfer_account.h"

#include "net/third_party/quiche/src/quic/core/quic_alarm_factory.h"
#include "net/third_party/quiche/src/quic/core/quic_clock.h"
#include "net/third_party/quiche/src/quic/tools/quic_backend_response.h"
#include "net/third_party/quiche/src/quic/tools/quic_simple_server_backend.h"

namespace speedtest {

// Receiver of streamed response bodies. A request handler that can stream
// registers a sink for itself with SpeedtestBackend::RegisterSink; the
// backend then hands it the response headers and a pull-based body instead
// of a fully buffered QuicBackendResponse.
class ResponseSink : public TimeoutGuardedStream::Delegate {
 public:
  ~ResponseSink() override {}

  // Time source and alarms of the connection the body is sent on.
  virtual const quic::QuicClock* clock() = 0;
  virtual quic::QuicAlarmFactory* alarm_factory() = 0;

  // Protocol name used in the access log, e.g. "HTTP/3".
  virtual std::string http_version() const = 0;

  virtual void OnStreamingResponse(spdy::SpdyHeaderBlock response_headers,
                                   std::unique_ptr<TransferAccount> body) = 0;
};

// Backend serving the index page at "/" and a generated random body at
// "/<size>", e.g. "/100mb.bin".
//
// All calls are expected on the server's event loop thread.
class SpeedtestBackend : public quic::QuicSimpleServerBackend {
 public:
  explicit SpeedtestBackend(std::shared_ptr<SpeedtestConfig> config);
  SpeedtestBackend(const SpeedtestBackend&) = delete;
  SpeedtestBackend& operator=(const SpeedtestBackend&) = delete;
  ~SpeedtestBackend() override;

  // Implements the functions for interface QuicSimpleServerBackend
  bool InitializeBackend(const std::string& backend_url) override;
  bool IsBackendInitialized() const override;
  void FetchResponseFromBackend(
      const spdy::SpdyHeaderBlock& request_headers,
      const std::string& request_body,
      quic::QuicSimpleServerBackend::RequestHandler* quic_stream) override;
  void CloseBackendResponseStream(
      quic::QuicSimpleServerBackend::RequestHandler* quic_stream) override;

  // `sink` stays registered until CloseBackendResponseStream is called for
  // `quic_stream`.
  void RegisterSink(quic::QuicSimpleServerBackend::RequestHandler* quic_stream,
                    ResponseSink* sink);

  const SpeedtestConfig& config() const { return *config_; }

 private:
  void SendResponse(
    quic::QuicSimpleServerBackend::RequestHandler* quic_stream,
    TransferRecord record,
    int status,
    const std::string& content_type,
    const std::string& body);
  void SendDownload(
    quic::QuicSimpleServerBackend::RequestHandler* quic_stream,
    TransferRecord record,
    const std::string& name);

  ResponseSink* FindSink(
    quic::QuicSimpleServerBackend::RequestHandler* quic_stream) const;

  std::shared_ptr<SpeedtestConfig> config_;
  std::shared_ptr<AccessLogService> access_log_;
  std::unique_ptr<IndexService> index_;

  std::map<quic::QuicSimpleServerBackend::RequestHandler*, ResponseSink*> sinks_;

  bool backend_initialized_;
};

}

#endif
