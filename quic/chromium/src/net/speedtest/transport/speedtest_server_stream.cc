#include "net/speedtest/transport/speedtest_server_stream.h"

#include <utility>

#include "net/third_party/quiche/src/quic/core/http/quic_spdy_session.h"
#include "net/third_party/quiche/src/quic/core/quic_connection.h"
#include "net/third_party/quiche/src/quic/core/quic_versions.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"

namespace speedtest {

// Runs FinishBody outside of the deadline alarm, which belongs to the body
// that FinishBody destroys.
class SpeedtestServerStream::FinishAlarmDelegate
    : public quic::QuicAlarm::Delegate {
 public:
  explicit FinishAlarmDelegate(SpeedtestServerStream* stream)
    : stream_(stream) {}
  FinishAlarmDelegate(const FinishAlarmDelegate&) = delete;
  FinishAlarmDelegate& operator=(const FinishAlarmDelegate&) = delete;

  void OnAlarm() override { stream_->FinishBody(); }

 private:
  SpeedtestServerStream* stream_;
};

SpeedtestServerStream::SpeedtestServerStream(
  quic::QuicStreamId id,
  quic::QuicSpdySession* session,
  quic::StreamType type,
  SpeedtestBackend* backend
) : quic::QuicSimpleServerStream(id, session, type, backend)
  , fin_sent_(false)
  , finish_alarm_(session->connection()->alarm_factory()->CreateAlarm(
      new FinishAlarmDelegate(this))) {
  backend->RegisterSink(this, this);
}

SpeedtestServerStream::~SpeedtestServerStream() {
  finish_alarm_->Cancel();
  if (transfer_ != nullptr) {
    QUIC_DVLOG(1) << "Stream " << id() << " closed after "
                  << transfer_->bytes_sent() << " bytes";
  }
}

const quic::QuicClock* SpeedtestServerStream::clock() {
  return session()->connection()->clock();
}

quic::QuicAlarmFactory* SpeedtestServerStream::alarm_factory() {
  return session()->connection()->alarm_factory();
}

std::string SpeedtestServerStream::http_version() const {
  return quic::VersionUsesHttp3(transport_version()) ? "HTTP/3" : "HTTP/2";
}

void SpeedtestServerStream::OnStreamingResponse(
  spdy::SpdyHeaderBlock response_headers,
  std::unique_ptr<TransferAccount> body
) {
  QUIC_DVLOG(1) << "Stream " << id() << " streaming response "
                << response_headers.DebugString();
  transfer_ = std::move(body);
  WriteHeaders(std::move(response_headers), false, nullptr);
  WriteBody();
}

void SpeedtestServerStream::OnCanWrite() {
  quic::QuicSimpleServerStream::OnCanWrite();
  WriteBody();
}

void SpeedtestServerStream::OnDeadlineExpired() {
  QUIC_DVLOG(1) << "Stream " << id() << " send deadline passed";
  if (!finish_alarm_->IsSet()) {
    finish_alarm_->Set(clock()->ApproximateNow());
  }
}

void SpeedtestServerStream::WriteBody() {
  if (transfer_ == nullptr || fin_sent_ || write_side_closed()) {
    return;
  }

  std::string chunk;
  while (!HasBufferedData()) {
    if (!transfer_->Next(&chunk)) {
      QUIC_DVLOG(1) << "Stream " << id() << " sent " << transfer_->bytes_sent()
                    << " bytes";
      fin_sent_ = true;
      WriteOrBufferBody(quic::QuicStringPiece(), true);
      return;
    }
    WriteOrBufferBody(chunk, false);
  }
}

void SpeedtestServerStream::FinishBody() {
  if (transfer_ == nullptr || fin_sent_) {
    return;
  }
  transfer_->Finalize();
  fin_sent_ = true;
  if (!write_side_closed()) {
    WriteOrBufferBody(quic::QuicStringPiece(), true);
  }
}

}
