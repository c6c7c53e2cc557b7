#ifndef SPEEDTEST_TRANSPORT_SPEEDTEST_SERVER_STREAM_H_
#define SPEEDTEST_TRANSPORT_SPEEDTEST_SERVER_STREAM_H_

#include <memory>
#include <string>

#include "net/speedtest/speedtest_backend.h"
#include "net/speedtest/stream/transfer_account.h"

#include "net/third_party/quiche/src/quic/core/quic_alarm.h"
#include "net/third_party/quiche/src/quic/tools/quic_simple_server_stream.h"

namespace speedtest {

namespace test {
class SpeedtestServerStreamPeer;
}

// Server stream that sends generated bodies under flow control. Blocks are
// only pulled from the body while the stream has no buffered data, so at
// most one block per stream is held in memory on top of the generator's
// buffer.
class SpeedtestServerStream : public quic::QuicSimpleServerStream,
                              public ResponseSink {
 public:
  SpeedtestServerStream(quic::QuicStreamId id,
                        quic::QuicSpdySession* session,
                        quic::StreamType type,
                        SpeedtestBackend* backend);
  SpeedtestServerStream(const SpeedtestServerStream&) = delete;
  SpeedtestServerStream& operator=(const SpeedtestServerStream&) = delete;
  ~SpeedtestServerStream() override;

  // QuicStream
  void OnCanWrite() override;

  // ResponseSink
  const quic::QuicClock* clock() override;
  quic::QuicAlarmFactory* alarm_factory() override;
  std::string http_version() const override;
  void OnStreamingResponse(spdy::SpdyHeaderBlock response_headers,
                           std::unique_ptr<TransferAccount> body) override;
  void OnDeadlineExpired() override;

 private:
  friend class test::SpeedtestServerStreamPeer;
  class FinishAlarmDelegate;

  // Writes blocks until the stream starts buffering or the body ends.
  void WriteBody();
  // Ends the body early and sends FIN after whatever is already buffered.
  void FinishBody();

  std::unique_ptr<TransferAccount> transfer_;
  bool fin_sent_;
  std::unique_ptr<quic::QuicAlarm> finish_alarm_;
};

}

#endif
