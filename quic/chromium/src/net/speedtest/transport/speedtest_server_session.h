#ifndef SPEEDTEST_TRANSPORT_SPEEDTEST_SERVER_SESSION_H_
#define SPEEDTEST_TRANSPORT_SPEEDTEST_SERVER_SESSION_H_

#include "net/speedtest/speedtest_backend.h"

#include "net/third_party/quiche/src/quic/tools/quic_simple_server_session.h"

namespace speedtest {

// Server session whose request streams are SpeedtestServerStreams.
class SpeedtestServerSession : public quic::QuicSimpleServerSession {
 public:
  SpeedtestServerSession(
      const quic::QuicConfig& config,
      const quic::ParsedQuicVersionVector& supported_versions,
      quic::QuicConnection* connection,
      quic::QuicSession::Visitor* visitor,
      quic::QuicCryptoServerStream::Helper* helper,
      const quic::QuicCryptoServerConfig* crypto_config,
      quic::QuicCompressedCertsCache* compressed_certs_cache,
      SpeedtestBackend* backend);
  SpeedtestServerSession(const SpeedtestServerSession&) = delete;
  SpeedtestServerSession& operator=(const SpeedtestServerSession&) = delete;
  ~SpeedtestServerSession() override;

 protected:
  quic::QuicSpdyStream* CreateIncomingStream(quic::QuicStreamId id) override;

 private:
  SpeedtestBackend* backend_;
};

}

#endif
