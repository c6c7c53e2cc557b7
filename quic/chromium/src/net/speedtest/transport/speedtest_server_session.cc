#include "net/speedtest/transport/speedtest_server_session.h"
#include "net/speedtest/transport/speedtest_server_stream.h"

#include "net/third_party/quiche/src/quic/platform/api/quic_ptr_util.h"

namespace speedtest {

SpeedtestServerSession::SpeedtestServerSession(
  const quic::QuicConfig& config,
  const quic::ParsedQuicVersionVector& supported_versions,
  quic::QuicConnection* connection,
  quic::QuicSession::Visitor* visitor,
  quic::QuicCryptoServerStream::Helper* helper,
  const quic::QuicCryptoServerConfig* crypto_config,
  quic::QuicCompressedCertsCache* compressed_certs_cache,
  SpeedtestBackend* backend
) : quic::QuicSimpleServerSession(config,
                                  supported_versions,
                                  connection,
                                  visitor,
                                  helper,
                                  crypto_config,
                                  compressed_certs_cache,
                                  backend)
  , backend_(backend) {}

SpeedtestServerSession::~SpeedtestServerSession() {}

quic::QuicSpdyStream* SpeedtestServerSession::CreateIncomingStream(
  quic::QuicStreamId id
) {
  if (!ShouldCreateIncomingStream(id)) {
    return nullptr;
  }

  quic::QuicSpdyStream* stream =
    new SpeedtestServerStream(id, this, quic::BIDIRECTIONAL, backend_);
  ActivateStream(quic::QuicWrapUnique(stream));
  return stream;
}

}
