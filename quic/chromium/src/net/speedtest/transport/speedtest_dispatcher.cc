#include "net/speedtest/transport/speedtest_dispatcher.h"
#include "net/speedtest/transport/speedtest_server_session.h"

#include <utility>

#include "net/third_party/quiche/src/quic/core/quic_connection.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"

namespace speedtest {

SpeedtestDispatcher::SpeedtestDispatcher(
  const quic::QuicConfig* config,
  const quic::QuicCryptoServerConfig* crypto_config,
  quic::QuicVersionManager* version_manager,
  std::unique_ptr<quic::QuicConnectionHelperInterface> helper,
  std::unique_ptr<quic::QuicCryptoServerStream::Helper> session_helper,
  std::unique_ptr<quic::QuicAlarmFactory> alarm_factory,
  SpeedtestBackend* backend,
  uint8_t expected_server_connection_id_length
) : quic::QuicSimpleDispatcher(config,
                               crypto_config,
                               version_manager,
                               std::move(helper),
                               std::move(session_helper),
                               std::move(alarm_factory),
                               backend,
                               expected_server_connection_id_length)
  , backend_(backend) {}

SpeedtestDispatcher::~SpeedtestDispatcher() {}

quic::QuicServerSessionBase* SpeedtestDispatcher::CreateQuicSession(
  quic::QuicConnectionId connection_id,
  const quic::QuicSocketAddress& client_address,
  quic::QuicStringPiece /*alpn*/,
  const quic::ParsedQuicVersion& version
) {
  QUIC_DVLOG(1) << "New session " << connection_id << " from "
                << client_address.ToString() << " using "
                << quic::ParsedQuicVersionToString(version);

  // The session takes ownership of the connection.
  quic::QuicConnection* connection = new quic::QuicConnection(
    connection_id, client_address, helper(), alarm_factory(), writer(),
    /* owns_writer= */ false, quic::Perspective::IS_SERVER,
    quic::ParsedQuicVersionVector{version});

  quic::QuicServerSessionBase* session = new SpeedtestServerSession(
    config(), GetSupportedVersions(), connection, this, session_helper(),
    crypto_config(), compressed_certs_cache(), backend_);
  session->Initialize();
  return session;
}

}
