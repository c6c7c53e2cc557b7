#include "net/speedtest/transport/speedtest_epoll_server.h"
#include "net/speedtest/transport/speedtest_dispatcher.h"

#include <utility>

#include "net/third_party/quiche/src/quic/core/quic_epoll_alarm_factory.h"
#include "net/third_party/quiche/src/quic/core/quic_epoll_connection_helper.h"
#include "net/third_party/quiche/src/quic/tools/quic_simple_crypto_server_stream_helper.h"

namespace speedtest {

SpeedtestEpollServer::SpeedtestEpollServer(
  std::unique_ptr<quic::ProofSource> proof_source,
  const quic::QuicConfig& config,
  const quic::QuicCryptoServerConfig::ConfigOptions& crypto_config_options,
  const quic::ParsedQuicVersionVector& supported_versions,
  SpeedtestBackend* backend
) : quic::QuicServer(std::move(proof_source),
                     config,
                     crypto_config_options,
                     supported_versions,
                     backend,
                     quic::kQuicDefaultConnectionIdLength)
  , backend_(backend) {}

SpeedtestEpollServer::~SpeedtestEpollServer() {}

quic::QuicDispatcher* SpeedtestEpollServer::CreateQuicDispatcher() {
  return new SpeedtestDispatcher(
    &config(),
    &crypto_config(),
    version_manager(),
    std::unique_ptr<quic::QuicEpollConnectionHelper>(
      new quic::QuicEpollConnectionHelper(epoll_server(),
                                          quic::QuicAllocator::BUFFER_POOL)),
    std::unique_ptr<quic::QuicCryptoServerStream::Helper>(
      new quic::QuicSimpleCryptoServerStreamHelper()),
    std::unique_ptr<quic::QuicEpollAlarmFactory>(
      new quic::QuicEpollAlarmFactory(epoll_server())),
    backend_,
    expected_server_connection_id_length());
}

}
