#ifndef SPEEDTEST_TRANSPORT_SPEEDTEST_EPOLL_SERVER_H_
#define SPEEDTEST_TRANSPORT_SPEEDTEST_EPOLL_SERVER_H_

#include <memory>

#include "net/speedtest/speedtest_backend.h"

#include "net/third_party/quiche/src/quic/core/crypto/proof_source.h"
#include "net/third_party/quiche/src/quic/tools/quic_server.h"

namespace speedtest {

// Epoll based QUIC server using SpeedtestDispatcher. The epoll server's
// clock and alarms drive the send deadlines of all streams.
class SpeedtestEpollServer : public quic::QuicServer {
 public:
  SpeedtestEpollServer(
      std::unique_ptr<quic::ProofSource> proof_source,
      const quic::QuicConfig& config,
      const quic::QuicCryptoServerConfig::ConfigOptions& crypto_config_options,
      const quic::ParsedQuicVersionVector& supported_versions,
      SpeedtestBackend* backend);
  SpeedtestEpollServer(const SpeedtestEpollServer&) = delete;
  SpeedtestEpollServer& operator=(const SpeedtestEpollServer&) = delete;
  ~SpeedtestEpollServer() override;

 protected:
  quic::QuicDispatcher* CreateQuicDispatcher() override;

 private:
  SpeedtestBackend* backend_;
};

}

#endif
