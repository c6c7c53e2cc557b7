#include <vector>

#include "net/speedtest/speedtest_server.h"
#include "net/speedtest/speedtest_server_backend_factory.h"
#include "net/speedtest/transport/speedtest_epoll_server.h"
#include "net/third_party/quiche/src/quic/core/quic_versions.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_flags.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_system_event_loop.h"

const int MAX_STREAMS = 1000000;

class SpeedtestEpollServerFactory
    : public speedtest::QuicSpeedtestServer::ServerFactory {
  std::unique_ptr<quic::QuicSpdyServerBase> CreateServer(
      speedtest::SpeedtestBackend* backend,
      std::unique_ptr<quic::ProofSource> proof_source,
      const quic::ParsedQuicVersionVector& supported_versions) override {

    // Allow more streams
    config_.SetMaxIncomingBidirectionalStreamsToSend(MAX_STREAMS);
    config_.SetMaxIncomingUnidirectionalStreamsToSend(MAX_STREAMS);

    return std::make_unique<speedtest::SpeedtestEpollServer>(
        std::move(proof_source), config_,
        quic::QuicCryptoServerConfig::ConfigOptions(), supported_versions,
        backend);
  }

 private:
  quic::QuicConfig config_;
};

int main(int argc, char* argv[]) {
  QuicSystemEventLoop event_loop("speedtest_server");
  const char* usage = "Usage: speedtest_server [options]";
  std::vector<std::string> non_option_args =
      quic::QuicParseCommandLineFlags(usage, argc, argv);
  if (!non_option_args.empty()) {
    quic::QuicPrintCommandLineFlagHelp(usage);
    exit(0);
  }

  speedtest::SpeedtestServerBackendFactory backend_factory;
  SpeedtestEpollServerFactory server_factory;
  speedtest::QuicSpeedtestServer server(&backend_factory, &server_factory);
  return server.Start();
}
