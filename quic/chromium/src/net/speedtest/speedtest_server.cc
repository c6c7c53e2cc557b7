#include "net/speedtest/speedtest_server.h"

#include <utility>
#include <vector>

#include "net/third_party/quiche/src/quic/platform/api/quic_default_proof_providers.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_flags.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_socket_address.h"

DEFINE_QUIC_COMMAND_LINE_FLAG(int32_t,
                              port,
                              6121,
                              "The port the quic server will listen on.");

namespace speedtest {

QuicSpeedtestServer::QuicSpeedtestServer(BackendFactory* backend_factory,
                                         ServerFactory* server_factory)
    : backend_factory_(backend_factory), server_factory_(server_factory) {}

int QuicSpeedtestServer::Start() {
  auto backend = backend_factory_->CreateBackend();
  if (!backend) {
    QUIC_LOG(ERROR) << "Failed to configure the speedtest backend";
    return 1;
  }

  // Create a server with the speedtest backend from the factory
  auto supported_versions = quic::AllSupportedVersions();
  for (const auto& version : supported_versions) {
    quic::QuicEnableVersion(version);
  }
  auto proof_source = quic::CreateDefaultProofSource();
  auto server = server_factory_->CreateServer(
      backend.get(), std::move(proof_source), supported_versions);

  auto port = GetQuicFlag(FLAGS_port);
  if (!server->CreateUDPSocketAndListen(quic::QuicSocketAddress(
          quic::QuicIpAddress::Any6(), port))) {
    QUIC_LOG(ERROR) << "Cannot listen on port " << port;
    return 1;
  }
  QUIC_LOG(INFO) << "Speedtest server listening on port " << port;

  server->HandleEventsForever();
  return 0;
}

}
