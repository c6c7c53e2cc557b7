#ifndef SPEEDTEST_SPEEDTEST_SERVER_H_
#define SPEEDTEST_SPEEDTEST_SERVER_H_

#include <memory>

#include "net/speedtest/speedtest_backend.h"

#include "net/third_party/quiche/src/quic/core/crypto/proof_source.h"
#include "net/third_party/quiche/src/quic/core/quic_versions.h"
#include "net/third_party/quiche/src/quic/tools/quic_spdy_server_base.h"

namespace speedtest {

class QuicSpeedtestServer {
 public:
  class ServerFactory {
   public:
    virtual ~ServerFactory() = default;

    virtual std::unique_ptr<quic::QuicSpdyServerBase> CreateServer(
        SpeedtestBackend* backend,
        std::unique_ptr<quic::ProofSource> proof_source,
        const quic::ParsedQuicVersionVector& supported_versions) = 0;
  };

  class BackendFactory {
   public:
    virtual ~BackendFactory() = default;
    // Returns nullptr if the backend cannot be configured.
    virtual std::unique_ptr<SpeedtestBackend> CreateBackend() = 0;
  };

  QuicSpeedtestServer(BackendFactory* backend_factory,
                      ServerFactory* server_factory);

  // Listens on --port and serves until the process is stopped. Returns 1 if
  // the backend cannot be created or the socket cannot be bound.
  int Start();

 private:
  BackendFactory* backend_factory_;
  ServerFactory* server_factory_;
};

}

#endif
