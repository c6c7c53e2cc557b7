#ifndef SPEEDTEST_TRANSPORT_SPEEDTEST_DISPATCHER_H_
#define SPEEDTEST_TRANSPORT_SPEEDTEST_DISPATCHER_H_

#include <memory>

#include "net/speedtest/speedtest_backend.h"

#include "net/third_party/quiche/src/quic/tools/quic_simple_dispatcher.h"

namespace speedtest {

// Dispatcher creating a SpeedtestServerSession per connection.
class SpeedtestDispatcher : public quic::QuicSimpleDispatcher {
 public:
  SpeedtestDispatcher(
      const quic::QuicConfig* config,
      const quic::QuicCryptoServerConfig* crypto_config,
      quic::QuicVersionManager* version_manager,
      std::unique_ptr<quic::QuicConnectionHelperInterface> helper,
      std::unique_ptr<quic::QuicCryptoServerStream::Helper> session_helper,
      std::unique_ptr<quic::QuicAlarmFactory> alarm_factory,
      SpeedtestBackend* backend,
      uint8_t expected_server_connection_id_length);
  SpeedtestDispatcher(const SpeedtestDispatcher&) = delete;
  SpeedtestDispatcher& operator=(const SpeedtestDispatcher&) = delete;
  ~SpeedtestDispatcher() override;

 protected:
  quic::QuicServerSessionBase* CreateQuicSession(
      quic::QuicConnectionId connection_id,
      const quic::QuicSocketAddress& client_address,
      quic::QuicStringPiece alpn,
      const quic::ParsedQuicVersion& version) override;

 private:
  SpeedtestBackend* backend_;
};

}

#endif
