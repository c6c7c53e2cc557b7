#ifndef SPEEDTEST_SPEEDTEST_SERVER_BACKEND_FACTORY_H_
#define SPEEDTEST_SPEEDTEST_SERVER_BACKEND_FACTORY_H_

#include "net/speedtest/speedtest_server.h"

namespace speedtest {

// Builds the backend from the JSON file named by --speedtest_config_path.
class SpeedtestServerBackendFactory : public QuicSpeedtestServer::BackendFactory {
 public:
  std::unique_ptr<SpeedtestBackend> CreateBackend() override;
};

}

#endif
