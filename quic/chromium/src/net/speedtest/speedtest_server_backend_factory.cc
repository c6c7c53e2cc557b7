#include "net/speedtest/speedtest_server_backend_factory.h"
#include "net/speedtest/speedtest_config.h"

#include "net/third_party/quiche/src/quic/platform/api/quic_flags.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"

DEFINE_QUIC_COMMAND_LINE_FLAG(
    std::string,
    speedtest_config_path,
    "",
    "Specifies the path to the JSON configuration of the speedtest "
    "server: access log, proxy headers, maximum file size, send "
    "timeout, seed and index page. Defaults are used if empty.");

namespace speedtest {

std::unique_ptr<SpeedtestBackend>
SpeedtestServerBackendFactory::CreateBackend() {
  std::shared_ptr<SpeedtestConfig> config(
    LoadSpeedtestConfig(GetQuicFlag(FLAGS_speedtest_config_path)));
  if (!config) {
    return nullptr;
  }

  auto backend = std::make_unique<SpeedtestBackend>(config);
  if (!backend->InitializeBackend(GetQuicFlag(FLAGS_speedtest_config_path))) {
    return nullptr;
  }
  return backend;
}

}
