#include "net/speedtest/speedtest_config.h"
#include "net/speedtest/size_name.h"

#include <fstream>
#include <streambuf>

#include "base/files/file_path.h"
#include "base/files/file_util.h"
#include "base/json/json_reader.h"
#include "base/values.h"

#include "net/third_party/quiche/src/quic/platform/api/quic_logging.h"

namespace {

// 10 GiB
const uint64_t kDefaultMaxFileSize = 10ull << 30;
const int kDefaultSendTimeoutSecs = 20;

const char* const kDefaultIndexSizes[] = {
  "1mb", "10mb", "100mb", "1000mb", "10000mb",
};

}

namespace speedtest {

IndexConfig::IndexConfig() {}
IndexConfig::~IndexConfig() {}

SpeedtestConfig::SpeedtestConfig()
  : xff(false)
  , max_file_size(kDefaultMaxFileSize)
  , send_timeout_secs(kDefaultSendTimeoutSecs)
  , seed(0) {}
SpeedtestConfig::~SpeedtestConfig() {}

// static
bool SpeedtestConfig::ConvertSizeName(base::StringPiece name, uint64_t* bytes) {
  return ParseSizeName(quic::QuicStringPiece(name.data(), name.size()), bytes) ==
         SIZE_OK;
}

std::vector<std::string> SpeedtestConfig::IndexSizes() const {
  std::vector<std::string> sizes;
  for (const auto& size : index.sizes) {
    sizes.push_back(*size);
  }
  if (sizes.empty()) {
    for (const char* size : kDefaultIndexSizes) {
      sizes.push_back(size);
    }
  }
  return sizes;
}

std::unique_ptr<SpeedtestConfig> ParseSpeedtestConfig(const std::string& data) {
  base::Optional<base::Value> value = base::JSONReader::Read(data);
  if (!value || !value->is_dict()) {
    QUIC_LOG(ERROR) << "Configuration is not a JSON object";
    return nullptr;
  }

  std::unique_ptr<SpeedtestConfig> config(new SpeedtestConfig());
  base::JSONValueConverter<SpeedtestConfig> converter;
  if (!converter.Convert(*value, config.get())) {
    QUIC_LOG(ERROR) << "Configuration has a field of the wrong type";
    return nullptr;
  }

  if (config->send_timeout_secs <= 0) {
    QUIC_LOG(ERROR) << "send_timeout_secs must be positive, got "
                    << config->send_timeout_secs;
    return nullptr;
  }
  if (config->seed < 0) {
    QUIC_LOG(ERROR) << "seed must not be negative, got " << config->seed;
    return nullptr;
  }
  for (const auto& size : config->index.sizes) {
    uint64_t bytes;
    if (ParseSizeName(*size, &bytes) != SIZE_OK) {
      QUIC_LOG(ERROR) << "Invalid index size " << *size;
      return nullptr;
    }
    // Size names are copied into the index page as they are.
    if (size->find_first_of("<>\"'&") != std::string::npos) {
      QUIC_LOG(ERROR) << "Index size " << *size
                      << " contains an HTML special character";
      return nullptr;
    }
  }
  return config;
}

std::unique_ptr<SpeedtestConfig> LoadSpeedtestConfig(const std::string& path) {
  if (path.empty()) {
    return std::unique_ptr<SpeedtestConfig>(new SpeedtestConfig());
  }
  if (!base::PathExists(base::FilePath(path))) {
    QUIC_LOG(WARNING) << "No configuration at " << path << ", using defaults";
    return std::unique_ptr<SpeedtestConfig>(new SpeedtestConfig());
  }

  std::ifstream stream(path);
  if (!stream.is_open()) {
    QUIC_LOG(ERROR) << "Cannot read configuration " << path;
    return nullptr;
  }
  std::string data((std::istreambuf_iterator<char>(stream)),
                   std::istreambuf_iterator<char>());

  QUIC_LOG(INFO) << "Loading configuration " << path;
  return ParseSpeedtestConfig(data);
}

}
