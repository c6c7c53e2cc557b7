#ifndef SPEEDTEST_SPEEDTEST_CONFIG_H_
#define SPEEDTEST_SPEEDTEST_CONFIG_H_

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "base/json/json_value_converter.h"
#include "base/strings/string_piece.h"

namespace speedtest {

struct IndexConfig {
  // HTML file served at "/", built in page when empty
  std::string file;
  // size names listed by the built in page
  std::vector<std::unique_ptr<std::string>> sizes;

  IndexConfig();
  IndexConfig(const IndexConfig&) = delete;
  IndexConfig& operator=(const IndexConfig&) = delete;
  ~IndexConfig();

  static void RegisterJSONConverter(base::JSONValueConverter<IndexConfig>* converter) {
    converter->RegisterStringField("file", &IndexConfig::file);
    converter->RegisterRepeatedString("sizes", &IndexConfig::sizes);
  }
};

struct SpeedtestConfig {
  std::string access_log;
  bool xff;
  uint64_t max_file_size;
  int send_timeout_secs;
  int seed;
  IndexConfig index;

  SpeedtestConfig();
  SpeedtestConfig(const SpeedtestConfig&) = delete;
  SpeedtestConfig& operator=(const SpeedtestConfig&) = delete;
  ~SpeedtestConfig();

  static bool ConvertSizeName(base::StringPiece name, uint64_t* bytes);

  static void RegisterJSONConverter(
      base::JSONValueConverter<SpeedtestConfig>* converter) {
    converter->RegisterStringField("access_log", &SpeedtestConfig::access_log);
    converter->RegisterBoolField("xff", &SpeedtestConfig::xff);
    converter->RegisterCustomField<uint64_t>(
      "max_file_size", &SpeedtestConfig::max_file_size, &ConvertSizeName);
    converter->RegisterIntField("send_timeout_secs", &SpeedtestConfig::send_timeout_secs);
    converter->RegisterIntField("seed", &SpeedtestConfig::seed);
    converter->RegisterNestedField<IndexConfig>("index", &SpeedtestConfig::index);
  }

  // Size names of the index page, with the built in list if none are
  // configured.
  std::vector<std::string> IndexSizes() const;
};

// Parses a JSON configuration. Fields not present keep their defaults.
// Returns nullptr if the JSON is malformed or a value is out of range.
std::unique_ptr<SpeedtestConfig> ParseSpeedtestConfig(const std::string& data);

// Reads and parses the configuration at `path`. An empty path or a path that
// does not exist gives the default configuration.
std::unique_ptr<SpeedtestConfig> LoadSpeedtestConfig(const std::string& path);

}

#endif
