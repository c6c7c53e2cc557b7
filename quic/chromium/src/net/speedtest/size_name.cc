#include "net/speedtest/size_name.h"

#include <limits>
#include <string>

#include "net/third_party/quiche/src/quic/platform/api/quic_text_utils.h"

using quic::QuicStringPiece;

namespace {

const char kDecimalPrefixes[] = "kmgtpe";

// Bytes per unit, 0 for unknown units. The largest, eib, is 2^60.
uint64_t UnitMultiplier(const std::string& unit) {
  if (unit == "b") {
    return 1;
  }
  if (unit.size() < 2 || unit.size() > 3 || unit.back() != 'b') {
    return 0;
  }
  const char* prefix = nullptr;
  for (const char* p = kDecimalPrefixes; *p != '\0'; ++p) {
    if (*p == unit[0]) {
      prefix = p;
      break;
    }
  }
  if (prefix == nullptr) {
    return 0;
  }
  int exponent = static_cast<int>(prefix - kDecimalPrefixes) + 1;

  uint64_t base;
  if (unit.size() == 2) {
    base = 1000;
  } else if (unit[1] == 'i') {
    base = 1024;
  } else {
    return 0;
  }

  uint64_t multiplier = 1;
  for (int i = 0; i < exponent; ++i) {
    multiplier *= base;
  }
  return multiplier;
}

}

namespace speedtest {

SizeParseResult ParseSizeName(QuicStringPiece name, uint64_t* bytes) {
  size_t dot = name.find('.');
  if (dot != QuicStringPiece::npos) {
    name = name.substr(0, dot);
  }

  size_t pos = 0;
  bool overflow = false;
  uint64_t value = 0;
  while (pos < name.size() && name[pos] >= '0' && name[pos] <= '9') {
    uint64_t digit = static_cast<uint64_t>(name[pos] - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      overflow = true;
    } else {
      value = value * 10 + digit;
    }
    ++pos;
  }
  if (pos == 0) {
    return SIZE_INVALID;
  }

  while (pos < name.size() && name[pos] == ' ') {
    ++pos;
  }
  std::string unit = quic::QuicTextUtils::ToLower(name.substr(pos));
  uint64_t multiplier = UnitMultiplier(unit);
  if (multiplier == 0) {
    return SIZE_INVALID;
  }

  if (overflow ||
      (value != 0 &&
       value > std::numeric_limits<uint64_t>::max() / multiplier)) {
    return SIZE_OVERFLOW;
  }
  *bytes = value * multiplier;
  return SIZE_OK;
}

}
