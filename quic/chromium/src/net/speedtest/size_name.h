#ifndef SPEEDTEST_SIZE_NAME_H_
#define SPEEDTEST_SIZE_NAME_H_

#include <stdint.h>

#include "net/third_party/quiche/src/quic/platform/api/quic_string_piece.h"

namespace speedtest {

enum SizeParseResult {
  SIZE_OK,
  // not of the form <digits><unit>
  SIZE_INVALID,
  // well formed, but does not fit in 64 bits
  SIZE_OVERFLOW,
};

// Parses a download name such as "1000mb.bin", "10GiB" or "512 kb" into a
// number of bytes. Anything from the first '.' on is ignored. Units are
// case-insensitive: "b", decimal "kb" .. "eb" (powers of 1000) and binary
// "kib" .. "eib" (powers of 1024). A unit is required.
//
// `bytes` is only written when SIZE_OK is returned.
SizeParseResult ParseSizeName(quic::QuicStringPiece name, uint64_t* bytes);

}

#endif
