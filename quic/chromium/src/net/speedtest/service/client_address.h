#ifndef SPEEDTEST_SERVICE_CLIENT_ADDRESS_H_
#define SPEEDTEST_SERVICE_CLIENT_ADDRESS_H_

#include <string>

#include "net/third_party/quiche/src/quic/platform/api/quic_ip_address.h"
#include "net/third_party/quiche/src/quic/platform/api/quic_string_piece.h"

namespace speedtest {

// Picks the address a request should be attributed to. Without
// `trust_headers` this is always the peer host. With it, the first of
// these that holds an IP literal wins:
//  -- the left-most X-Forwarded-For entry,
//  -- X-Real-IP,
//  -- the `for=` parameter of the first Forwarded element,
//  -- the peer host.
// The returned address is uninitialized if nothing parses.
quic::QuicIpAddress ResolveClientAddress(quic::QuicStringPiece peer_host,
                                         bool trust_headers,
                                         quic::QuicStringPiece forwarded_for,
                                         quic::QuicStringPiece real_ip,
                                         quic::QuicStringPiece forwarded);

// Parses one address token as it appears in proxy headers. Surrounding
// whitespace and quotes, IPv6 brackets and a trailing port are dropped.
quic::QuicIpAddress ParseAddressToken(quic::QuicStringPiece token);

}

#endif
