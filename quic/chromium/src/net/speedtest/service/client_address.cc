#include "net/speedtest/service/client_address.h"

#include <string>
#include <vector>

#include "net/third_party/quiche/src/quic/platform/api/quic_text_utils.h"

using quic::QuicIpAddress;
using quic::QuicStringPiece;
using quic::QuicTextUtils;

namespace {

// First element of a comma separated header value.
QuicStringPiece FirstListElement(QuicStringPiece value) {
  std::vector<QuicStringPiece> elements = QuicTextUtils::Split(value, ',');
  if (elements.empty()) {
    return QuicStringPiece();
  }
  QuicStringPiece first = elements[0];
  QuicTextUtils::RemoveLeadingAndTrailingWhitespace(&first);
  return first;
}

// Value of the `for` parameter of one Forwarded element (RFC 7239).
QuicStringPiece ForwardedFor(QuicStringPiece element) {
  for (QuicStringPiece pair : QuicTextUtils::Split(element, ';')) {
    QuicTextUtils::RemoveLeadingAndTrailingWhitespace(&pair);
    size_t equals = pair.find('=');
    if (equals == QuicStringPiece::npos) {
      continue;
    }
    QuicStringPiece key = pair.substr(0, equals);
    QuicTextUtils::RemoveLeadingAndTrailingWhitespace(&key);
    if (QuicTextUtils::ToLower(key) == "for") {
      return pair.substr(equals + 1);
    }
  }
  return QuicStringPiece();
}

}

namespace speedtest {

QuicIpAddress ParseAddressToken(QuicStringPiece token) {
  QuicTextUtils::RemoveLeadingAndTrailingWhitespace(&token);
  if (token.size() >= 2 && token.front() == '"' && token.back() == '"') {
    token = token.substr(1, token.size() - 2);
  }

  if (!token.empty() && token.front() == '[') {
    // [v6] or [v6]:port
    size_t close = token.find(']');
    if (close == QuicStringPiece::npos) {
      return QuicIpAddress();
    }
    token = token.substr(1, close - 1);
  } else {
    // v4:port has exactly one colon, bare v6 has several
    size_t colon = token.find(':');
    if (colon != QuicStringPiece::npos &&
        token.find(':', colon + 1) == QuicStringPiece::npos) {
      token = token.substr(0, colon);
    }
  }

  QuicIpAddress address;
  std::string literal(token.data(), token.size());
  if (literal.empty() || !address.FromString(literal)) {
    return QuicIpAddress();
  }
  return address;
}

QuicIpAddress ResolveClientAddress(QuicStringPiece peer_host,
                                   bool trust_headers,
                                   QuicStringPiece forwarded_for,
                                   QuicStringPiece real_ip,
                                   QuicStringPiece forwarded) {
  if (trust_headers) {
    QuicIpAddress address = ParseAddressToken(FirstListElement(forwarded_for));
    if (address.IsInitialized()) {
      return address;
    }
    address = ParseAddressToken(real_ip);
    if (address.IsInitialized()) {
      return address;
    }
    address = ParseAddressToken(ForwardedFor(FirstListElement(forwarded)));
    if (address.IsInitialized()) {
      return address;
    }
  }
  return ParseAddressToken(peer_host);
}

}
