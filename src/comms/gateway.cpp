#include "comms/gateway.hpp"

#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace mission_agent::comms {

void check_destination(const std::string_view destination) {
  if (destination != kDestinationLocal && destination != kDestinationRemote) {
    throw UnsupportedDestination(std::string(destination));
  }
}

CommunicationsGateway::CommunicationsGateway(std::shared_ptr<const security::SecurityContext> security)
    : security_(std::move(security)) {
  if (security_ == nullptr) {
    throw std::invalid_argument("communications gateway requires a security context");
  }
}

Envelope CommunicationsGateway::forward(const std::string_view payload, const std::string_view destination) const {
  check_destination(destination);

  std::string relayed(kRelayTag);
  relayed.append(payload);

  if (destination == kDestinationRemote) {
    return Envelope{kSecuredProtocol, security_->encrypt(security_->obfuscate(relayed))};
  }
  return Envelope{kRelayProtocol, std::move(relayed)};
}

std::string CommunicationsGateway::receive(const Envelope& envelope) const {
  std::string relayed;
  if (envelope.protocol == kSecuredProtocol) {
    relayed = security_->deobfuscate(security_->decrypt(envelope.payload));
  } else if (envelope.protocol == kRelayProtocol) {
    relayed = envelope.payload;
  } else {
    throw CryptoError("unknown envelope protocol \"" + envelope.protocol + "\"");
  }

  const std::string_view tag(kRelayTag);
  if (relayed.compare(0, tag.size(), tag) != 0) {
    throw CryptoError("payload is missing the relay tag");
  }
  return relayed.substr(tag.size());
}

}  // namespace mission_agent::comms
