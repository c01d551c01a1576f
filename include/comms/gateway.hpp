#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "security/security_context.hpp"

namespace mission_agent::comms {

inline constexpr const char* kRelayTag = "LORA:";
inline constexpr const char* kRelayProtocol = "LoRaWAN";
inline constexpr const char* kSecuredProtocol = "GibberLink+AES256";

inline constexpr const char* kDestinationLocal = "local";
inline constexpr const char* kDestinationRemote = "remote";

// Unit handed to a transport: the protocol tag plus plain or tokenized bytes.
struct Envelope {
  std::string protocol{};
  std::string payload{};

  [[nodiscard]] bool secured() const noexcept { return protocol == kSecuredProtocol; }
};

// Throws UnsupportedDestination for anything but "local" or "remote".
void check_destination(std::string_view destination);

class CommunicationsGateway {
 public:
  explicit CommunicationsGateway(std::shared_ptr<const security::SecurityContext> security);

  // Relay-tags the payload, and for "remote" obfuscates then encrypts it.
  [[nodiscard]] Envelope forward(std::string_view payload, std::string_view destination) const;

  // Decrypts and deobfuscates secured envelopes, then strips the relay tag.
  // Throws CryptoError for unknown protocols or payloads without the tag.
  [[nodiscard]] std::string receive(const Envelope& envelope) const;

 private:
  std::shared_ptr<const security::SecurityContext> security_;
};

}  // namespace mission_agent::comms
