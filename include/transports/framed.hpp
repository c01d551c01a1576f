#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

#include "transports/transport.hpp"

namespace mission_agent::transports {

// Shared line framing: "[<name>] <target> <protocol> <index>/<count> <chunk>".
class FramedTransport : public Transport {
 public:
  explicit FramedTransport(std::FILE* out) noexcept : out_(out) {}

  bool send(const comms::Envelope& envelope, const std::string& target) override;

  std::uint64_t frames_sent() const noexcept { return frames_sent_; }

 private:
  std::FILE* out_{nullptr};
  std::uint64_t frames_sent_{0};
};

}  // namespace mission_agent::transports
