#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "comms/gateway.hpp"

namespace mission_agent::transports {

enum class transport_kind : std::uint8_t {
  BLE = 0,
  LORAWAN = 1,
  GIBBERLINK_RF = 2,
};

class Transport {
 public:
  virtual const char* name() const = 0;
  virtual std::size_t max_frame_bytes() const = 0;
  // Fire-and-forget; false when the link rejected or failed to write a frame.
  virtual bool send(const comms::Envelope& envelope, const std::string& target) = 0;
  virtual ~Transport() = default;
};

// Accepts "ble", "lorawan", "gibberlink_rf" and the protocol spellings used in
// mission files ("BLE", "LoRaWAN", "GibberLink-RF").
std::optional<transport_kind> parse_transport_kind(std::string_view text);
const char* to_string(transport_kind kind) noexcept;

// Frames are written as one line each to `out`, which the caller keeps open.
std::unique_ptr<Transport> make_ble_transport(std::FILE* out = stdout);
std::unique_ptr<Transport> make_lorawan_transport(std::FILE* out = stdout);
std::unique_ptr<Transport> make_gibberlink_rf_transport(std::FILE* out = stdout);
std::unique_ptr<Transport> make_transport(transport_kind kind, std::FILE* out = stdout);

// Splits a payload into chunks of at most `max_bytes`. An empty payload still
// yields one (empty) chunk so the receiver sees the envelope.
std::vector<std::string_view> split_frames(std::string_view payload, std::size_t max_bytes);

}  // namespace mission_agent::transports
