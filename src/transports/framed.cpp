#include "transports/framed.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace mission_agent::transports {

std::vector<std::string_view> split_frames(const std::string_view payload, const std::size_t max_bytes) {
  std::vector<std::string_view> frames;
  if (payload.empty() || max_bytes == 0) {
    frames.emplace_back();
    return frames;
  }

  for (std::size_t offset = 0; offset < payload.size(); offset += max_bytes) {
    frames.push_back(payload.substr(offset, max_bytes));
  }
  return frames;
}

std::optional<transport_kind> parse_transport_kind(const std::string_view text) {
  std::string lower;
  lower.reserve(text.size());
  for (const char c : text) {
    lower.push_back(c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "ble") {
    return transport_kind::BLE;
  }
  if (lower == "lorawan" || lower == "lora") {
    return transport_kind::LORAWAN;
  }
  if (lower == "gibberlink_rf" || lower == "gibberlink") {
    return transport_kind::GIBBERLINK_RF;
  }
  return std::nullopt;
}

const char* to_string(const transport_kind kind) noexcept {
  switch (kind) {
    case transport_kind::BLE:
      return "BLE";
    case transport_kind::LORAWAN:
      return "LoRaWAN";
    case transport_kind::GIBBERLINK_RF:
      return "GibberLink-RF";
  }
  return "UNKNOWN";
}

std::unique_ptr<Transport> make_transport(const transport_kind kind, std::FILE* out) {
  switch (kind) {
    case transport_kind::BLE:
      return make_ble_transport(out);
    case transport_kind::LORAWAN:
      return make_lorawan_transport(out);
    case transport_kind::GIBBERLINK_RF:
      return make_gibberlink_rf_transport(out);
  }
  return nullptr;
}

bool FramedTransport::send(const comms::Envelope& envelope, const std::string& target) {
  if (out_ == nullptr) {
    return false;
  }

  const std::string to = target.empty() ? std::string("-") : target;
  const auto frames = split_frames(envelope.payload, max_frame_bytes());

  // Keep one envelope's fragments contiguous when agents share a stream.
  flockfile(out_);
  bool ok = true;
  for (std::size_t i = 0; i < frames.size(); ++i) {
    const int written = std::fprintf(out_, "[%s] %s %s %zu/%zu %.*s\n", name(), to.c_str(), envelope.protocol.c_str(),
                                     i + 1, frames.size(), static_cast<int>(frames[i].size()),
                                     frames[i].empty() ? "" : frames[i].data());
    if (written < 0) {
      ok = false;
      break;
    }
    ++frames_sent_;
  }
  ok = std::fflush(out_) == 0 && ok;
  funlockfile(out_);
  return ok;
}

}  // namespace mission_agent::transports
