#include "transports/framed.hpp"

namespace mission_agent::transports {
namespace {

// BLE GATT notification payload at the negotiated 247-byte ATT MTU.
constexpr std::size_t kMaxFrameBytes = 244;

class BleTransport final : public FramedTransport {
 public:
  using FramedTransport::FramedTransport;

  const char* name() const override { return "BLE"; }
  std::size_t max_frame_bytes() const override { return kMaxFrameBytes; }
};

}  // namespace

std::unique_ptr<Transport> make_ble_transport(std::FILE* out) { return std::make_unique<BleTransport>(out); }

}  // namespace mission_agent::transports
