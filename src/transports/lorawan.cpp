#include "transports/framed.hpp"

namespace mission_agent::transports {
namespace {

// Largest uplink the sensor firmware's lorawan_send accepts.
constexpr std::size_t kMaxFrameBytes = 242;

class LoRaWanTransport final : public FramedTransport {
 public:
  using FramedTransport::FramedTransport;

  const char* name() const override { return "LoRaWAN"; }
  std::size_t max_frame_bytes() const override { return kMaxFrameBytes; }
};

}  // namespace

std::unique_ptr<Transport> make_lorawan_transport(std::FILE* out) { return std::make_unique<LoRaWanTransport>(out); }

}  // namespace mission_agent::transports
