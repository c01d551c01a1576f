#include "transports/framed.hpp"

namespace mission_agent::transports {
namespace {

// Frame length travels in a single byte on the RF link.
constexpr std::size_t kMaxFrameBytes = 255;

class GibberLinkRfTransport final : public FramedTransport {
 public:
  using FramedTransport::FramedTransport;

  const char* name() const override { return "GibberLink-RF"; }
  std::size_t max_frame_bytes() const override { return kMaxFrameBytes; }
};

}  // namespace

std::unique_ptr<Transport> make_gibberlink_rf_transport(std::FILE* out) { return std::make_unique<GibberLinkRfTransport>(out); }

}  // namespace mission_agent::transports
