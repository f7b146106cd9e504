#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include "core/frame.h"

// Deployment geometry sent once per connection and stored at the head of
// every archive, so the viewer registers points the way the node was set up.
struct Handshake {
  float x_extent{0.0f};
  float y_extent{0.0f};
  float sensor_height{0.0f};

  bool operator==(const Handshake&) const = default;
};

namespace wire {

// Handshake: [4 bytes "RBHS"][f32 x_extent][f32 y_extent][f32 sensor_height]
// Envelope:  [4 bytes "RBFR"][u32 payload length][u32 sequence][payload]
inline constexpr char kHandshakeMagic[4] = {'R', 'B', 'H', 'S'};
inline constexpr char kFrameMagic[4]     = {'R', 'B', 'F', 'R'};
inline constexpr size_t kHandshakeBodyBytes   = 12;
inline constexpr size_t kHandshakeBytes       = 4 + kHandshakeBodyBytes;
inline constexpr size_t kEnvelopeHeaderBytes  = 12;
inline constexpr uint32_t kMaxPayloadBytes    = 16u << 20;

void put_handshake_body(std::string& out, const Handshake& h);
Handshake get_handshake_body(const char* p);

std::string encode_handshake(const Handshake& h);
// Throws ProtocolDesync on a short buffer or wrong magic.
Handshake decode_handshake(std::string_view bytes);

std::string encode_envelope(const Frame& f);

struct EnvelopeHeader {
  uint32_t length{0};
  uint32_t seq{0};
};

// Throws ProtocolDesync on wrong magic or a length above kMaxPayloadBytes.
EnvelopeHeader decode_envelope_header(std::string_view bytes);

// Throws MalformedFrame when the payload does not decode or disagrees with
// the envelope sequence number.
Frame decode_envelope_payload(const EnvelopeHeader& hdr, std::string_view payload);

} // namespace wire
