#include "wire.h"
#include "core/errors.h"
#include <cstring>

namespace wire {

void put_handshake_body(std::string& out, const Handshake& h) {
  bytes::put_f32(out, h.x_extent);
  bytes::put_f32(out, h.y_extent);
  bytes::put_f32(out, h.sensor_height);
}

Handshake get_handshake_body(const char* p) {
  return Handshake{bytes::get_f32(p), bytes::get_f32(p + 4), bytes::get_f32(p + 8)};
}

std::string encode_handshake(const Handshake& h) {
  std::string out(kHandshakeMagic, sizeof(kHandshakeMagic));
  put_handshake_body(out, h);
  return out;
}

Handshake decode_handshake(std::string_view in) {
  if (in.size() < kHandshakeBytes) {
    throw ProtocolDesync("short handshake (" + std::to_string(in.size()) + " bytes)");
  }
  if (std::memcmp(in.data(), kHandshakeMagic, sizeof(kHandshakeMagic)) != 0) {
    throw ProtocolDesync("handshake magic mismatch");
  }
  return get_handshake_body(in.data() + 4);
}

std::string encode_envelope(const Frame& f) {
  std::string out(kFrameMagic, sizeof(kFrameMagic));
  out.reserve(kEnvelopeHeaderBytes + kFrameHeaderBytes + kPointBytes * f.points.size());
  bytes::put_u32(out, 0); // length, patched below
  bytes::put_u32(out, f.seq);
  encode_frame_into(f, out);

  const uint32_t len = static_cast<uint32_t>(out.size() - kEnvelopeHeaderBytes);
  std::string lenBytes;
  bytes::put_u32(lenBytes, len);
  out.replace(4, 4, lenBytes);
  return out;
}

EnvelopeHeader decode_envelope_header(std::string_view in) {
  if (in.size() < kEnvelopeHeaderBytes) {
    throw ProtocolDesync("short envelope header");
  }
  if (std::memcmp(in.data(), kFrameMagic, sizeof(kFrameMagic)) != 0) {
    throw ProtocolDesync("envelope magic mismatch");
  }
  EnvelopeHeader hdr;
  hdr.length = bytes::get_u32(in.data() + 4);
  hdr.seq = bytes::get_u32(in.data() + 8);
  if (hdr.length > kMaxPayloadBytes) {
    throw ProtocolDesync("envelope payload length " + std::to_string(hdr.length) + " exceeds limit");
  }
  return hdr;
}

Frame decode_envelope_payload(const EnvelopeHeader& hdr, std::string_view payload) {
  if (payload.size() != hdr.length) {
    throw MalformedFrame("payload is " + std::to_string(payload.size()) +
                         " bytes, envelope says " + std::to_string(hdr.length));
  }
  Frame f = decode_frame(payload);
  if (f.seq != hdr.seq) {
    throw MalformedFrame("envelope seq=" + std::to_string(hdr.seq) +
                         " carries frame seq=" + std::to_string(f.seq));
  }
  return f;
}

} // namespace wire
