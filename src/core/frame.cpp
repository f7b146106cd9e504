#include "frame.h"
#include "errors.h"
#include <cstring>

namespace bytes {

void put_u32(std::string& out, uint32_t v) {
  out.push_back(char((v >> 24) & 0xff));
  out.push_back(char((v >> 16) & 0xff));
  out.push_back(char((v >> 8) & 0xff));
  out.push_back(char(v & 0xff));
}

void put_u64(std::string& out, uint64_t v) {
  put_u32(out, static_cast<uint32_t>(v >> 32));
  put_u32(out, static_cast<uint32_t>(v & 0xffffffffULL));
}

void put_f32(std::string& out, float v) {
  uint32_t u;
  std::memcpy(&u, &v, sizeof(u));
  put_u32(out, u);
}

void put_f64(std::string& out, double v) {
  uint64_t u;
  std::memcpy(&u, &v, sizeof(u));
  put_u64(out, u);
}

uint32_t get_u32(const char* p) {
  const auto* b = reinterpret_cast<const unsigned char*>(p);
  return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) |
         (uint32_t(b[2]) << 8)  |  uint32_t(b[3]);
}

uint64_t get_u64(const char* p) {
  return (uint64_t(get_u32(p)) << 32) | uint64_t(get_u32(p + 4));
}

float get_f32(const char* p) {
  const uint32_t u = get_u32(p);
  float v;
  std::memcpy(&v, &u, sizeof(v));
  return v;
}

double get_f64(const char* p) {
  const uint64_t u = get_u64(p);
  double v;
  std::memcpy(&v, &u, sizeof(v));
  return v;
}

} // namespace bytes

void encode_frame_into(const Frame& f, std::string& out) {
  out.reserve(out.size() + kFrameHeaderBytes + kPointBytes * f.points.size());
  bytes::put_u32(out, f.seq);
  bytes::put_f64(out, f.t);
  bytes::put_u32(out, static_cast<uint32_t>(f.points.size()));
  for (const auto& p : f.points) {
    bytes::put_f32(out, p.x);
    bytes::put_f32(out, p.y);
    bytes::put_f32(out, p.z);
    bytes::put_f32(out, p.doppler);
    bytes::put_f32(out, p.snr);
  }
}

std::string encode_frame(const Frame& f) {
  std::string out;
  encode_frame_into(f, out);
  return out;
}

Frame decode_frame(std::string_view in) {
  if (in.size() < kFrameHeaderBytes) {
    throw MalformedFrame("frame payload of " + std::to_string(in.size()) +
                         " bytes is shorter than the header");
  }
  const char* p = in.data();

  Frame f;
  f.seq = bytes::get_u32(p);
  f.t = bytes::get_f64(p + 4);
  const uint32_t count = bytes::get_u32(p + 12);

  const uint64_t expected = kFrameHeaderBytes + uint64_t(kPointBytes) * count;
  if (in.size() != expected) {
    throw MalformedFrame("frame seq=" + std::to_string(f.seq) + " declares " +
                         std::to_string(count) + " points (" + std::to_string(expected) +
                         " bytes) but carries " + std::to_string(in.size()) + " bytes");
  }

  f.points.resize(count);
  p += kFrameHeaderBytes;
  for (auto& pt : f.points) {
    pt.x       = bytes::get_f32(p);
    pt.y       = bytes::get_f32(p + 4);
    pt.z       = bytes::get_f32(p + 8);
    pt.doppler = bytes::get_f32(p + 12);
    pt.snr     = bytes::get_f32(p + 16);
    p += kPointBytes;
  }
  return f;
}
