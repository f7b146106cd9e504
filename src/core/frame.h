#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// One radar detection in metres, sensor-relative until registered.
struct Point {
  float x{0.0f};
  float y{0.0f};
  float z{0.0f};
  float doppler{0.0f};  // m/s, signed (negative = approaching)
  float snr{0.0f};

  bool operator==(const Point&) const = default;
};

struct Frame {
  uint32_t seq{0};
  double t{0.0};                 // seconds
  std::vector<Point> points;

  bool operator==(const Frame&) const = default;
};

// Binary frame encoding shared by the wire envelope and the archive file.
//   [u32 seq][f64 t][u32 count][count x (f32 x, y, z, doppler, snr)]
// All fields big-endian; floats are copied as raw IEEE-754 bit patterns.
constexpr size_t kFrameHeaderBytes = 16;
constexpr size_t kPointBytes = 20;

std::string encode_frame(const Frame& f);
void encode_frame_into(const Frame& f, std::string& out);

// Throws MalformedFrame if the byte length does not match the point count.
Frame decode_frame(std::string_view bytes);

// Big-endian helpers, also used by io/wire and io/archive.
namespace bytes {

void put_u32(std::string& out, uint32_t v);
void put_u64(std::string& out, uint64_t v);
void put_f32(std::string& out, float v);
void put_f64(std::string& out, double v);

uint32_t get_u32(const char* p);
uint64_t get_u64(const char* p);
float get_f32(const char* p);
double get_f64(const char* p);

} // namespace bytes
