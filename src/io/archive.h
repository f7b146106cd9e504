#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>
#include "core/frame.h"
#include "io/wire.h"

// Recording file:
//   [4 bytes "RBAR"][u32 version][handshake body]
//   then per frame [u32 length][encoded frame]
namespace archive {
inline constexpr char kMagic[4] = {'R', 'B', 'A', 'R'};
inline constexpr uint32_t kVersion = 1;
inline constexpr size_t kHeaderBytes = 8 + wire::kHandshakeBodyBytes;
}

struct ArchiveContents {
  Handshake meta;
  std::vector<Frame> frames;
};

// Reads and validates a whole archive. Throws ArchiveCorrupt on a missing or
// unreadable file, bad header, truncated or undecodable record, or a
// sequence number that does not strictly increase.
ArchiveContents read_archive(const std::string& path);

class ArchiveWriter {
public:
  ArchiveWriter() = default;
  ArchiveWriter(const std::string& path, const Handshake& meta) { open(path, meta); }
  ~ArchiveWriter();

  ArchiveWriter(const ArchiveWriter&) = delete;
  ArchiveWriter& operator=(const ArchiveWriter&) = delete;

  // All three throw StorageError when the file cannot be written.
  void open(const std::string& path, const Handshake& meta);
  void append(const Frame& f);
  void close();

  bool isOpen() const { return out_.is_open(); }
  const std::string& path() const { return path_; }
  uint64_t framesWritten() const { return frames_; }

private:
  std::ofstream out_;
  std::string path_;
  uint64_t frames_{0};
};

// <dir>/Recording<N>.rbar with N one past the recordings already there.
// Creates dir when missing; throws StorageError when it cannot.
std::string next_recording_path(const std::string& dir);
