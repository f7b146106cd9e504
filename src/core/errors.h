#pragma once
#include <stdexcept>
#include <string>

// Decode-time structural violation of a single frame. The frame is dropped.
struct MalformedFrame : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Magic or length mismatch on the wire. The client reconnects.
struct ProtocolDesync : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Transport-level disconnect, or reconnection gave up.
struct ConnectionLost : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Playback archive failed validation. Fatal at session start.
struct ArchiveCorrupt : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Recording target could not be written.
struct StorageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};
