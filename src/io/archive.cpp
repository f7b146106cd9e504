#include "archive.h"
#include "core/errors.h"
#include <cstring>
#include <filesystem>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

ArchiveContents read_archive(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw ArchiveCorrupt("cannot open archive " + path);
  }
  const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw ArchiveCorrupt("read error on archive " + path);
  }

  if (data.size() < archive::kHeaderBytes ||
      std::memcmp(data.data(), archive::kMagic, sizeof(archive::kMagic)) != 0) {
    throw ArchiveCorrupt(path + ": not a radarbay archive");
  }
  const uint32_t version = bytes::get_u32(data.data() + 4);
  if (version != archive::kVersion) {
    throw ArchiveCorrupt(path + ": unsupported archive version " + std::to_string(version));
  }

  ArchiveContents out;
  out.meta = wire::get_handshake_body(data.data() + 8);

  size_t pos = archive::kHeaderBytes;
  while (pos < data.size()) {
    const size_t index = out.frames.size();
    if (data.size() - pos < 4) {
      throw ArchiveCorrupt(path + ": truncated length of record " + std::to_string(index));
    }
    const uint32_t len = bytes::get_u32(data.data() + pos);
    pos += 4;
    if (len > wire::kMaxPayloadBytes || data.size() - pos < len) {
      throw ArchiveCorrupt(path + ": truncated record " + std::to_string(index));
    }

    Frame f;
    try {
      f = decode_frame(std::string_view(data.data() + pos, len));
    } catch (const MalformedFrame& e) {
      throw ArchiveCorrupt(path + ": record " + std::to_string(index) + ": " + e.what());
    }
    pos += len;

    if (!out.frames.empty() && f.seq <= out.frames.back().seq) {
      throw ArchiveCorrupt(path + ": sequence " + std::to_string(f.seq) + " after " +
                           std::to_string(out.frames.back().seq));
    }
    out.frames.push_back(std::move(f));
  }
  return out;
}

ArchiveWriter::~ArchiveWriter() {
  if (out_.is_open()) {
    out_.close();
  }
}

void ArchiveWriter::open(const std::string& path, const Handshake& meta) {
  close();
  out_.open(path, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw StorageError("cannot create recording " + path);
  }
  path_ = path;
  frames_ = 0;

  std::string hdr(archive::kMagic, sizeof(archive::kMagic));
  bytes::put_u32(hdr, archive::kVersion);
  wire::put_handshake_body(hdr, meta);
  out_.write(hdr.data(), static_cast<std::streamsize>(hdr.size()));
  out_.flush();
  if (!out_) {
    throw StorageError("write failed on " + path_);
  }
  std::cout << "[Archive] recording to " << path_ << std::endl;
}

void ArchiveWriter::append(const Frame& f) {
  if (!out_.is_open()) {
    throw StorageError("recording is not open");
  }
  std::string rec;
  bytes::put_u32(rec, 0);
  encode_frame_into(f, rec);
  std::string lenBytes;
  bytes::put_u32(lenBytes, static_cast<uint32_t>(rec.size() - 4));
  rec.replace(0, 4, lenBytes);

  out_.write(rec.data(), static_cast<std::streamsize>(rec.size()));
  out_.flush();
  if (!out_) {
    throw StorageError("write failed on " + path_ + " at frame seq=" + std::to_string(f.seq));
  }
  ++frames_;
}

void ArchiveWriter::close() {
  if (!out_.is_open()) return;
  out_.flush();
  const bool ok = static_cast<bool>(out_);
  out_.close();
  std::cout << "[Archive] closed " << path_ << " (" << frames_ << " frames)" << std::endl;
  if (!ok) {
    throw StorageError("flush failed on " + path_);
  }
}

std::string next_recording_path(const std::string& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw StorageError("cannot create recording directory " + dir + ": " + ec.message());
  }

  size_t existing = 0;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".rbar") ++existing;
  }
  if (ec) {
    throw StorageError("cannot list recording directory " + dir + ": " + ec.message());
  }

  // Skip numbers already taken when older recordings were deleted.
  for (size_t n = existing + 1;; ++n) {
    const fs::path p = fs::path(dir) / ("Recording" + std::to_string(n) + ".rbar");
    if (!fs::exists(p)) return p.string();
  }
}
