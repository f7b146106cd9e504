#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include <iterator>
#include <thread>
#include "core/errors.h"
#include "core/session_source.h"
#include "io/archive.h"
#include "test_util.h"

using testutil::make_frame;

namespace {

const Handshake kMeta{6.0f, 9.0f, 2.5f};

std::vector<Frame> three_frames() {
  return {make_frame(1, 0.0, {{1, 2, 0, 0, 5}}),
          make_frame(2, 0.1),
          make_frame(4, 0.2, {{0, 1, 0, -1, 3}, {0, 1.5f, 0, -1, 3}})};
}

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::string& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

SessionConfig playback(const std::string& path) {
  SessionConfig s;
  s.mode = SessionMode::Playback;
  s.archive = path;
  return s;
}

} // namespace

TEST(Archive, WriteThenReadBack) {
  testutil::TempDir dir;
  const std::string path = dir.file("a.rbar");
  testutil::write_archive(path, kMeta, three_frames());

  const ArchiveContents c = read_archive(path);
  EXPECT_EQ(c.meta, kMeta);
  EXPECT_EQ(c.frames, three_frames());

  const std::string raw = read_file(path);
  EXPECT_EQ(raw.substr(0, 4), "RBAR");
  EXPECT_EQ(bytes::get_u32(raw.data() + 4), archive::kVersion);
}

TEST(Archive, HeaderOnlyArchiveHasNoFrames) {
  testutil::TempDir dir;
  const std::string path = dir.file("empty.rbar");
  testutil::write_archive(path, kMeta, {});
  const ArchiveContents c = read_archive(path);
  EXPECT_TRUE(c.frames.empty());
  EXPECT_EQ(c.meta, kMeta);
}

TEST(Archive, CorruptionIsDetected) {
  testutil::TempDir dir;
  const std::string path = dir.file("a.rbar");
  testutil::write_archive(path, kMeta, three_frames());
  const std::string good = read_file(path);

  EXPECT_THROW(read_archive(dir.file("missing.rbar")), ArchiveCorrupt);

  write_file(path, "XXXX" + good.substr(4));
  EXPECT_THROW(read_archive(path), ArchiveCorrupt);

  std::string version = good;
  version[7] = 9;
  write_file(path, version);
  EXPECT_THROW(read_archive(path), ArchiveCorrupt);

  write_file(path, good.substr(0, good.size() - 3));
  EXPECT_THROW(read_archive(path), ArchiveCorrupt);

  write_file(path, good.substr(0, good.size() - 2 * kPointBytes - kFrameHeaderBytes - 2));
  EXPECT_THROW(read_archive(path), ArchiveCorrupt);
}

TEST(Archive, SequenceMustIncrease) {
  testutil::TempDir dir;
  const std::string path = dir.file("a.rbar");
  testutil::write_archive(path, kMeta, {make_frame(5, 0.0), make_frame(5, 0.1)});
  EXPECT_THROW(read_archive(path), ArchiveCorrupt);
}

TEST(Archive, WriterRejectsAppendWhenClosed) {
  ArchiveWriter w;
  EXPECT_FALSE(w.isOpen());
  EXPECT_THROW(w.append(make_frame(1, 0.0)), StorageError);
  EXPECT_THROW(w.open("/nonexistent-dir/x/y.rbar", kMeta), StorageError);
}

TEST(Archive, RecordingNamesCountExistingFiles) {
  testutil::TempDir dir;
  const std::string rec = dir.file("recordings");
  const std::string first = next_recording_path(rec);
  EXPECT_EQ(std::filesystem::path(first).filename(), "Recording1.rbar");
  testutil::write_archive(first, kMeta, {});
  testutil::write_archive((std::filesystem::path(rec) / "Recording3.rbar").string(), kMeta, {});
  // Two recordings exist; Recording3 is taken, so the next free name is 4.
  EXPECT_EQ(std::filesystem::path(next_recording_path(rec)).filename(), "Recording4.rbar");
}

TEST(PlaybackSession, ReturnsFramesInOrderThenEnds) {
  testutil::TempDir dir;
  const std::string path = dir.file("a.rbar");
  testutil::write_archive(path, kMeta, three_frames());

  PlaybackConfig pc;
  pc.realtime_pacing = false;
  auto src = SessionSource::open(playback(path), pc);
  EXPECT_EQ(src->mode(), SessionMode::Playback);
  EXPECT_EQ(src->metadata(), kMeta);

  std::vector<Frame> got;
  while (auto f = src->nextFrame()) got.push_back(*f);
  EXPECT_EQ(got, three_frames());
  EXPECT_FALSE(src->nextFrame().has_value());
  EXPECT_EQ(src->stats().frames, 3u);
}

TEST(PlaybackSession, CorruptArchiveFailsAtOpen) {
  testutil::TempDir dir;
  const std::string path = dir.file("bad.rbar");
  write_file(path, "RBAR");
  EXPECT_THROW(SessionSource::open(playback(path)), ArchiveCorrupt);
  EXPECT_THROW(SessionSource::open(playback("")), ConfigError);
}

TEST(PlaybackSession, ExplicitExtentsOverrideTheHeader) {
  testutil::TempDir dir;
  const std::string path = dir.file("a.rbar");
  testutil::write_archive(path, kMeta, three_frames());
  SessionConfig s = playback(path);
  s.x_extent = 4.0f;
  s.y_extent = 4.0f;
  s.sensor_height = 1.0f;
  s.x_explicit = s.y_explicit = s.height_explicit = true;
  auto src = SessionSource::open(s);
  EXPECT_EQ(src->metadata(), (Handshake{4.0f, 4.0f, 1.0f}));
}

TEST(PlaybackSession, SingleExplicitExtentKeepsTheOthersFromTheHeader) {
  testutil::TempDir dir;
  const std::string path = dir.file("a.rbar");
  testutil::write_archive(path, kMeta, three_frames());
  SessionConfig s = playback(path);
  s.sensor_height = 1.25f;
  s.height_explicit = true;
  auto src = SessionSource::open(s);
  EXPECT_EQ(src->metadata(), (Handshake{kMeta.x_extent, kMeta.y_extent, 1.25f}));
}

TEST(PlaybackSession, PacingFollowsRecordedTimestamps) {
  testutil::TempDir dir;
  const std::string path = dir.file("a.rbar");
  testutil::write_archive(path, kMeta, three_frames());

  auto src = SessionSource::open(playback(path));
  const auto t0 = std::chrono::steady_clock::now();
  int n = 0;
  while (src->nextFrame()) ++n;
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  EXPECT_EQ(n, 3);
  EXPECT_GE(elapsed, std::chrono::milliseconds(180));

  PlaybackConfig fast;
  fast.speed = 4.0f;
  auto src2 = SessionSource::open(playback(path), fast);
  const auto t1 = std::chrono::steady_clock::now();
  while (src2->nextFrame()) {}
  EXPECT_LT(std::chrono::steady_clock::now() - t1, std::chrono::milliseconds(150));
}

TEST(PlaybackSession, RequestStopInterruptsPacing) {
  testutil::TempDir dir;
  const std::string path = dir.file("slow.rbar");
  testutil::write_archive(path, kMeta, {make_frame(1, 0.0), make_frame(2, 30.0)});

  auto src = SessionSource::open(playback(path));
  ASSERT_TRUE(src->nextFrame().has_value());

  std::thread stopper([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    src->requestStop();
  });
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(src->nextFrame().has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(5));
  stopper.join();
}

TEST(PlaybackSession, CloseEndsTheSession) {
  testutil::TempDir dir;
  const std::string path = dir.file("a.rbar");
  testutil::write_archive(path, kMeta, three_frames());
  PlaybackConfig pc;
  pc.realtime_pacing = false;
  auto src = SessionSource::open(playback(path), pc);
  src->close();
  EXPECT_FALSE(src->nextFrame().has_value());
  src->close();
}
