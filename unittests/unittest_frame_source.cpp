
#include "codec.hpp"
#include "errors.hpp"
#include "frame_source.hpp"
#include "logging.hpp"
#include "testutil.hpp"

#include <unity.h>
#include <climits>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace scanlink;

static std::string replay_path;

void setUp() {
  Logger::instance().set_level(LogLevel::ERROR);
  replay_path = "/tmp/scanlink_replay_" + std::to_string(getpid()) + ".bin";
}

void tearDown() { std::remove(replay_path.c_str()); }

static void append_frame(std::ofstream &out, const Frame &f) {
  Bytes msg;
  std::error_code ec;
  TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
  out.write((const char *)msg.data(), (std::streamsize)msg.size());
}

void test_synthetic_shapes_per_kind() {
  SyntheticOptions opts;
  opts.frames = 1;
  opts.rows = 4;
  opts.columns = 8;
  SyntheticFrameSource src(opts);

  for (auto k = stream_kinds_begin(); k != stream_kinds_end(); ++k) {
    auto cursor = src.open(k->kind);
    Frame f;
    std::error_code ec;
    TEST_ASSERT_TRUE(cursor->next(f, ec));
    TEST_ASSERT_TRUE(f.kind == k->kind);
    TEST_ASSERT_EQUAL_UINT32(0, f.frame_number);
    TEST_ASSERT_EQUAL_UINT32(32 * k->values_per_sample, f.values.size());

    Bytes msg;
    TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
  }

  Frame f;
  SyntheticFrameSource::fill(StreamKind::RangeImage, 0, opts, f);
  TEST_ASSERT_EQUAL_UINT32(4, f.shape0);
  TEST_ASSERT_EQUAL_UINT32(8, f.shape1);
  SyntheticFrameSource::fill(StreamKind::PointCloudXyz, 0, opts, f);
  TEST_ASSERT_EQUAL_UINT32(32, f.shape0);
  TEST_ASSERT_EQUAL_UINT32(3, f.shape1);
  SyntheticFrameSource::fill(StreamKind::CombinedInterleaved, 0, opts, f);
  TEST_ASSERT_EQUAL_UINT32(128, f.shape0);
  TEST_ASSERT_EQUAL_UINT32(0, f.shape1);
}

void test_synthetic_cursors_are_independent() {
  SyntheticOptions opts;
  opts.frames = 5;
  opts.rows = 2;
  opts.columns = 16;
  SyntheticFrameSource src(opts);

  auto a = src.open(StreamKind::RangeImage);
  Frame fa0, fa1, fb0;
  std::error_code ec;
  TEST_ASSERT_TRUE(a->next(fa0, ec));
  TEST_ASSERT_TRUE(a->next(fa1, ec));
  TEST_ASSERT_EQUAL_UINT32(1, fa1.frame_number);

  auto b = src.open(StreamKind::RangeImage);
  TEST_ASSERT_TRUE(b->next(fb0, ec));
  TEST_ASSERT_EQUAL_UINT32(0, fb0.frame_number);
  TEST_ASSERT_EQUAL_MEMORY(fa0.values.data(), fb0.values.data(),
                           fa0.values.size() * sizeof(float));
}

void test_synthetic_exhaustion() {
  SyntheticOptions opts;
  opts.frames = 2;
  opts.rows = 1;
  opts.columns = 4;
  auto cursor = SyntheticFrameSource(opts).open(StreamKind::ReflectivityImage);
  Frame f;
  std::error_code ec;
  TEST_ASSERT_TRUE(cursor->next(f, ec));
  TEST_ASSERT_TRUE(cursor->next(f, ec));
  TEST_ASSERT_FALSE(cursor->next(f, ec));
  TEST_ASSERT_FALSE(ec);
}

void test_replay_filters_by_kind() {
  {
    std::ofstream out(replay_path, std::ios::binary);
    append_frame(out, test::make_frame(StreamKind::RangeImage, 0, 2, 3));
    append_frame(out, test::make_frame(StreamKind::PointCloudXyz, 0, 5, 3));
    append_frame(out, test::make_frame(StreamKind::RangeImage, 1, 2, 3));
  }
  ReplayFrameSource src(replay_path);

  auto range = src.open(StreamKind::RangeImage);
  Frame f;
  std::error_code ec;
  TEST_ASSERT_TRUE(range->next(f, ec));
  TEST_ASSERT_EQUAL_UINT32(0, f.frame_number);
  TEST_ASSERT_TRUE(range->next(f, ec));
  TEST_ASSERT_EQUAL_UINT32(1, f.frame_number);
  TEST_ASSERT_EQUAL_UINT32(6, f.values.size());
  TEST_ASSERT_EQUAL_FLOAT(-3.0f, f.values[0]);
  TEST_ASSERT_FALSE(range->next(f, ec));
  TEST_ASSERT_FALSE(ec);

  auto points = src.open(StreamKind::PointCloudXyz);
  TEST_ASSERT_TRUE(points->next(f, ec));
  TEST_ASSERT_EQUAL_UINT32(15, f.values.size());
  TEST_ASSERT_FALSE(points->next(f, ec));
}

void test_replay_truncated_file_reports_error() {
  {
    std::ofstream out(replay_path, std::ios::binary);
    Bytes msg;
    std::error_code ec;
    TEST_ASSERT_TRUE(
        encode_frame(test::make_frame(StreamKind::RangeImage, 0, 4, 4), msg, ec));
    out.write((const char *)msg.data(), (std::streamsize)(msg.size() - 8));
  }
  auto cursor = ReplayFrameSource(replay_path).open(StreamKind::RangeImage);
  Frame f;
  std::error_code ec;
  TEST_ASSERT_FALSE(cursor->next(f, ec));
  TEST_ASSERT_TRUE(ec == Errc::SizeMismatch);
}

void test_replay_missing_file_reports_error() {
  auto cursor =
      ReplayFrameSource("/nonexistent/scanlink.bin").open(StreamKind::RangeImage);
  Frame f;
  std::error_code ec;
  TEST_ASSERT_FALSE(cursor->next(f, ec));
  TEST_ASSERT_TRUE((bool)ec);
}

void test_synthetic_rejects_bad_geometry() {
  std::string why;
  SyntheticOptions opts;
  TEST_ASSERT_TRUE(validate_synthetic(opts, why));

  opts.rows = 0;
  TEST_ASSERT_FALSE(validate_synthetic(opts, why));
  TEST_ASSERT_FALSE(why.empty());

  // 65536 x 65536 wraps a 32-bit sample count to zero
  opts.rows = 65536;
  opts.columns = 65536;
  TEST_ASSERT_FALSE(validate_synthetic(opts, why));
  Frame f;
  TEST_ASSERT_FALSE(
      SyntheticFrameSource::fill(StreamKind::CombinedInterleaved, 0, opts, f));
  TEST_ASSERT_EQUAL_UINT32(0, f.values.size());

  opts.frames = 3;
  auto cursor = SyntheticFrameSource(opts).open(StreamKind::RangeImage);
  std::error_code ec;
  TEST_ASSERT_FALSE(cursor->next(f, ec));
  TEST_ASSERT_TRUE(ec == Errc::SizeMismatch);

  // largest scan whose combined message still fits
  opts.rows = 1;
  opts.columns = (UINT32_MAX - kHeaderSize) / 16;
  TEST_ASSERT_TRUE(validate_synthetic(opts, why));
  opts.columns++;
  TEST_ASSERT_FALSE(validate_synthetic(opts, why));
}

static void write_header_only(uint32_t kind, uint32_t shape0, uint32_t shape1) {
  std::ofstream out(replay_path, std::ios::binary);
  DataHeader h{};
  h.stream_kind = kind;
  h.shape0 = shape0;
  h.shape1 = shape1;
  uint8_t raw[kHeaderSize];
  pack_header(h, raw);
  out.write((const char *)raw, sizeof(raw));
}

void test_replay_oversized_header_reports_error() {
  write_header_only(0, 0xFFFFFFFF, 0xFFFF);
  auto cursor = ReplayFrameSource(replay_path).open(StreamKind::RangeImage);
  Frame f;
  std::error_code ec;
  TEST_ASSERT_FALSE(cursor->next(f, ec));
  TEST_ASSERT_TRUE(ec == Errc::SizeMismatch);

  // a size the file cannot hold is refused before anything is read
  write_header_only(0, 1 << 20, 4);
  cursor = ReplayFrameSource(replay_path).open(StreamKind::RangeImage);
  TEST_ASSERT_FALSE(cursor->next(f, ec));
  TEST_ASSERT_TRUE(ec == Errc::SizeMismatch);

  // same when skipping a frame of another kind
  write_header_only(2, 0xFFFFFFFF, 0xFFFF);
  cursor = ReplayFrameSource(replay_path).open(StreamKind::RangeImage);
  TEST_ASSERT_FALSE(cursor->next(f, ec));
  TEST_ASSERT_TRUE(ec == Errc::SizeMismatch);
}

int main(void) {
  UNITY_BEGIN();

  RUN_TEST(test_synthetic_shapes_per_kind);
  RUN_TEST(test_synthetic_cursors_are_independent);
  RUN_TEST(test_synthetic_exhaustion);
  RUN_TEST(test_replay_filters_by_kind);
  RUN_TEST(test_replay_truncated_file_reports_error);
  RUN_TEST(test_replay_missing_file_reports_error);
  RUN_TEST(test_synthetic_rejects_bad_geometry);
  RUN_TEST(test_replay_oversized_header_reports_error);

  return UNITY_END();
}
