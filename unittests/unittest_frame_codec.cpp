
#include "codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "testutil.hpp"

#include <unity.h>
#include <cmath>
#include <limits>

using namespace scanlink;

void setUp() {}

void tearDown() {}

void test_encode_decode_preserves_frame() {
  Frame f = test::make_frame(StreamKind::RangeImage, 42, 4, 3);
  f.values[5] = -17.25f;
  f.values[9] = 1e6f;

  Bytes msg;
  std::error_code ec;
  TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
  TEST_ASSERT_EQUAL_UINT32(kHeaderSize + 12 * 4, msg.size());

  DecodedFrame d;
  TEST_ASSERT_TRUE(decode_frame(msg.data(), msg.size(), d, ec));
  TEST_ASSERT_EQUAL_UINT32(0, d.hdr.stream_kind);
  TEST_ASSERT_EQUAL_UINT32(42, d.hdr.frame_number);
  TEST_ASSERT_EQUAL_UINT32(4, d.hdr.shape0);
  TEST_ASSERT_EQUAL_UINT32(3, d.hdr.shape1);
  TEST_ASSERT_EQUAL_FLOAT(-17.25f, d.hdr.min_value);
  TEST_ASSERT_EQUAL_FLOAT(1e6f, d.hdr.max_value);
  TEST_ASSERT_EQUAL_UINT32(0, d.hdr.reserved);
  TEST_ASSERT_EQUAL_UINT32(f.values.size(), d.values.size());
  TEST_ASSERT_EQUAL_MEMORY(f.values.data(), d.values.data(),
                           f.values.size() * sizeof(float));
}

void test_one_dimensional_shape() {
  Frame f = test::make_frame(StreamKind::CombinedInterleaved, 0, 40, 0);
  Bytes msg;
  std::error_code ec;
  TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
  TEST_ASSERT_EQUAL_UINT32(kHeaderSize + 40 * 4, msg.size());
  TEST_ASSERT_EQUAL_UINT32(4, get_u32le(msg.data() + 4));
  TEST_ASSERT_EQUAL_UINT32(0, get_u32le(msg.data() + 16));
  // payload is little-endian float32 in row-major order
  TEST_ASSERT_EQUAL_FLOAT(f.values[1], get_f32le(msg.data() + kHeaderSize + 4));
}

void test_supplied_min_max_are_kept() {
  Frame f = test::make_frame(StreamKind::ReflectivityImage, 1, 2, 2);
  f.min_value = 0.0f;
  f.max_value = 255.0f;
  Bytes msg;
  std::error_code ec;
  TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
  TEST_ASSERT_EQUAL_FLOAT(0.0f, get_f32le(msg.data() + 20));
  TEST_ASSERT_EQUAL_FLOAT(255.0f, get_f32le(msg.data() + 24));
}

void test_nan_sample_makes_bounds_nan() {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const size_t positions[] = {0, 2, 5};
  for (size_t pos : positions) {
    Frame f = test::make_frame(StreamKind::RangeImage, 0, 2, 3);
    f.values[pos] = nan;
    Bytes msg;
    std::error_code ec;
    TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
    TEST_ASSERT_TRUE(std::isnan(get_f32le(msg.data() + 20)));
    TEST_ASSERT_TRUE(std::isnan(get_f32le(msg.data() + 24)));
  }

  // supplied bounds still win
  Frame f = test::make_frame(StreamKind::RangeImage, 0, 2, 3);
  f.values[1] = nan;
  f.min_value = -1.0f;
  f.max_value = 1.0f;
  Bytes msg;
  std::error_code ec;
  TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
  TEST_ASSERT_EQUAL_FLOAT(-1.0f, get_f32le(msg.data() + 20));
  TEST_ASSERT_EQUAL_FLOAT(1.0f, get_f32le(msg.data() + 24));
}

void test_empty_frame() {
  Frame f;
  f.kind = StreamKind::PointCloudXyz;
  f.shape0 = 0;
  f.shape1 = 3;
  Bytes msg;
  std::error_code ec;
  TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
  TEST_ASSERT_EQUAL_UINT32(kHeaderSize, msg.size());
  TEST_ASSERT_EQUAL_FLOAT(0.0f, get_f32le(msg.data() + 20));
  TEST_ASSERT_EQUAL_FLOAT(0.0f, get_f32le(msg.data() + 24));

  DecodedFrame d;
  TEST_ASSERT_TRUE(decode_frame(msg.data(), msg.size(), d, ec));
  TEST_ASSERT_EQUAL_UINT32(0, d.values.size());
}

void test_unknown_stream_kind_produces_no_message() {
  Frame f = test::make_frame(static_cast<StreamKind>(7), 0, 2, 2);
  Bytes msg(10, 0xAA);
  std::error_code ec;
  TEST_ASSERT_FALSE(encode_frame(f, msg, ec));
  TEST_ASSERT_TRUE(ec == Errc::UnknownStreamKind);
  TEST_ASSERT_TRUE(msg.empty());
}

void test_shape_mismatch_rejected() {
  Frame f = test::make_frame(StreamKind::RangeImage, 0, 4, 4);
  f.values.pop_back();
  Bytes msg;
  std::error_code ec;
  TEST_ASSERT_FALSE(encode_frame(f, msg, ec));
  TEST_ASSERT_TRUE(ec == Errc::SizeMismatch);
  TEST_ASSERT_TRUE(msg.empty());
}

void test_decode_rejects_truncated_payload() {
  Frame f = test::make_frame(StreamKind::RangeImage, 0, 8, 8);
  Bytes msg;
  std::error_code ec;
  TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
  msg.resize(msg.size() - 4);

  DecodedFrame d;
  TEST_ASSERT_FALSE(decode_frame(msg.data(), msg.size(), d, ec));
  TEST_ASSERT_TRUE(ec == Errc::SizeMismatch);
}

void test_decode_rejects_unknown_kind() {
  Bytes msg = test::make_raw_message(9, 0, 16);
  DecodedFrame d;
  std::error_code ec;
  TEST_ASSERT_FALSE(decode_frame(msg.data(), msg.size(), d, ec));
  TEST_ASSERT_TRUE(ec == Errc::UnknownStreamKind);
}

void test_decode_rejects_chunk_message() {
  ChunkHeader ch{};
  uint8_t buf[kHeaderSize];
  pack_header(ch, buf);
  DecodedFrame d;
  std::error_code ec;
  TEST_ASSERT_FALSE(decode_frame(buf, sizeof(buf), d, ec));
  TEST_ASSERT_TRUE(ec == Errc::MalformedHeader);
}

int main(void) {
  UNITY_BEGIN();

  RUN_TEST(test_encode_decode_preserves_frame);
  RUN_TEST(test_one_dimensional_shape);
  RUN_TEST(test_supplied_min_max_are_kept);
  RUN_TEST(test_nan_sample_makes_bounds_nan);
  RUN_TEST(test_empty_frame);
  RUN_TEST(test_unknown_stream_kind_produces_no_message);
  RUN_TEST(test_shape_mismatch_rejected);
  RUN_TEST(test_decode_rejects_truncated_payload);
  RUN_TEST(test_decode_rejects_unknown_kind);
  RUN_TEST(test_decode_rejects_chunk_message);

  return UNITY_END();
}
