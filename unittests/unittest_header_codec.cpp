
#include "errors.hpp"
#include "protocol.hpp"
#include "util.hpp"

#include <unity.h>
#include <cstring>

using namespace scanlink;

void setUp() {}

void tearDown() {}

void test_data_header_layout() {
  DataHeader h{};
  h.stream_kind = 2;
  h.frame_number = 0x01020304;
  h.shape0 = 131072;
  h.shape1 = 3;
  h.min_value = -12.5f;
  h.max_value = 40.0f;

  uint8_t buf[kHeaderSize];
  pack_header(h, buf);

  TEST_ASSERT_EQUAL_MEMORY("DATA", buf, 4);
  TEST_ASSERT_EQUAL_UINT32(2, get_u32le(buf + 4));
  // little-endian on the wire regardless of host order
  TEST_ASSERT_EQUAL_HEX8(0x04, buf[8]);
  TEST_ASSERT_EQUAL_HEX8(0x01, buf[11]);
  TEST_ASSERT_EQUAL_UINT32(131072, get_u32le(buf + 12));
  TEST_ASSERT_EQUAL_UINT32(3, get_u32le(buf + 16));
  TEST_ASSERT_EQUAL_FLOAT(-12.5f, get_f32le(buf + 20));
  TEST_ASSERT_EQUAL_FLOAT(40.0f, get_f32le(buf + 24));
  TEST_ASSERT_EQUAL_UINT32(0, get_u32le(buf + 28));
}

void test_chunk_and_end_of_frame_profiles() {
  ChunkHeader ch{};
  ch.stream_kind = 0;
  ch.frame_number = 7;
  ch.chunk_index = 1;
  ch.total_chunks = 2;
  ch.start_offset = 262144.0f;
  ch.end_offset = 524288.0f;
  ch.chunk_length = 262144;
  uint8_t buf[kHeaderSize];
  pack_header(ch, buf);
  TEST_ASSERT_EQUAL_MEMORY("CHNK", buf, 4);

  ChunkHeader back;
  std::error_code ec;
  TEST_ASSERT_TRUE(unpack_header(buf, sizeof(buf), back, ec));
  TEST_ASSERT_EQUAL_UINT32(7, back.frame_number);
  TEST_ASSERT_EQUAL_UINT32(1, back.chunk_index);
  TEST_ASSERT_EQUAL_UINT32(2, back.total_chunks);
  TEST_ASSERT_EQUAL_FLOAT(262144.0f, back.start_offset);
  TEST_ASSERT_EQUAL_FLOAT(524288.0f, back.end_offset);
  TEST_ASSERT_EQUAL_UINT32(262144, back.chunk_length);

  EndOfFrameHeader eh{};
  eh.stream_kind = 0;
  eh.frame_number = 7;
  eh.total_data_size = 524288;
  eh.total_chunks = 2;
  pack_header(eh, buf);
  TEST_ASSERT_EQUAL_MEMORY("EOFR", buf, 4);
  TEST_ASSERT_EQUAL_UINT32(524288, get_u32le(buf + 12));
  TEST_ASSERT_EQUAL_UINT32(2, get_u32le(buf + 16));
  TEST_ASSERT_EQUAL_UINT32(0, get_u32le(buf + 20));
  TEST_ASSERT_EQUAL_UINT32(0, get_u32le(buf + 24));
  TEST_ASSERT_EQUAL_UINT32(0, get_u32le(buf + 28));

  MessageType type;
  TEST_ASSERT_TRUE(peek_type(buf, sizeof(buf), type, ec));
  TEST_ASSERT_TRUE(type == MessageType::EndOfFrame);
}

void test_short_buffer_is_malformed() {
  uint8_t buf[kHeaderSize] = {'D', 'A', 'T', 'A'};
  DataHeader h;
  std::error_code ec;
  TEST_ASSERT_FALSE(unpack_header(buf, kHeaderSize - 1, h, ec));
  TEST_ASSERT_TRUE(ec == Errc::MalformedHeader);
  TEST_ASSERT_TRUE(unpack_header(buf, kHeaderSize, h, ec));
  TEST_ASSERT_FALSE(ec);
}

void test_unknown_magic_is_malformed() {
  uint8_t buf[kHeaderSize] = {'L', 'I', 'D', 'R'};
  MessageType type;
  std::error_code ec;
  TEST_ASSERT_FALSE(peek_type(buf, sizeof(buf), type, ec));
  TEST_ASSERT_TRUE(ec == Errc::MalformedHeader);
  TEST_ASSERT_EQUAL_STRING("scanlink", ec.category().name());
}

void test_profile_mismatch_is_malformed() {
  DataHeader h{};
  uint8_t buf[kHeaderSize];
  pack_header(h, buf);
  ChunkHeader ch;
  std::error_code ec;
  TEST_ASSERT_FALSE(unpack_header(buf, sizeof(buf), ch, ec));
  TEST_ASSERT_TRUE(ec == Errc::MalformedHeader);
}

void test_stream_kind_table() {
  TEST_ASSERT_EQUAL_STRING("range2d", stream_kind_info(0u)->name);
  TEST_ASSERT_EQUAL_STRING("/ws/combined2d", stream_kind_info(4u)->path);
  TEST_ASSERT_NULL(stream_kind_info(5u));
  TEST_ASSERT_NULL(stream_kind_info(static_cast<StreamKind>(99)));

  const StreamKindInfo *k = stream_kind_by_path("/ws/points3d");
  TEST_ASSERT_NOT_NULL(k);
  TEST_ASSERT_TRUE(k->kind == StreamKind::PointCloudXyz);
  TEST_ASSERT_EQUAL_UINT32(3, k->values_per_sample);
  TEST_ASSERT_NULL(stream_kind_by_path("/ws/points"));
  TEST_ASSERT_TRUE(stream_kind_by_name("reflectivity3d")->kind ==
                   StreamKind::PointCloudColor);
  TEST_ASSERT_EQUAL_INT(kStreamKindCount,
                        (int)(stream_kinds_end() - stream_kinds_begin()));
}

int main(void) {
  UNITY_BEGIN();

  RUN_TEST(test_data_header_layout);
  RUN_TEST(test_chunk_and_end_of_frame_profiles);
  RUN_TEST(test_short_buffer_is_malformed);
  RUN_TEST(test_unknown_magic_is_malformed);
  RUN_TEST(test_profile_mismatch_is_malformed);
  RUN_TEST(test_stream_kind_table);

  return UNITY_END();
}
