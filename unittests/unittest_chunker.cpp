
#include "chunker.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "testutil.hpp"

#include <unity.h>

using namespace scanlink;

void setUp() {}

void tearDown() {}

static MessageType type_of(const Bytes &m) {
  MessageType t = MessageType::Data;
  std::error_code ec;
  TEST_ASSERT_TRUE(peek_type(m.data(), m.size(), t, ec));
  return t;
}

void test_small_message_passes_through() {
  Bytes msg = test::make_raw_message(0, 3, 1024);
  Chunker chunker(ChunkPlan{});
  std::vector<Bytes> parts;
  std::error_code ec;
  TEST_ASSERT_TRUE(chunker.split(msg, parts, ec));
  TEST_ASSERT_EQUAL_UINT32(1, parts.size());
  TEST_ASSERT_TRUE(parts[0] == msg);
}

void test_message_at_threshold_not_chunked() {
  // 32 + 524,256 == 524,288: the comparison is strictly greater-than
  Bytes msg = test::make_raw_message(1, 0, kMaxMessageSize - kHeaderSize);
  TEST_ASSERT_EQUAL_UINT32(kMaxMessageSize, msg.size());
  Chunker chunker(ChunkPlan{});
  std::vector<Bytes> parts;
  std::error_code ec;
  TEST_ASSERT_TRUE(chunker.split(msg, parts, ec));
  TEST_ASSERT_EQUAL_UINT32(1, parts.size());
  TEST_ASSERT_TRUE(type_of(parts[0]) == MessageType::Data);
}

void test_full_range_image_is_chunked() {
  Frame f = test::make_frame(StreamKind::RangeImage, 12, 128, 1024);
  Bytes msg;
  std::error_code ec;
  TEST_ASSERT_TRUE(encode_frame(f, msg, ec));
  TEST_ASSERT_EQUAL_UINT32(524320, msg.size());

  Chunker chunker(ChunkPlan{});
  std::vector<Bytes> parts;
  TEST_ASSERT_TRUE(chunker.split(msg, parts, ec));
  TEST_ASSERT_EQUAL_UINT32(3, parts.size());
  TEST_ASSERT_TRUE(type_of(parts[0]) == MessageType::Chunk);
  TEST_ASSERT_TRUE(type_of(parts[1]) == MessageType::Chunk);
  TEST_ASSERT_TRUE(type_of(parts[2]) == MessageType::EndOfFrame);
  for (const Bytes &p : parts) {
    TEST_ASSERT_TRUE(p.size() <= kMaxMessageSize);
    TEST_ASSERT_EQUAL_UINT32(12, get_u32le(p.data() + 8));
  }
}

void test_one_million_byte_payload() {
  Bytes msg = test::make_raw_message(2, 99, 1000000);
  Chunker chunker(ChunkPlan{});
  std::vector<Bytes> parts;
  std::error_code ec;
  TEST_ASSERT_TRUE(chunker.split(msg, parts, ec));
  TEST_ASSERT_EQUAL_UINT32(5, parts.size());

  const uint32_t expected[4] = {262144, 262144, 262144, 213568};
  uint64_t sum = 0;
  for (uint32_t i = 0; i < 4; i++) {
    ChunkHeader ch;
    TEST_ASSERT_TRUE(unpack_header(parts[i].data(), parts[i].size(), ch, ec));
    TEST_ASSERT_EQUAL_UINT32(2, ch.stream_kind);
    TEST_ASSERT_EQUAL_UINT32(99, ch.frame_number);
    TEST_ASSERT_EQUAL_UINT32(i, ch.chunk_index);
    TEST_ASSERT_EQUAL_UINT32(4, ch.total_chunks);
    TEST_ASSERT_EQUAL_UINT32(expected[i], ch.chunk_length);
    TEST_ASSERT_EQUAL_FLOAT((float)(i * 262144), ch.start_offset);
    TEST_ASSERT_EQUAL_UINT32(kHeaderSize + ch.chunk_length, parts[i].size());
    TEST_ASSERT_EQUAL_MEMORY(msg.data() + kHeaderSize + i * 262144,
                             parts[i].data() + kHeaderSize, ch.chunk_length);
    sum += ch.chunk_length;
  }
  TEST_ASSERT_TRUE(sum == 1000000);

  EndOfFrameHeader eh;
  TEST_ASSERT_TRUE(unpack_header(parts[4].data(), parts[4].size(), eh, ec));
  TEST_ASSERT_EQUAL_UINT32(1000000, eh.total_data_size);
  TEST_ASSERT_EQUAL_UINT32(4, eh.total_chunks);
  TEST_ASSERT_EQUAL_UINT32(2 * kHeaderSize, parts[4].size());
  TEST_ASSERT_EQUAL_MEMORY(msg.data(), parts[4].data() + kHeaderSize,
                           kHeaderSize);
}

void test_chunk_count() {
  TEST_ASSERT_EQUAL_UINT32(0, Chunker::chunk_count(0, kChunkSize));
  TEST_ASSERT_EQUAL_UINT32(1, Chunker::chunk_count(1, kChunkSize));
  TEST_ASSERT_EQUAL_UINT32(1, Chunker::chunk_count(kChunkSize, kChunkSize));
  TEST_ASSERT_EQUAL_UINT32(2,
                           Chunker::chunk_count(kChunkSize + 1, kChunkSize));
  TEST_ASSERT_EQUAL_UINT32(4, Chunker::chunk_count(1000000, kChunkSize));
}

void test_zero_payload_above_small_limit() {
  ChunkPlan plan;
  plan.chunk_size = 8;
  plan.max_message_size = 16;
  Bytes msg = test::make_raw_message(0, 5, 0);
  std::vector<Bytes> parts;
  std::error_code ec;
  TEST_ASSERT_TRUE(Chunker(plan).split(msg, parts, ec));
  TEST_ASSERT_EQUAL_UINT32(1, parts.size());
  TEST_ASSERT_TRUE(type_of(parts[0]) == MessageType::EndOfFrame);
  TEST_ASSERT_EQUAL_UINT32(0, get_u32le(parts[0].data() + 16));
}

void test_rejects_non_regular_input() {
  Bytes chunk(kHeaderSize);
  pack_header(ChunkHeader{}, chunk.data());
  std::vector<Bytes> parts;
  std::error_code ec;
  TEST_ASSERT_FALSE(Chunker(ChunkPlan{}).split(chunk, parts, ec));
  TEST_ASSERT_TRUE(ec == Errc::MalformedHeader);
  TEST_ASSERT_TRUE(parts.empty());
}

void test_validate_plan() {
  std::string why;
  TEST_ASSERT_TRUE(validate_plan(ChunkPlan{}, why));

  ChunkPlan zero;
  zero.chunk_size = 0;
  TEST_ASSERT_FALSE(validate_plan(zero, why));

  ChunkPlan too_big;
  too_big.chunk_size = kMaxMessageSize;
  TEST_ASSERT_FALSE(validate_plan(too_big, why));
  TEST_ASSERT_FALSE(why.empty());

  ChunkPlan tight;
  tight.chunk_size = kMaxMessageSize - kHeaderSize;
  TEST_ASSERT_TRUE(validate_plan(tight, why));
}

int main(void) {
  UNITY_BEGIN();

  RUN_TEST(test_small_message_passes_through);
  RUN_TEST(test_message_at_threshold_not_chunked);
  RUN_TEST(test_full_range_image_is_chunked);
  RUN_TEST(test_one_million_byte_payload);
  RUN_TEST(test_chunk_count);
  RUN_TEST(test_zero_payload_above_small_limit);
  RUN_TEST(test_rejects_non_regular_input);
  RUN_TEST(test_validate_plan);

  return UNITY_END();
}
