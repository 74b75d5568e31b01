
#include "chunker.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "reassembler.hpp"
#include "util.hpp"
#include "testutil.hpp"

#include <unity.h>
#include <algorithm>

using namespace scanlink;

void setUp() { Logger::instance().set_level(LogLevel::ERROR); }

void tearDown() {}

static std::vector<Bytes> split(const Bytes &msg, const ChunkPlan &plan) {
  std::vector<Bytes> parts;
  std::error_code ec;
  TEST_ASSERT_TRUE(Chunker(plan).split(msg, parts, ec));
  return parts;
}

// Feeds all parts; only the last one may yield a message.
static Bytes feed_all(Reassembler &r, std::vector<Bytes> parts) {
  std::error_code ec;
  for (size_t i = 0; i + 1 < parts.size(); i++) {
    auto out = r.push(std::move(parts[i]), ec);
    TEST_ASSERT_FALSE(out.has_value());
    TEST_ASSERT_FALSE(ec);
  }
  auto out = r.push(std::move(parts.back()), ec);
  TEST_ASSERT_FALSE(ec);
  TEST_ASSERT_TRUE(out.has_value());
  return *out;
}

void test_regular_message_bypasses() {
  Reassembler r;
  Bytes msg = test::make_raw_message(0, 1, 64);
  std::error_code ec;
  auto out = r.push(Bytes(msg), ec);
  TEST_ASSERT_TRUE(out.has_value());
  TEST_ASSERT_TRUE(*out == msg);
  TEST_ASSERT_EQUAL_UINT32(1, r.stats().delivered);
  TEST_ASSERT_EQUAL_UINT32(0, r.pending_frames());
}

void test_reconstructs_across_sizes() {
  ChunkPlan plan;
  plan.chunk_size = 8;
  plan.max_message_size = 40;
  const size_t sizes[] = {1, 7, 8, 9, 16, 17, 63, 64, 1001};
  uint32_t frame = 0;
  Reassembler r;
  for (size_t d : sizes) {
    Bytes msg = test::make_raw_message(3, frame++, d);
    Bytes out = feed_all(r, split(msg, plan));
    TEST_ASSERT_EQUAL_UINT32(msg.size(), out.size());
    TEST_ASSERT_EQUAL_MEMORY(msg.data(), out.data(), msg.size());
  }
  TEST_ASSERT_EQUAL_UINT32(0, r.pending_frames());
}

void test_zero_length_payload_chunked() {
  ChunkPlan plan;
  plan.chunk_size = 8;
  plan.max_message_size = 16;
  Bytes msg = test::make_raw_message(0, 4, 0);
  Reassembler r;
  Bytes out = feed_all(r, split(msg, plan));
  TEST_ASSERT_TRUE(out == msg);
  TEST_ASSERT_EQUAL_UINT32(1, r.stats().reassembled);
}

void test_out_of_order_chunks_use_index() {
  Bytes msg = test::make_raw_message(2, 8, 1000000);
  std::vector<Bytes> parts = split(msg, ChunkPlan{});
  std::reverse(parts.begin(), parts.end() - 1);

  Reassembler r;
  Bytes out = feed_all(r, std::move(parts));
  TEST_ASSERT_TRUE(out == msg);
}

void test_missing_last_chunk_is_incomplete() {
  Bytes msg = test::make_raw_message(0, 10, 1000000);
  std::vector<Bytes> parts = split(msg, ChunkPlan{});
  TEST_ASSERT_EQUAL_UINT32(5, parts.size());

  Reassembler r;
  std::error_code ec;
  for (size_t i = 0; i < 3; i++)
    TEST_ASSERT_FALSE(r.push(std::move(parts[i]), ec).has_value());
  auto out = r.push(std::move(parts[4]), ec);
  TEST_ASSERT_FALSE(out.has_value());
  TEST_ASSERT_TRUE(ec == Errc::IncompleteReassembly);
  TEST_ASSERT_EQUAL_UINT32(1, r.stats().dropped);
  TEST_ASSERT_EQUAL_UINT32(0, r.pending_frames());

  // the next frame starts with a fresh buffer
  Bytes next = test::make_raw_message(0, 11, 1000000);
  Bytes again = feed_all(r, split(next, ChunkPlan{}));
  TEST_ASSERT_TRUE(again == next);
}

void test_end_of_frame_without_chunks() {
  Bytes msg = test::make_raw_message(1, 3, 1000000);
  std::vector<Bytes> parts = split(msg, ChunkPlan{});
  Reassembler r;
  std::error_code ec;
  TEST_ASSERT_FALSE(r.push(std::move(parts.back()), ec).has_value());
  TEST_ASSERT_TRUE(ec == Errc::IncompleteReassembly);
}

void test_duplicate_chunk_last_write_wins() {
  ChunkPlan plan;
  plan.chunk_size = 16;
  plan.max_message_size = 48;
  Bytes msg = test::make_raw_message(0, 2, 40);
  std::vector<Bytes> parts = split(msg, plan);
  TEST_ASSERT_EQUAL_UINT32(4, parts.size());

  Bytes bogus = parts[0];
  std::fill(bogus.begin() + kHeaderSize, bogus.end(), 0xEE);

  Reassembler r;
  std::error_code ec;
  r.push(std::move(bogus), ec);
  TEST_ASSERT_FALSE(ec);
  Bytes out = feed_all(r, std::move(parts));
  TEST_ASSERT_TRUE(out == msg);
}

void test_size_mismatch_drops_frame() {
  ChunkPlan plan;
  plan.chunk_size = 16;
  plan.max_message_size = 48;
  Bytes msg = test::make_raw_message(0, 2, 40);
  std::vector<Bytes> parts = split(msg, plan);
  put_u32le(parts.back().data() + 12, 41);

  Reassembler r;
  std::error_code ec;
  for (size_t i = 0; i + 1 < parts.size(); i++)
    r.push(std::move(parts[i]), ec);
  TEST_ASSERT_FALSE(r.push(std::move(parts.back()), ec).has_value());
  TEST_ASSERT_TRUE(ec == Errc::SizeMismatch);
  TEST_ASSERT_EQUAL_UINT32(1, r.stats().dropped);
}

void test_newer_frame_evicts_stale_buffer() {
  ChunkPlan plan;
  plan.chunk_size = 16;
  plan.max_message_size = 48;
  std::vector<Bytes> old_parts =
      split(test::make_raw_message(4, 5, 40), plan);
  std::vector<Bytes> new_parts =
      split(test::make_raw_message(4, 6, 40), plan);

  Reassembler r;
  std::error_code ec;
  r.push(std::move(old_parts[0]), ec);
  r.push(std::move(new_parts[0]), ec);
  TEST_ASSERT_EQUAL_UINT32(1, r.pending_frames());
  TEST_ASSERT_EQUAL_UINT32(1, r.stats().evicted);

  // the stale frame's sentinel finds nothing to complete
  TEST_ASSERT_FALSE(r.push(std::move(old_parts.back()), ec).has_value());
  TEST_ASSERT_TRUE(ec == Errc::IncompleteReassembly);
}

void test_stream_kinds_are_independent() {
  ChunkPlan plan;
  plan.chunk_size = 16;
  plan.max_message_size = 48;
  Bytes a = test::make_raw_message(0, 9, 40);
  Bytes b = test::make_raw_message(2, 1, 40);
  std::vector<Bytes> pa = split(a, plan), pb = split(b, plan);

  Reassembler r;
  std::error_code ec;
  std::optional<Bytes> out_a, out_b;
  for (size_t i = 0; i < pa.size(); i++) {
    auto x = r.push(std::move(pa[i]), ec);
    if (x)
      out_a = x;
    auto y = r.push(std::move(pb[i]), ec);
    if (y)
      out_b = y;
  }
  TEST_ASSERT_TRUE(out_a.has_value() && *out_a == a);
  TEST_ASSERT_TRUE(out_b.has_value() && *out_b == b);
}

void test_malformed_input_rejected() {
  Reassembler r;
  std::error_code ec;
  TEST_ASSERT_FALSE(r.push(Bytes(10, 0), ec).has_value());
  TEST_ASSERT_TRUE(ec == Errc::MalformedHeader);

  ChunkHeader ch{};
  ch.total_chunks = 1;
  ch.chunk_length = 100;
  Bytes lying(kHeaderSize + 10);
  pack_header(ch, lying.data());
  TEST_ASSERT_FALSE(r.push(std::move(lying), ec).has_value());
  TEST_ASSERT_TRUE(ec == Errc::SizeMismatch);
  TEST_ASSERT_EQUAL_UINT32(2, r.stats().rejected);
  TEST_ASSERT_EQUAL_UINT32(0, r.pending_frames());
}

void test_unknown_kinds_are_not_buffered() {
  ChunkPlan plan;
  plan.chunk_size = 16;
  plan.max_message_size = 48;
  Reassembler r;
  std::error_code ec;
  for (uint32_t kind = 100; kind < 110; kind++) {
    std::vector<Bytes> parts = split(test::make_raw_message(kind, 1, 40), plan);
    TEST_ASSERT_FALSE(r.push(std::move(parts.front()), ec).has_value());
    TEST_ASSERT_TRUE(ec == Errc::UnknownStreamKind);
    TEST_ASSERT_FALSE(r.push(std::move(parts.back()), ec).has_value());
    TEST_ASSERT_TRUE(ec == Errc::UnknownStreamKind);
  }
  TEST_ASSERT_EQUAL_UINT32(0, r.pending_frames());
  TEST_ASSERT_EQUAL_UINT32(20, r.stats().rejected);
  TEST_ASSERT_EQUAL_UINT32(0, r.stats().dropped);

  // a sentinel for a known kind with nothing buffered leaves no entry behind
  std::vector<Bytes> parts = split(test::make_raw_message(1, 7, 40), plan);
  TEST_ASSERT_FALSE(r.push(std::move(parts.back()), ec).has_value());
  TEST_ASSERT_TRUE(ec == Errc::IncompleteReassembly);
  TEST_ASSERT_EQUAL_UINT32(0, r.pending_frames());
}

void test_clear_discards_pending() {
  Bytes msg = test::make_raw_message(0, 1, 1000000);
  std::vector<Bytes> parts = split(msg, ChunkPlan{});
  Reassembler r;
  std::error_code ec;
  r.push(std::move(parts[0]), ec);
  TEST_ASSERT_EQUAL_UINT32(1, r.pending_frames());
  r.clear();
  TEST_ASSERT_EQUAL_UINT32(0, r.pending_frames());
}

int main(void) {
  UNITY_BEGIN();

  RUN_TEST(test_regular_message_bypasses);
  RUN_TEST(test_reconstructs_across_sizes);
  RUN_TEST(test_zero_length_payload_chunked);
  RUN_TEST(test_out_of_order_chunks_use_index);
  RUN_TEST(test_missing_last_chunk_is_incomplete);
  RUN_TEST(test_end_of_frame_without_chunks);
  RUN_TEST(test_duplicate_chunk_last_write_wins);
  RUN_TEST(test_size_mismatch_drops_frame);
  RUN_TEST(test_newer_frame_evicts_stale_buffer);
  RUN_TEST(test_stream_kinds_are_independent);
  RUN_TEST(test_malformed_input_rejected);
  RUN_TEST(test_unknown_kinds_are_not_buffered);
  RUN_TEST(test_clear_discards_pending);

  return UNITY_END();
}
