
#include "errors.hpp"
#include "link.hpp"
#include "util.hpp"

#include <unity.h>

using namespace scanlink;

void setUp() {}

void tearDown() {}

void test_envelope_split_across_feeds() {
  Bytes payload(1000);
  for (size_t i = 0; i < payload.size(); i++)
    payload[i] = (uint8_t)i;
  Bytes wire = make_envelope(Opcode::Binary, payload.data(), payload.size());
  TEST_ASSERT_EQUAL_UINT32(kEnvelopeHeaderSize + 1000, wire.size());

  EnvelopeReader reader(kMaxMessageSize);
  Envelope env;
  std::error_code ec;
  for (size_t i = 0; i + 1 < wire.size(); i++) {
    reader.feed(&wire[i], 1);
    TEST_ASSERT_FALSE(reader.next(env, ec));
    TEST_ASSERT_FALSE(ec);
  }
  reader.feed(&wire.back(), 1);
  TEST_ASSERT_TRUE(reader.next(env, ec));
  TEST_ASSERT_TRUE(env.op == Opcode::Binary);
  TEST_ASSERT_TRUE(env.payload == payload);
  TEST_ASSERT_EQUAL_UINT32(0, reader.buffered());
}

void test_several_envelopes_in_one_feed() {
  Bytes wire = make_text_envelope("/ws/range2d");
  Bytes bin = make_envelope(Opcode::Binary, (const uint8_t *)"abcd", 4);
  Bytes close = make_envelope(Opcode::Close, nullptr, 0);
  wire.insert(wire.end(), bin.begin(), bin.end());
  wire.insert(wire.end(), close.begin(), close.end());

  EnvelopeReader reader(64);
  reader.feed(wire.data(), wire.size());
  Envelope env;
  std::error_code ec;
  TEST_ASSERT_TRUE(reader.next(env, ec));
  TEST_ASSERT_TRUE(env.op == Opcode::Text);
  TEST_ASSERT_EQUAL_STRING("/ws/range2d", env.text().c_str());
  TEST_ASSERT_TRUE(reader.next(env, ec));
  TEST_ASSERT_TRUE(env.op == Opcode::Binary);
  TEST_ASSERT_EQUAL_UINT32(4, env.payload.size());
  TEST_ASSERT_TRUE(reader.next(env, ec));
  TEST_ASSERT_TRUE(env.op == Opcode::Close);
  TEST_ASSERT_TRUE(env.payload.empty());
  TEST_ASSERT_FALSE(reader.next(env, ec));
  TEST_ASSERT_FALSE(ec);
}

void test_oversized_envelope_rejected() {
  uint8_t hdr[kEnvelopeHeaderSize];
  pack_envelope_header(Opcode::Binary, 4097, hdr);
  EnvelopeReader reader(4096);
  reader.feed(hdr, sizeof(hdr));
  Envelope env;
  std::error_code ec;
  TEST_ASSERT_FALSE(reader.next(env, ec));
  TEST_ASSERT_TRUE(ec == Errc::MessageTooLarge);
}

void test_message_at_limit_accepted() {
  Bytes payload(4096, 0x5A);
  Bytes wire = make_envelope(Opcode::Binary, payload.data(), payload.size());
  EnvelopeReader reader(4096);
  reader.feed(wire.data(), wire.size());
  Envelope env;
  std::error_code ec;
  TEST_ASSERT_TRUE(reader.next(env, ec));
  TEST_ASSERT_EQUAL_UINT32(4096, env.payload.size());
}

void test_unknown_opcode_rejected() {
  uint8_t hdr[kEnvelopeHeaderSize];
  pack_envelope_header(Opcode::Text, 0, hdr);
  hdr[0] = 0x9;
  EnvelopeReader reader(64);
  reader.feed(hdr, sizeof(hdr));
  Envelope env;
  std::error_code ec;
  TEST_ASSERT_FALSE(reader.next(env, ec));
  TEST_ASSERT_TRUE(ec == Errc::MalformedEnvelope);
}

int main(void) {
  UNITY_BEGIN();

  RUN_TEST(test_envelope_split_across_feeds);
  RUN_TEST(test_several_envelopes_in_one_feed);
  RUN_TEST(test_oversized_envelope_rejected);
  RUN_TEST(test_message_at_limit_accepted);
  RUN_TEST(test_unknown_opcode_rejected);

  return UNITY_END();
}
