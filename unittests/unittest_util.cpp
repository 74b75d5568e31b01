
#include "logging.hpp"
#include "util.hpp"

#include <unity.h>

using namespace scanlink;

void setUp() {}

void tearDown() {}

void test_parse_host_port() {
  std::string host;
  uint16_t port = 0;
  TEST_ASSERT_TRUE(parse_host_port("0.0.0.0:8000", host, port));
  TEST_ASSERT_EQUAL_STRING("0.0.0.0", host.c_str());
  TEST_ASSERT_EQUAL_UINT16(8000, port);

  TEST_ASSERT_TRUE(parse_host_port("[::1]:9001", host, port));
  TEST_ASSERT_EQUAL_STRING("::1", host.c_str());
  TEST_ASSERT_EQUAL_UINT16(9001, port);

  TEST_ASSERT_FALSE(parse_host_port("localhost", host, port));
  TEST_ASSERT_FALSE(parse_host_port(":8000", host, port));
  TEST_ASSERT_FALSE(parse_host_port("localhost:", host, port));
  TEST_ASSERT_FALSE(parse_host_port("localhost:70000", host, port));
  TEST_ASSERT_FALSE(parse_host_port("localhost:-1", host, port));
  TEST_ASSERT_FALSE(parse_host_port("localhost:80x", host, port));
}

void test_join_path() {
  TEST_ASSERT_EQUAL_STRING("rec/range2d.bin",
                           join_path("rec", "range2d.bin").c_str());
  TEST_ASSERT_EQUAL_STRING("rec/range2d.bin",
                           join_path("rec/", "range2d.bin").c_str());
  TEST_ASSERT_EQUAL_STRING("range2d.bin", join_path("", "range2d.bin").c_str());
}

void test_little_endian_helpers() {
  uint8_t buf[4];
  put_u32le(buf, 0xDEADBEEF);
  TEST_ASSERT_EQUAL_HEX8(0xEF, buf[0]);
  TEST_ASSERT_EQUAL_HEX8(0xDE, buf[3]);
  TEST_ASSERT_EQUAL_HEX32(0xDEADBEEF, get_u32le(buf));
  put_f32le(buf, 1.0f);
  TEST_ASSERT_EQUAL_HEX8(0x3F, buf[3]);
  TEST_ASSERT_EQUAL_HEX8(0x80, buf[2]);
  TEST_ASSERT_EQUAL_FLOAT(1.0f, get_f32le(buf));
}

void test_parse_log_level() {
  LogLevel lvl = LogLevel::INFO;
  TEST_ASSERT_TRUE(parse_log_level("trace", lvl));
  TEST_ASSERT_TRUE(lvl == LogLevel::TRACE);
  TEST_ASSERT_TRUE(parse_log_level("error", lvl));
  TEST_ASSERT_TRUE(lvl == LogLevel::ERROR);
  TEST_ASSERT_FALSE(parse_log_level("verbose", lvl));
  TEST_ASSERT_TRUE(lvl == LogLevel::ERROR);

  Logger::instance().set_level(LogLevel::WARN);
  TEST_ASSERT_FALSE(Logger::instance().enabled(LogLevel::INFO));
  TEST_ASSERT_TRUE(Logger::instance().enabled(LogLevel::ERROR));
}

int main(void) {
  UNITY_BEGIN();

  RUN_TEST(test_parse_host_port);
  RUN_TEST(test_join_path);
  RUN_TEST(test_little_endian_helpers);
  RUN_TEST(test_parse_log_level);

  return UNITY_END();
}
