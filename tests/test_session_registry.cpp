
#include "logging.hpp"
#include "session_registry.hpp"
#include "client_group.hpp"
#include "stream_client.hpp"
#include "nettest.hpp"

#include <unity.h>
#include <nlohmann/json.hpp>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using namespace scanlink;

void setUp() { Logger::instance().set_level(LogLevel::ERROR); }

void tearDown() {}

static SessionOptions fast_options() {
  SessionOptions opts;
  opts.fps = 500.0;
  return opts;
}

static SyntheticOptions tiny(uint32_t frames) {
  SyntheticOptions so;
  so.frames = frames;
  so.rows = 4;
  so.columns = 8;
  return so;
}

static nlohmann::json read_json(test::RawChannel &ch) {
  Envelope env;
  TEST_ASSERT_TRUE(ch.read(env));
  TEST_ASSERT_TRUE(env.op == Opcode::Text);
  return nlohmann::json::parse(env.text());
}

static void expect_close(test::RawChannel &ch) {
  Envelope env;
  TEST_ASSERT_TRUE(ch.read(env));
  TEST_ASSERT_TRUE(env.op == Opcode::Close);
  TEST_ASSERT_FALSE(ch.read(env));
}

void test_service_info() {
  SyntheticFrameSource src(tiny(1));
  test::LoopbackServer server(src, fast_options());
  TEST_ASSERT_TRUE(server.ok());
  TEST_ASSERT_TRUE(server.port() != 0);

  test::RawChannel ch(server.port(), "/");
  nlohmann::json j = read_json(ch);
  TEST_ASSERT_EQUAL_STRING("running", j["status"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL_STRING("1.0.0", j["version"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL_UINT32(kStreamKindCount, j["endpoints"].size());
  TEST_ASSERT_EQUAL_STRING("/ws/reflectivity3d",
                           j["endpoints"]["reflectivity3d"].get<std::string>().c_str());
  expect_close(ch);
  TEST_ASSERT_EQUAL_UINT32(0, server.registry().total_sessions());
}

void test_health() {
  SyntheticFrameSource src(tiny(1));
  test::LoopbackServer server(src, fast_options());
  test::RawChannel ch(server.port(), "/health");
  nlohmann::json j = read_json(ch);
  TEST_ASSERT_EQUAL_STRING("healthy", j["status"].get<std::string>().c_str());
  expect_close(ch);
}

void test_unknown_channel_is_refused() {
  SyntheticFrameSource src(tiny(1));
  test::LoopbackServer server(src, fast_options());
  test::RawChannel ch(server.port(), "/ws/thermal");
  nlohmann::json j = read_json(ch);
  TEST_ASSERT_EQUAL_STRING("error", j["type"].get<std::string>().c_str());
  TEST_ASSERT_TRUE(j["error"].get<std::string>().find("/ws/thermal") !=
                   std::string::npos);
  expect_close(ch);
  TEST_ASSERT_EQUAL_UINT32(0, server.registry().total_sessions());
}

void test_binary_request_is_refused() {
  SyntheticFrameSource src(tiny(1));
  test::LoopbackServer server(src, fast_options());
  test::RawChannel ch(server.port());
  ch.send(make_envelope(Opcode::Binary, (const uint8_t *)"/ws/range2d", 11));
  nlohmann::json j = read_json(ch);
  TEST_ASSERT_TRUE(j.contains("error"));
  expect_close(ch);
}

void test_concurrent_sessions_are_independent() {
  SyntheticFrameSource src(tiny(5));
  test::LoopbackServer server(src, fast_options());
  test::RawChannel a(server.port(), "/ws/range2d");
  test::RawChannel b(server.port(), "/ws/range2d");
  test::RawChannel c(server.port(), "/ws/combined2d");

  test::RawChannel *channels[] = {&a, &b, &c};
  for (test::RawChannel *ch : channels) {
    Envelope env;
    for (uint32_t f = 0; f < 5; f++) {
      TEST_ASSERT_TRUE(ch->read(env));
      TEST_ASSERT_TRUE(test::message_type(env) == MessageType::Data);
      TEST_ASSERT_EQUAL_UINT32(f, test::message_frame(env));
    }
    expect_close(*ch);
  }
  TEST_ASSERT_EQUAL_UINT32(3, server.registry().total_sessions());
  TEST_ASSERT_TRUE(test::wait_until(
      [&]() { return server.registry().active_sessions() == 0; }));
}

void test_stream_client_end_to_end() {
  SyntheticOptions so;
  so.frames = 3;
  SyntheticFrameSource src(so);
  test::LoopbackServer server(src, fast_options());

  ClientConfig cfg;
  cfg.server_port = server.port();
  asio::io_context io;
  auto client = std::make_shared<StreamClient>(io, cfg, StreamKind::PointCloudXyz);
  std::vector<uint32_t> seen;
  client->set_frame_handler([&](const DecodedFrame &f) {
    seen.push_back(f.hdr.frame_number);
    TEST_ASSERT_EQUAL_UINT32(131072 * 3, f.values.size());
  });
  bool close_called = false;
  client->set_close_handler([&](StreamClient &) { close_called = true; });
  client->start();
  io.run();

  TEST_ASSERT_TRUE(close_called);
  TEST_ASSERT_TRUE(client->closed());
  TEST_ASSERT_FALSE(client->error());
  TEST_ASSERT_TRUE(client->server_error().empty());
  TEST_ASSERT_EQUAL_UINT32(3, client->frames());
  TEST_ASSERT_EQUAL_UINT32(3, seen.size());
  for (uint32_t i = 0; i < 3; i++)
    TEST_ASSERT_EQUAL_UINT32(i, seen[i]);
  TEST_ASSERT_EQUAL_UINT32(3, client->stats().reassembled);
  TEST_ASSERT_EQUAL_UINT32(0, client->stats().dropped);
  TEST_ASSERT_TRUE(client->bytes() == 3ull * 131072 * 3 * 4);
}

void test_stream_client_records_frames() {
  std::string dir = "/tmp/scanlink_record_" + std::to_string(getpid());
  ::mkdir(dir.c_str(), 0700);
  SyntheticFrameSource src(tiny(2));
  test::LoopbackServer server(src, fast_options());

  ClientConfig cfg;
  cfg.server_port = server.port();
  cfg.record_dir = dir;
  asio::io_context io;
  auto client = std::make_shared<StreamClient>(io, cfg, StreamKind::RangeImage);
  client->start();
  io.run();
  TEST_ASSERT_EQUAL_UINT32(2, client->frames());

  // the recording is a valid replay capture
  std::string path = dir + "/range2d.bin";
  ReplayFrameSource replay(path);
  auto cursor = replay.open(StreamKind::RangeImage);
  Frame f;
  std::error_code ec;
  TEST_ASSERT_TRUE(cursor->next(f, ec));
  TEST_ASSERT_TRUE(cursor->next(f, ec));
  TEST_ASSERT_EQUAL_UINT32(1, f.frame_number);
  TEST_ASSERT_FALSE(cursor->next(f, ec));
  TEST_ASSERT_FALSE(ec);

  ::unlink(path.c_str());
  ::rmdir(dir.c_str());
}

void test_stream_client_sees_server_error() {
  test::ScriptedSource src;
  src.fail_with = std::make_error_code(std::errc::io_error);
  test::LoopbackServer server(src, fast_options());

  ClientConfig cfg;
  cfg.server_port = server.port();
  asio::io_context io;
  auto client = std::make_shared<StreamClient>(io, cfg, StreamKind::RangeImage);
  client->start();
  io.run();
  TEST_ASSERT_TRUE(client->closed());
  TEST_ASSERT_EQUAL_UINT32(0, client->frames());
  TEST_ASSERT_FALSE(client->server_error().empty());
}

void test_client_stop_ends_session() {
  SyntheticFrameSource src(tiny(100000));
  SessionOptions opts;
  opts.fps = 50.0;
  test::LoopbackServer server(src, opts);

  ClientConfig cfg;
  cfg.server_port = server.port();
  asio::io_context io;
  auto client = std::make_shared<StreamClient>(io, cfg, StreamKind::ReflectivityImage);
  client->set_frame_handler([&](const DecodedFrame &) { client->stop(); });
  client->start();
  io.run();

  TEST_ASSERT_TRUE(client->closed());
  TEST_ASSERT_TRUE(client->frames() >= 1);
  TEST_ASSERT_TRUE(test::wait_until(
      [&]() { return server.registry().active_sessions() == 0; }));
}

void test_stop_cancels_active_sessions() {
  SyntheticFrameSource src(tiny(100000));
  SessionOptions opts;
  opts.fps = 20.0;
  test::LoopbackServer server(src, opts);
  test::RawChannel a(server.port(), "/ws/range2d");
  test::RawChannel b(server.port(), "/ws/points3d");

  Envelope env;
  TEST_ASSERT_TRUE(a.read(env));
  TEST_ASSERT_TRUE(b.read(env));
  TEST_ASSERT_EQUAL_UINT32(2, server.registry().active_sessions());

  server.registry().stop();
  while (a.read(env)) {
  }
  while (b.read(env)) {
  }
  TEST_ASSERT_TRUE(test::wait_until(
      [&]() { return server.registry().active_sessions() == 0; }));

  // no longer accepting
  test::RawChannel late(server.port(), "/health");
  TEST_ASSERT_FALSE(late.connected() && late.read(env));
}

void test_stop_during_chunked_streaming() {
  SyntheticOptions so;
  so.frames = 100000;
  SyntheticFrameSource src(so);
  SessionOptions opts;
  opts.fps = 1000.0;
  test::LoopbackServer server(src, opts, 4);
  test::RawChannel a(server.port(), "/ws/range2d");
  test::RawChannel b(server.port(), "/ws/combined2d");

  Envelope env;
  TEST_ASSERT_TRUE(a.read(env));
  TEST_ASSERT_TRUE(test::message_type(env) == MessageType::Chunk);
  TEST_ASSERT_TRUE(b.read(env));
  TEST_ASSERT_TRUE(test::message_type(env) == MessageType::Chunk);

  server.registry().stop();
  while (a.read(env)) {
  }
  while (b.read(env)) {
  }
  TEST_ASSERT_TRUE(test::wait_until(
      [&]() { return server.registry().active_sessions() == 0; }));
  TEST_ASSERT_EQUAL_UINT32(2, server.registry().total_sessions());
}

void test_client_group_runs_out_of_work() {
  SyntheticFrameSource src(tiny(3));
  test::LoopbackServer server(src, fast_options());

  ClientConfig cfg;
  cfg.server_port = server.port();
  cfg.streams = {StreamKind::RangeImage, StreamKind::PointCloudXyz,
                 StreamKind::PointCloudColor, StreamKind::CombinedInterleaved};
  asio::io_context io;
  ClientGroup group(io, cfg);
  group.start();

  // the pending signal wait would keep run() alive if it were never released
  std::thread t1([&]() { io.run(); });
  std::thread t2([&]() { io.run(); });
  t1.join();
  t2.join();

  TEST_ASSERT_EQUAL_UINT32(0, group.open_clients());
  TEST_ASSERT_EQUAL_UINT32(4, group.clients().size());
  for (auto &c : group.clients()) {
    TEST_ASSERT_TRUE(c->closed());
    TEST_ASSERT_EQUAL_UINT32(3, c->frames());
  }
}

void test_client_group_stop_closes_every_client() {
  SyntheticFrameSource src(tiny(100000));
  SessionOptions opts;
  opts.fps = 50.0;
  test::LoopbackServer server(src, opts);

  ClientConfig cfg;
  cfg.server_port = server.port();
  cfg.streams = {StreamKind::RangeImage, StreamKind::ReflectivityImage};
  asio::io_context io;
  ClientGroup group(io, cfg);
  group.start();
  std::thread t1([&]() { io.run(); });
  std::thread t2([&]() { io.run(); });

  TEST_ASSERT_TRUE(test::wait_until([&]() {
    for (auto &c : group.clients())
      if (c->frames() == 0)
        return false;
    return true;
  }));
  group.stop();
  t1.join();
  t2.join();

  TEST_ASSERT_EQUAL_UINT32(0, group.open_clients());
  for (auto &c : group.clients())
    TEST_ASSERT_TRUE(c->closed());
  TEST_ASSERT_TRUE(test::wait_until(
      [&]() { return server.registry().active_sessions() == 0; }));
}

int main(void) {
  UNITY_BEGIN();

  RUN_TEST(test_service_info);
  RUN_TEST(test_health);
  RUN_TEST(test_unknown_channel_is_refused);
  RUN_TEST(test_binary_request_is_refused);
  RUN_TEST(test_concurrent_sessions_are_independent);
  RUN_TEST(test_stream_client_end_to_end);
  RUN_TEST(test_stream_client_records_frames);
  RUN_TEST(test_stream_client_sees_server_error);
  RUN_TEST(test_client_stop_ends_session);
  RUN_TEST(test_stop_cancels_active_sessions);
  RUN_TEST(test_stop_during_chunked_streaming);
  RUN_TEST(test_client_group_runs_out_of_work);
  RUN_TEST(test_client_group_stop_closes_every_client);

  return UNITY_END();
}
