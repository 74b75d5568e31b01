
#include "codec.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "reassembler.hpp"
#include "stream_session.hpp"
#include "nettest.hpp"

#include <unity.h>
#include <nlohmann/json.hpp>

using namespace scanlink;
using asio::ip::tcp;

void setUp() { Logger::instance().set_level(LogLevel::ERROR); }

void tearDown() {}

// One StreamSession on the accepted end of a loopback pair; the test reads
// the other end with a RawChannel.
struct SessionRig {
  asio::io_context io;
  tcp::acceptor acceptor{io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)};
  std::unique_ptr<test::RawChannel> peer;
  std::shared_ptr<StreamSession> session;
  std::atomic<int> final_state{-1};
  std::thread runner;

  // `broken_send` shuts down the sending side of the server socket so the
  // first write fails
  void start(StreamKind kind, FrameSource &src, const SessionOptions &opts,
             bool broken_send = false) {
    peer.reset(new test::RawChannel(acceptor.local_endpoint().port()));
    TEST_ASSERT_TRUE(peer->connected());
    tcp::socket sock(asio::make_strand(io));
    acceptor.accept(sock);
    acceptor.close();
    if (broken_send)
      sock.shutdown(tcp::socket::shutdown_send);
    session = std::make_shared<StreamSession>(
        1, std::move(sock), kind, src, opts,
        [this](uint64_t, SessionState st) { final_state = (int)st; });
    session->start();
    runner = std::thread([this]() { io.run(); });
  }

  void join() {
    if (runner.joinable())
      runner.join();
  }

  ~SessionRig() {
    if (runner.joinable()) {
      io.stop();
      runner.join();
    }
  }
};

static SessionOptions fast_options() {
  SessionOptions opts;
  opts.fps = 1000.0;
  return opts;
}

void test_chunked_frames_arrive_in_order() {
  SyntheticOptions so;
  so.frames = 3;
  SyntheticFrameSource src(so);
  SessionRig rig;
  rig.start(StreamKind::RangeImage, src, fast_options());

  Envelope env;
  for (uint32_t f = 0; f < 3; f++) {
    for (uint32_t idx = 0; idx < 2; idx++) {
      TEST_ASSERT_TRUE(rig.peer->read(env));
      TEST_ASSERT_TRUE(env.op == Opcode::Binary);
      TEST_ASSERT_TRUE(test::message_type(env) == MessageType::Chunk);
      TEST_ASSERT_EQUAL_UINT32(f, test::message_frame(env));
      TEST_ASSERT_EQUAL_UINT32(idx, get_u32le(env.payload.data() + 12));
    }
    TEST_ASSERT_TRUE(rig.peer->read(env));
    TEST_ASSERT_TRUE(test::message_type(env) == MessageType::EndOfFrame);
    TEST_ASSERT_EQUAL_UINT32(f, test::message_frame(env));
  }
  TEST_ASSERT_TRUE(rig.peer->read(env));
  TEST_ASSERT_TRUE(env.op == Opcode::Close);
  TEST_ASSERT_FALSE(rig.peer->read(env));

  rig.join();
  TEST_ASSERT_EQUAL_INT((int)SessionState::Closed, rig.final_state.load());
  TEST_ASSERT_EQUAL_UINT32(3, rig.session->frames_sent());
}

void test_small_frames_are_single_messages() {
  SyntheticOptions so;
  so.frames = 4;
  so.rows = 4;
  so.columns = 8;
  SyntheticFrameSource src(so);
  SessionRig rig;
  rig.start(StreamKind::PointCloudXyz, src, fast_options());

  Envelope env;
  for (uint32_t f = 0; f < 4; f++) {
    TEST_ASSERT_TRUE(rig.peer->read(env));
    TEST_ASSERT_TRUE(test::message_type(env) == MessageType::Data);

    DecodedFrame d;
    std::error_code ec;
    TEST_ASSERT_TRUE(decode_frame(env.payload.data(), env.payload.size(), d, ec));
    TEST_ASSERT_EQUAL_UINT32(f, d.hdr.frame_number);
    TEST_ASSERT_EQUAL_UINT32(2, d.hdr.stream_kind);
    TEST_ASSERT_EQUAL_UINT32(32, d.hdr.shape0);
    TEST_ASSERT_EQUAL_UINT32(3, d.hdr.shape1);
  }
  TEST_ASSERT_TRUE(rig.peer->read(env));
  TEST_ASSERT_TRUE(env.op == Opcode::Close);
  rig.join();
}

void test_reassembled_frames_match_source() {
  SyntheticOptions so;
  so.frames = 2;
  SyntheticFrameSource src(so);
  SessionRig rig;
  rig.start(StreamKind::PointCloudXyz, src, fast_options());

  Reassembler reassembler;
  std::vector<DecodedFrame> got;
  Envelope env;
  while (rig.peer->read(env) && env.op == Opcode::Binary) {
    std::error_code ec;
    auto msg = reassembler.push(std::move(env.payload), ec);
    TEST_ASSERT_FALSE(ec);
    if (!msg)
      continue;
    DecodedFrame d;
    TEST_ASSERT_TRUE(decode_frame(msg->data(), msg->size(), d, ec));
    got.push_back(std::move(d));
  }
  TEST_ASSERT_TRUE(env.op == Opcode::Close);
  TEST_ASSERT_EQUAL_UINT32(2, got.size());
  TEST_ASSERT_EQUAL_UINT32(2, reassembler.stats().reassembled);

  for (uint32_t i = 0; i < 2; i++) {
    Frame expect;
    TEST_ASSERT_TRUE(SyntheticFrameSource::fill(StreamKind::PointCloudXyz, i, so, expect));
    TEST_ASSERT_EQUAL_UINT32(i, got[i].hdr.frame_number);
    TEST_ASSERT_EQUAL_UINT32(expect.values.size(), got[i].values.size());
    TEST_ASSERT_EQUAL_MEMORY(expect.values.data(), got[i].values.data(),
                             expect.values.size() * sizeof(float));
  }
  rig.join();
}

void test_source_failure_reports_error() {
  test::ScriptedSource src;
  src.frames.push_back(test::make_frame(StreamKind::RangeImage, 0, 2, 2));
  src.fail_with = std::make_error_code(std::errc::io_error);
  SessionRig rig;
  rig.start(StreamKind::RangeImage, src, fast_options());

  Envelope env;
  TEST_ASSERT_TRUE(rig.peer->read(env));
  TEST_ASSERT_TRUE(test::message_type(env) == MessageType::Data);
  TEST_ASSERT_TRUE(rig.peer->read(env));
  TEST_ASSERT_TRUE(env.op == Opcode::Text);
  nlohmann::json j = nlohmann::json::parse(env.text());
  TEST_ASSERT_EQUAL_STRING("error", j["type"].get<std::string>().c_str());
  TEST_ASSERT_EQUAL_INT(0, j["error"].get<std::string>().find("frame source"));
  TEST_ASSERT_FALSE(rig.peer->read(env));

  rig.join();
  TEST_ASSERT_EQUAL_INT((int)SessionState::Failed, rig.final_state.load());
}

void test_malformed_frame_is_skipped() {
  test::ScriptedSource src;
  Frame bad = test::make_frame(StreamKind::RangeImage, 0, 4, 4);
  bad.values.resize(3);
  src.frames.push_back(bad);
  src.frames.push_back(test::make_frame(StreamKind::RangeImage, 0, 2, 5));
  SessionRig rig;
  rig.start(StreamKind::RangeImage, src, fast_options());

  Envelope env;
  TEST_ASSERT_TRUE(rig.peer->read(env));
  DecodedFrame d;
  std::error_code ec;
  TEST_ASSERT_TRUE(decode_frame(env.payload.data(), env.payload.size(), d, ec));
  TEST_ASSERT_EQUAL_UINT32(0, d.hdr.frame_number);
  TEST_ASSERT_EQUAL_UINT32(5, d.hdr.shape1);
  TEST_ASSERT_TRUE(rig.peer->read(env));
  TEST_ASSERT_TRUE(env.op == Opcode::Close);

  rig.join();
  TEST_ASSERT_EQUAL_INT((int)SessionState::Closed, rig.final_state.load());
  TEST_ASSERT_EQUAL_UINT32(1, rig.session->frames_sent());
}

void test_pacing_delay_between_frames() {
  SyntheticOptions so;
  so.frames = 3;
  so.rows = 2;
  so.columns = 2;
  SyntheticFrameSource src(so);
  SessionOptions opts;
  opts.fps = 20.0;
  SessionRig rig;
  rig.start(StreamKind::RangeImage, src, opts);

  Envelope env;
  TEST_ASSERT_TRUE(rig.peer->read(env));
  auto first = std::chrono::steady_clock::now();
  while (rig.peer->read(env) && env.op != Opcode::Close) {
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - first);
  // three 50 ms waits follow the first frame before the end is noticed
  TEST_ASSERT_TRUE(elapsed.count() >= 120);
  rig.join();
}

void test_peer_close_cancels_stream() {
  SyntheticOptions so;
  so.frames = 100000;
  so.rows = 2;
  so.columns = 2;
  SyntheticFrameSource src(so);
  SessionOptions opts;
  opts.fps = 50.0;
  SessionRig rig;
  rig.start(StreamKind::ReflectivityImage, src, opts);

  Envelope env;
  TEST_ASSERT_TRUE(rig.peer->read(env));
  rig.peer->send(make_envelope(Opcode::Close, nullptr, 0));
  while (rig.peer->read(env)) {
  }
  rig.join();
  TEST_ASSERT_EQUAL_INT((int)SessionState::Closed, rig.final_state.load());
  TEST_ASSERT_TRUE(rig.session->frames_sent() < 100000);
}

void test_peer_close_during_chunked_write() {
  SyntheticOptions so;
  so.frames = 100000;
  SyntheticFrameSource src(so);
  SessionRig rig;
  rig.start(StreamKind::RangeImage, src, fast_options());

  Envelope env;
  TEST_ASSERT_TRUE(rig.peer->read(env));
  TEST_ASSERT_TRUE(test::message_type(env) == MessageType::Chunk);
  rig.peer->send(make_envelope(Opcode::Close, nullptr, 0));

  // whatever was already queued may still drain, but a cancelled stream
  // never sends its own Close
  while (rig.peer->read(env))
    TEST_ASSERT_TRUE(env.op == Opcode::Binary);
  rig.join();
  TEST_ASSERT_EQUAL_INT((int)SessionState::Closed, rig.final_state.load());
  TEST_ASSERT_TRUE(rig.session->frames_sent() < 100000);
}

void test_peer_reset_during_chunked_write() {
  SyntheticOptions so;
  so.frames = 100000;
  SyntheticFrameSource src(so);
  SessionRig rig;
  rig.start(StreamKind::CombinedInterleaved, src, fast_options());

  Envelope env;
  TEST_ASSERT_TRUE(rig.peer->read(env));
  TEST_ASSERT_TRUE(test::message_type(env) == MessageType::Chunk);
  rig.peer->socket().set_option(asio::socket_base::linger(true, 0));
  rig.peer->close();

  // the reset reaches either the pending read or the pending write first
  rig.join();
  int st = rig.final_state.load();
  TEST_ASSERT_TRUE(st == (int)SessionState::Closed ||
                   st == (int)SessionState::Failed);
  TEST_ASSERT_TRUE(rig.session->frames_sent() < 100000);
}

void test_transport_error_fails_session() {
  SyntheticOptions so;
  so.frames = 10;
  SyntheticFrameSource src(so);
  SessionRig rig;
  rig.start(StreamKind::RangeImage, src, fast_options(), true);

  Envelope env;
  TEST_ASSERT_FALSE(rig.peer->read(env));
  rig.join();
  TEST_ASSERT_EQUAL_INT((int)SessionState::Failed, rig.final_state.load());
  TEST_ASSERT_EQUAL_UINT32(0, rig.session->frames_sent());
}

int main(void) {
  UNITY_BEGIN();

  RUN_TEST(test_chunked_frames_arrive_in_order);
  RUN_TEST(test_small_frames_are_single_messages);
  RUN_TEST(test_reassembled_frames_match_source);
  RUN_TEST(test_source_failure_reports_error);
  RUN_TEST(test_malformed_frame_is_skipped);
  RUN_TEST(test_pacing_delay_between_frames);
  RUN_TEST(test_peer_close_cancels_stream);
  RUN_TEST(test_peer_close_during_chunked_write);
  RUN_TEST(test_peer_reset_during_chunked_write);
  RUN_TEST(test_transport_error_fails_session);

  return UNITY_END();
}
