#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Fakes.h"
#include "Params.h"
#include "StepClient.h"
#include "comms/Protocol.h"

namespace {

uint32_t g_now_ms = 0;

// Each read of the clock moves time forward, so timeouts always expire
uint32_t steppingClock() {
  return g_now_ms++;
}

std::string sampleLine(int motor, uint32_t t_ms, int32_t pos) {
  return "{\"type\":\"sample\",\"motor\":" + std::to_string(motor) +
         ",\"t_ms\":" + std::to_string(t_ms) +
         ",\"pos\":" + std::to_string(pos) + "}\n";
}

// Board that answers at once but only streams after a long run. The clock
// moves only while the client idles.
uint32_t g_board_ms = 0;
FakeStream* g_board_stream = nullptr;
size_t g_board_chunk = 0;

uint32_t boardClock() {
  return g_board_ms;
}

void boardIdle() {
  g_board_ms += 100;

  // 200 ms period: the run ends near 20 s, then data comes in two chunks
  if (g_board_chunk == 0 && g_board_ms >= 25000) {
    for (uint32_t i = 0; i < 50; i++) g_board_stream->feed(sampleLine(1, i * 200, (int32_t)i));
    g_board_chunk++;
  } else if (g_board_chunk == 1 && g_board_ms >= 33000) {
    for (uint32_t i = 50; i < 100; i++) g_board_stream->feed(sampleLine(1, i * 200, (int32_t)i));
    g_board_stream->feed("{\"type\":\"end\",\"motor\":1,\"count\":100}\n");
    g_board_chunk++;
  }
}

}  // namespace

class StepClientTest : public ::testing::Test {
protected:
  StepClientTest() : client(stream, &steppingClock) { g_now_ms = 0; }

  FakeStream stream;
  StepClient client;
};

TEST_F(StepClientTest, CollectsReportedMotorUntilEnd) {
  stream.feed("{\"type\":\"ack\",\"seq\":1,\"ok\":true,\"error\":null}\n");
  stream.feed("{\"type\":\"heartbeat\",\"time_ms\":100,\"busy\":true}\n");
  stream.feed("{\"type\":\"log\",\"level\":\"info\",\"msg\":\"run 1\"}\n");
  stream.feed("0,1234\n");
  stream.feed(sampleLine(1, 0, 0));
  stream.feed(sampleLine(2, 0, 0));
  stream.feed(sampleLine(1, 10, 407));
  stream.feed(sampleLine(1, 20, 1020));
  stream.feed("{\"type\":\"end\",\"motor\":1,\"count\":3}\n");

  LogCapture log;
  std::vector<Sample> samples;
  ASSERT_TRUE(client.runStep(0.05f, 10, 1, 1000, samples)) << client.lastError();

  ASSERT_EQ(3u, samples.size());
  EXPECT_EQ(0u, samples[0].t_ms);
  EXPECT_EQ(10u, samples[1].t_ms);
  EXPECT_EQ(407, samples[1].position);
  EXPECT_EQ(1020, samples[2].position);

  EXPECT_EQ(1u, client.heartbeats());
  EXPECT_TRUE(client.boardBusy());
  EXPECT_EQ(1u, client.discardedLines());
  EXPECT_TRUE(log.contains("board: run 1"));

  // The command on the wire is what the board decodes
  const std::vector<std::string> sent = stream.txLines();
  ASSERT_EQ(1u, sent.size());
  CommandFrame cmd;
  ASSERT_TRUE(protocol::decodeCommandLine(sent[0].c_str(), cmd));
  EXPECT_EQ(CommandType::RUN, cmd.type);
  EXPECT_EQ(1u, cmd.seq);
  EXPECT_FLOAT_EQ(0.05f, cmd.kp);
  EXPECT_EQ(10u, cmd.period_ms);
}

TEST_F(StepClientTest, NackEndsRun) {
  stream.feed("{\"type\":\"ack\",\"seq\":1,\"ok\":false,\"error\":\"busy\"}\n");

  std::vector<Sample> samples;
  EXPECT_FALSE(client.runStep(0.05f, 10, 1, 1000, samples));
  EXPECT_STREQ("busy", client.lastError());
  EXPECT_TRUE(samples.empty());
}

TEST_F(StepClientTest, TimesOutWithoutAck) {
  // Ack for somebody else's command does not count
  stream.feed("{\"type\":\"ack\",\"seq\":99,\"ok\":true,\"error\":null}\n");

  std::vector<Sample> samples;
  EXPECT_FALSE(client.runStep(0.05f, 10, 1, 100, samples));
  EXPECT_STREQ("timeout waiting for ack", client.lastError());
}

TEST_F(StepClientTest, TimesOutWithoutEnd) {
  stream.feed("{\"type\":\"ack\",\"seq\":1,\"ok\":true,\"error\":null}\n");
  stream.feed(sampleLine(1, 0, 0));

  std::vector<Sample> samples;
  EXPECT_FALSE(client.runStep(0.05f, 10, 1, 100, samples));
  EXPECT_STREQ("timeout waiting for data", client.lastError());
  EXPECT_EQ(1u, samples.size());
}

TEST_F(StepClientTest, WriteFailureReported) {
  stream.accept_limit = 0;

  std::vector<Sample> samples;
  EXPECT_FALSE(client.runStep(0.05f, 10, 1, 100, samples));
  EXPECT_STREQ("write failed", client.lastError());
}

TEST_F(StepClientTest, StopWaitsForAck) {
  stream.feed("{\"type\":\"ack\",\"seq\":1,\"ok\":true,\"error\":null}\n");
  EXPECT_TRUE(client.stop(100));

  CommandFrame cmd;
  ASSERT_TRUE(protocol::decodeCommandLine(stream.txLines()[0].c_str(), cmd));
  EXPECT_EQ(CommandType::STOP, cmd.type);
}

TEST_F(StepClientTest, StatusRelaysBoardLog) {
  stream.feed("{\"type\":\"ack\",\"seq\":1,\"ok\":true,\"error\":null}\n");
  stream.feed("{\"type\":\"log\",\"level\":\"warn\",\"msg\":\"late=3\"}\n");

  LogCapture log;
  EXPECT_TRUE(client.status(100, 20));

  ASSERT_TRUE(log.contains("board: late=3"));
  for (size_t i = 0; i < log.entries.size(); i++) {
    if (log.entries[i].msg == "board: late=3") {
      EXPECT_EQ(LogLevel::WARN, log.entries[i].level);
    }
  }
}

TEST_F(StepClientTest, SequenceNumbersAdvance) {
  stream.feed("{\"type\":\"ack\",\"seq\":1,\"ok\":true,\"error\":null}\n");
  stream.feed("{\"type\":\"ack\",\"seq\":2,\"ok\":true,\"error\":null}\n");

  EXPECT_TRUE(client.stop(100));
  EXPECT_TRUE(client.stop(100));

  const std::vector<std::string> sent = stream.txLines();
  ASSERT_EQ(2u, sent.size());
  CommandFrame cmd;
  ASSERT_TRUE(protocol::decodeCommandLine(sent[1].c_str(), cmd));
  EXPECT_EQ(2u, cmd.seq);
}

TEST(StepClientSlowRunTest, LongPeriodOutlastsTimeout) {
  FakeStream stream;
  g_board_ms = 0;
  g_board_chunk = 0;
  g_board_stream = &stream;

  stream.feed("{\"type\":\"ack\",\"seq\":1,\"ok\":true,\"error\":null}\n");

  StepClient client(stream, &boardClock, &boardIdle);
  std::vector<Sample> samples;
  ASSERT_TRUE(client.runStep(0.05f, 200, 1, 10000, samples)) << client.lastError();

  ASSERT_EQ(STEP_SAMPLES, samples.size());
  EXPECT_EQ((STEP_SAMPLES - 1) * 200, samples.back().t_ms);
  EXPECT_GE(g_board_ms, 33000u);

  g_board_stream = nullptr;
}

TEST(StepClientSlowRunTest, SilentBoardStillTimesOut) {
  FakeStream stream;
  g_board_ms = 0;
  g_board_chunk = 2;
  g_board_stream = &stream;

  stream.feed("{\"type\":\"ack\",\"seq\":1,\"ok\":true,\"error\":null}\n");

  StepClient client(stream, &boardClock, &boardIdle);
  std::vector<Sample> samples;
  EXPECT_FALSE(client.runStep(0.05f, 200, 1, 10000, samples));
  EXPECT_STREQ("timeout waiting for data", client.lastError());

  // Run length plus one quiet timeout
  EXPECT_GE(g_board_ms, 30000u);
  EXPECT_LT(g_board_ms, 30200u);

  g_board_stream = nullptr;
}
