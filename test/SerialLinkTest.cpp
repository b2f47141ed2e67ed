#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Fakes.h"
#include "comms/Protocol.h"
#include "comms/SerialLink.h"

class SerialLinkTest : public ::testing::Test {
protected:
  SerialLinkTest() : link(stream) { link.begin(); }

  FakeStream stream;
  SerialLink link;
};

TEST_F(SerialLinkTest, QueuesDecodedCommand) {
  stream.feed("{\"type\":\"run\",\"seq\":1,\"kp\":0.05,\"period_ms\":10}\r\n");
  link.tick(0);

  CommandFrame cmd;
  ASSERT_TRUE(link.takeCommand(cmd));
  EXPECT_TRUE(cmd.valid);
  EXPECT_EQ(CommandType::RUN, cmd.type);
  EXPECT_FALSE(link.takeCommand(cmd));

  EXPECT_EQ(1u, link.rxLines());
  EXPECT_EQ(1u, link.rxOk());
}

TEST_F(SerialLinkTest, LineSplitAcrossTicks) {
  stream.feed("{\"type\":\"st");
  link.tick(0);
  EXPECT_FALSE(link.hasCommand());

  stream.feed("op\",\"seq\":2}\n");
  link.tick(10);

  CommandFrame cmd;
  ASSERT_TRUE(link.takeCommand(cmd));
  EXPECT_EQ(CommandType::STOP, cmd.type);
  EXPECT_EQ(2u, cmd.seq);
}

TEST_F(SerialLinkTest, FailedFrameWithSeqIsQueuedForNack) {
  stream.feed("{\"type\":\"run\",\"seq\":3,\"kp\":0,\"period_ms\":10}\n");
  link.tick(0);

  CommandFrame cmd;
  ASSERT_TRUE(link.takeCommand(cmd));
  EXPECT_FALSE(cmd.valid);
  EXPECT_EQ(3u, cmd.seq);
  EXPECT_STREQ("kp must be > 0", cmd.error);
  EXPECT_EQ(1u, link.rxFail());
}

TEST_F(SerialLinkTest, GarbageIsCountedNotQueued) {
  stream.feed("hello board\n");
  link.tick(0);

  EXPECT_FALSE(link.hasCommand());
  EXPECT_EQ(1u, link.rxFail());
  ASSERT_NE(nullptr, link.debugNote(0));
  EXPECT_NE(std::string::npos, std::string(link.debugNote(0)).find("bad json"));
  EXPECT_EQ(nullptr, link.debugNote(5000));
}

TEST_F(SerialLinkTest, OverlongLineResyncs) {
  stream.feed(std::string(300, 'x') + "\n");
  stream.feed("{\"type\":\"status\",\"seq\":8}\n");
  link.tick(0);

  EXPECT_EQ(1u, link.rxOverflow());

  CommandFrame cmd;
  ASSERT_TRUE(link.takeCommand(cmd));
  EXPECT_EQ(CommandType::STATUS, cmd.type);
  EXPECT_EQ(8u, cmd.seq);
  EXPECT_FALSE(link.hasCommand());
}

TEST_F(SerialLinkTest, FullQueueDropsNewest) {
  for (int i = 1; i <= (int)COMMAND_QUEUE_LEN + 1; i++) {
    stream.feed("{\"type\":\"status\",\"seq\":" + std::to_string(i) + "}\n");
  }
  link.tick(0);

  EXPECT_EQ(1u, link.rxDropped());

  CommandFrame cmd;
  uint32_t last_seq = 0;
  size_t n = 0;
  while (link.takeCommand(cmd)) {
    last_seq = cmd.seq;
    n++;
  }
  EXPECT_EQ(COMMAND_QUEUE_LEN, n);
  EXPECT_EQ((uint32_t)COMMAND_QUEUE_LEN, last_seq);
}

TEST_F(SerialLinkTest, SendsOneLinePerReply) {
  EXPECT_TRUE(link.sendAck(4, true));
  Sample s;
  s.t_ms = 10;
  s.position = 77;
  EXPECT_TRUE(link.sendSample(1, s));
  EXPECT_TRUE(link.sendEnd(1, 1));

  const std::vector<std::string> lines = stream.txLines();
  ASSERT_EQ(3u, lines.size());
  EXPECT_EQ("{\"type\":\"ack\",\"seq\":4,\"ok\":true,\"error\":null}", lines[0]);
  EXPECT_EQ("{\"type\":\"sample\",\"motor\":1,\"t_ms\":10,\"pos\":77}", lines[1]);
  EXPECT_EQ("{\"type\":\"end\",\"motor\":1,\"count\":1}", lines[2]);
  EXPECT_EQ('\n', stream.tx[stream.tx.size() - 1]);
}

TEST_F(SerialLinkTest, ShortWriteCountsFailure) {
  stream.accept_limit = 3;
  EXPECT_FALSE(link.sendHeartbeat(0, false));
  EXPECT_EQ(1u, link.txFail());
}

TEST_F(SerialLinkTest, LogSinkWritesLogFrames) {
  logSetSink(&SerialLink::logSink, &link);
  logSetLevel(LogLevel::INFO);

  LOG_INFO("hello %d", 3);
  LOG_DEBUG("not sent");

  logSetSink(nullptr, nullptr);

  const std::vector<std::string> lines = stream.txLines();
  ASSERT_EQ(1u, lines.size());
  EXPECT_EQ("{\"type\":\"log\",\"level\":\"info\",\"msg\":\"hello 3\"}", lines[0]);
}
