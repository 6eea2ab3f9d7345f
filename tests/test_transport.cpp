#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <unistd.h>
#include "../src/io/StdioTransport.hpp"

class LineReaderTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_EQ(::pipe(fds), 0); }
  void TearDown() override {
    if (fds[0] >= 0) ::close(fds[0]);
    closeWriter();
  }
  void send(const std::string& s) { ASSERT_EQ(::write(fds[1], s.data(), s.size()), static_cast<ssize_t>(s.size())); }
  void closeWriter() {
    if (fds[1] >= 0) ::close(fds[1]);
    fds[1] = -1;
  }

  int fds[2] = {-1, -1};
};

TEST_F(LineReaderTest, SplitsLinesAndStripsCarriageReturn) {
  LineReader reader(fds[0]);
  send("{\"a\":1}\r\n{\"b\":2}\n");
  std::string line;
  ASSERT_EQ(reader.next(line, 100), LineReader::Status::Line);
  EXPECT_EQ(line, "{\"a\":1}");
  ASSERT_EQ(reader.next(line, 100), LineReader::Status::Line);
  EXPECT_EQ(line, "{\"b\":2}");
  EXPECT_EQ(reader.next(line, 10), LineReader::Status::Idle);
}

TEST_F(LineReaderTest, PartialLineWaitsForNewline) {
  LineReader reader(fds[0]);
  std::string line;
  send("{\"jsonrpc\":");
  EXPECT_EQ(reader.next(line, 10), LineReader::Status::Idle);
  send("\"2.0\"}\n");
  ASSERT_EQ(reader.next(line, 100), LineReader::Status::Line);
  EXPECT_EQ(line, "{\"jsonrpc\":\"2.0\"}");
}

TEST_F(LineReaderTest, TrailingLineWithoutNewlineAtEof) {
  LineReader reader(fds[0]);
  send("last");
  closeWriter();
  std::string line;
  ASSERT_EQ(reader.next(line, 100), LineReader::Status::Line);
  EXPECT_EQ(line, "last");
  EXPECT_EQ(reader.next(line, 100), LineReader::Status::Eof);
}

TEST_F(LineReaderTest, WriteLineAppendsNewline) {
  ASSERT_TRUE(writeLine(fds[1], "{\"ok\":true}"));
  LineReader reader(fds[0]);
  std::string line;
  ASSERT_EQ(reader.next(line, 100), LineReader::Status::Line);
  EXPECT_EQ(line, "{\"ok\":true}");
}

TEST_F(LineReaderTest, OversizedLineIsDroppedAndReaderResyncs) {
  const int writer = fds[1];
  bool writesOk = true;
  // The pipe holds far less than one oversized line, so the writer runs beside the reader.
  std::thread feed([writer, &writesOk] {
    const std::string chunk(64 * 1024, 'x');
    for (size_t sent = 0; sent <= kMaxLineBytes + chunk.size(); sent += chunk.size()) {
      if (::write(writer, chunk.data(), chunk.size()) != static_cast<ssize_t>(chunk.size())) writesOk = false;
    }
    writesOk = writeLine(writer, "") && writesOk;
    writesOk = writeLine(writer, "{\"id\":2}") && writesOk;
  });

  LineReader reader(fds[0]);
  std::string line;
  LineReader::Status st = LineReader::Status::Idle;
  while ((st = reader.next(line, 1000)) == LineReader::Status::Idle) {}
  EXPECT_EQ(st, LineReader::Status::Overflow);

  while ((st = reader.next(line, 1000)) == LineReader::Status::Idle) {}
  feed.join();
  EXPECT_TRUE(writesOk);
  ASSERT_EQ(st, LineReader::Status::Line);
  EXPECT_EQ(line, "{\"id\":2}");
}
