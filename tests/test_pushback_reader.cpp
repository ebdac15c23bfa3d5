#include <gtest/gtest.h>
#include "bencode/BencodeError.hpp"
#include "bencode/PushbackReader.hpp"
#include "TestSources.hpp"
#include <sstream>
#include <unistd.h>
#include <vector>

class PushbackReaderTest : public ::testing::Test {
protected:
    StringByteSource source{"abc"};
    PushbackReader reader{source};
};

TEST_F(PushbackReaderTest, PopConsumesBytesInOrder) {
    EXPECT_EQ(reader.pop(), 'a');
    EXPECT_EQ(reader.pop(), 'b');
    EXPECT_EQ(reader.pop(), 'c');
    EXPECT_THROW(reader.pop(), EndOfInputError);
}

TEST_F(PushbackReaderTest, PeekIsIdempotent) {
    EXPECT_EQ(reader.peek(), 'a');
    EXPECT_EQ(reader.peek(), 'a');
    EXPECT_EQ(reader.position(), 0u);
    EXPECT_EQ(reader.pop(), 'a');
    EXPECT_EQ(reader.peek(), 'b');
    EXPECT_EQ(reader.position(), 1u);
}

TEST_F(PushbackReaderTest, PeekAtEndThrows) {
    reader.skip(3);
    EXPECT_THROW(reader.peek(), EndOfInputError);
}

TEST_F(PushbackReaderTest, SecondUnreadIsRejected) {
    uint8_t value = reader.pop();
    reader.unread(value);
    EXPECT_THROW(reader.unread(value), std::logic_error);
}

TEST_F(PushbackReaderTest, ReadDrainsPushbackFirst) {
    reader.peek();
    uint8_t buffer[3];
    size_t received = reader.read(buffer, 3);
    ASSERT_EQ(received, 3u);
    EXPECT_EQ(std::string(buffer, buffer + 3), "abc");
    EXPECT_EQ(reader.read(buffer, 3), 0u);
}

TEST_F(PushbackReaderTest, SkipStopsAtEndOfStream) {
    EXPECT_EQ(reader.skip(2), 2u);
    EXPECT_EQ(reader.skip(10), 1u);
    EXPECT_EQ(reader.position(), 3u);
}

TEST(PushbackReaderShortReadTest, ReadFullyAbsorbsShortReads) {
    ChunkedByteSource source("0123456789", 3);
    PushbackReader reader(source);

    std::vector<uint8_t> data(10);
    reader.readFully(data.data(), data.size());
    EXPECT_EQ(std::string(data.begin(), data.end()), "0123456789");
    EXPECT_GE(source.reads, 4u);
}

TEST(PushbackReaderShortReadTest, ReadFullyFailsOnTruncatedSource) {
    ChunkedByteSource source("abc");
    PushbackReader reader(source);

    std::vector<uint8_t> data(5);
    EXPECT_THROW(reader.readFully(data.data(), data.size()), EndOfInputError);
}

TEST(ByteSourceTest, StreamSourceReadsUntilEnd) {
    std::istringstream in("hello");
    StreamByteSource source(in);
    PushbackReader reader(source);

    std::vector<uint8_t> data(5);
    reader.readFully(data.data(), data.size());
    EXPECT_EQ(std::string(data.begin(), data.end()), "hello");
    EXPECT_THROW(reader.pop(), EndOfInputError);
}

TEST(ByteSourceTest, FileDescriptorSourceReadsPipe) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    const std::string payload = "i42e";
    ASSERT_EQ(write(fds[1], payload.data(), payload.size()), static_cast<ssize_t>(payload.size()));
    close(fds[1]);

    FileDescriptorByteSource source(fds[0]);
    PushbackReader reader(source);
    std::vector<uint8_t> data(4);
    reader.readFully(data.data(), data.size());
    EXPECT_EQ(std::string(data.begin(), data.end()), payload);
    EXPECT_THROW(reader.pop(), EndOfInputError);
    close(fds[0]);
}

TEST_F(PushbackReaderTest, UnreadBeforeAnyPopKeepsPositionAtZero) {
    reader.unread('x');
    EXPECT_EQ(reader.position(), 0u);
    EXPECT_EQ(reader.pop(), 'x');
    EXPECT_EQ(reader.pop(), 'a');
}
