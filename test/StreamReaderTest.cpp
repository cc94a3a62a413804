#include <gtest/gtest.h>

#include "FakeStreams.hpp"
#include "StreamReader.hpp"

TEST(StreamReaderTest, ReadsExactCountInOneRead) {
    FragmentedReadStream stream(bytes("abcdefgh"));

    std::vector<char> got = readExact(stream, 5);

    EXPECT_EQ(got, bytes("abcde"));
    EXPECT_EQ(stream.consumed(), 5u);
    EXPECT_EQ(stream.reads(), 1u);
}

TEST(StreamReaderTest, OneByteFragmentsGiveTheSameResult) {
    std::vector<char> data = bytes("the quick brown fox");
    FragmentedReadStream whole(data);
    FragmentedReadStream trickle(data, 1);

    std::vector<char> a = readExact(whole, data.size());
    std::vector<char> b = readExact(trickle, data.size());

    EXPECT_EQ(a, b);
    EXPECT_EQ(b, data);
    EXPECT_EQ(trickle.reads(), data.size());
}

TEST(StreamReaderTest, OddFragmentsAcrossSeveralCalls) {
    FragmentedReadStream stream(bytes("0123456789"), 3);

    EXPECT_EQ(readExact(stream, 4), bytes("0123"));
    EXPECT_EQ(readExact(stream, 1), bytes("4"));
    EXPECT_EQ(readExact(stream, 5), bytes("56789"));
    EXPECT_EQ(stream.remaining(), 0u);
}

TEST(StreamReaderTest, ZeroBytesDoesNotTouchTheStream) {
    FragmentedReadStream stream(std::vector<char>{});

    std::vector<char> got = readExact(stream, 0);

    EXPECT_TRUE(got.empty());
    EXPECT_EQ(stream.reads(), 0u);
}

TEST(StreamReaderTest, ShortStreamThrowsEndOfStream) {
    FragmentedReadStream stream(bytes("abc"), 1);

    try {
        readExact(stream, 5);
        FAIL() << "expected EndOfStream";
    }
    catch (const EndOfStream& e) {
        EXPECT_EQ(e.expected(), 5u);
        EXPECT_EQ(e.received(), 3u);
    }
}

TEST(StreamReaderTest, EmptyStreamThrowsEndOfStream) {
    FragmentedReadStream stream(std::vector<char>{});
    EXPECT_THROW(readExact(stream, 1), EndOfStream);
}

TEST(StreamReaderTest, EndOfStreamIsATransportError) {
    FragmentedReadStream stream(bytes("x"));
    EXPECT_THROW(readExact(stream, 2), TransportError);
}

TEST(StreamReaderTest, OtherErrorsAreTransportErrorsNotEndOfStream) {
    FragmentedReadStream stream(bytes("abc"));
    stream.failWith(boost::asio::error::connection_reset);

    try {
        readExact(stream, 2);
        FAIL() << "expected TransportError";
    }
    catch (const EndOfStream&) {
        FAIL() << "connection reset is not end of stream";
    }
    catch (const TransportError& e) {
        EXPECT_EQ(e.code(), boost::asio::error::connection_reset);
    }
}

TEST(StreamReaderTest, PayloadLargerThanOneStepArrivesWhole) {
    std::vector<char> data(kReadExactStep * 2 + 17);
    for (std::size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>(i % 253);
    FragmentedReadStream stream(data, 5000);

    EXPECT_EQ(readExact(stream, data.size()), data);
    EXPECT_EQ(stream.remaining(), 0u);
}
