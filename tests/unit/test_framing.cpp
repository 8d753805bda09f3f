#include <gtest/gtest.h>
#include "mcpcore/framing.hpp"
#include "mcpcore/error.hpp"

using namespace mcpcore;

// ---- NewlineFramer ----

TEST(NewlineFramer, SplitsLines) {
    NewlineFramer f;
    std::string buf = "{\"a\":1}\n{\"b\":2}\n{\"c\"";
    EXPECT_EQ(f.next_frame(buf), "{\"a\":1}");
    EXPECT_EQ(f.next_frame(buf), "{\"b\":2}");
    EXPECT_FALSE(f.next_frame(buf).has_value());
    EXPECT_EQ(buf, "{\"c\"");
}

TEST(NewlineFramer, StripsCarriageReturnAndSkipsBlankLines) {
    NewlineFramer f;
    std::string buf = "\n\r\n{\"a\":1}\r\n";
    EXPECT_EQ(f.next_frame(buf), "{\"a\":1}");
    EXPECT_TRUE(buf.empty());
}

TEST(NewlineFramer, EncodeAppendsNewline) {
    NewlineFramer f;
    EXPECT_EQ(f.encode("{}"), "{}\n");
    EXPECT_EQ(f.mode(), FramingMode::Newline);
}

TEST(NewlineFramer, OversizedLineIsFramingError) {
    NewlineFramer f(8);
    std::string buf = "0123456789\n";
    EXPECT_THROW(f.next_frame(buf), FramingError);
}

TEST(NewlineFramer, OversizedPartialLineIsFramingError) {
    NewlineFramer f(8);
    std::string buf = "0123456789";
    EXPECT_THROW(f.next_frame(buf), FramingError);
}

TEST(NewlineFramer, NulByteIsFramingError) {
    NewlineFramer f;
    std::string buf("{\"a\":\0}\n", 8);
    EXPECT_THROW(f.next_frame(buf), FramingError);
}

TEST(NewlineFramer, FinishAcceptsUnterminatedLastLine) {
    NewlineFramer f;
    std::string buf = "{\"a\":1}\n{\"b\":2}";
    EXPECT_EQ(f.finish(buf), "{\"a\":1}");
    EXPECT_EQ(f.finish(buf), "{\"b\":2}");
    EXPECT_FALSE(f.finish(buf).has_value());
}

TEST(NewlineFramer, FinishIgnoresTrailingWhitespace) {
    NewlineFramer f;
    std::string buf = "  \r";
    EXPECT_FALSE(f.finish(buf).has_value());
    EXPECT_TRUE(buf.empty());
}

// ---- ContentLengthFramer ----

TEST(ContentLengthFramer, EncodeAndDecode) {
    ContentLengthFramer f;
    std::string frame = f.encode("{\"x\":1}");
    EXPECT_EQ(frame, "Content-Length: 7\r\n\r\n{\"x\":1}");

    std::string buf = frame + f.encode("{}");
    EXPECT_EQ(f.next_frame(buf), "{\"x\":1}");
    EXPECT_EQ(f.next_frame(buf), "{}");
    EXPECT_TRUE(buf.empty());
}

TEST(ContentLengthFramer, WaitsForCompleteBody) {
    ContentLengthFramer f;
    std::string buf = "Content-Length: 10\r\n\r\n{\"a\":";
    EXPECT_FALSE(f.next_frame(buf).has_value());
    buf += "12}xx";
    EXPECT_EQ(f.next_frame(buf), "{\"a\":12}xx");
}

TEST(ContentLengthFramer, HeaderNameIsCaseInsensitiveAndOtherHeadersIgnored) {
    ContentLengthFramer f;
    std::string buf = "content-type: application/json\r\ncontent-length:2\r\n\r\n{}";
    EXPECT_EQ(f.next_frame(buf), "{}");
}

TEST(ContentLengthFramer, MissingLengthIsFramingError) {
    ContentLengthFramer f;
    std::string buf = "Content-Type: x\r\n\r\n{}";
    EXPECT_THROW(f.next_frame(buf), FramingError);
}

TEST(ContentLengthFramer, InvalidLengthIsFramingError) {
    ContentLengthFramer f;
    std::string buf = "Content-Length: -4\r\n\r\n{}";
    EXPECT_THROW(f.next_frame(buf), FramingError);
    std::string buf2 = "Content-Length: 12abc\r\n\r\n{}";
    EXPECT_THROW(f.next_frame(buf2), FramingError);
}

TEST(ContentLengthFramer, LengthAboveLimitIsFramingError) {
    ContentLengthFramer f(16);
    std::string buf = "Content-Length: 17\r\n\r\n";
    EXPECT_THROW(f.next_frame(buf), FramingError);
}

TEST(ContentLengthFramer, OversizedHeaderBlockIsFramingError) {
    ContentLengthFramer f;
    std::string buf = "X-Padding: " + std::string(ContentLengthFramer::MAX_HEADER_BYTES, 'a');
    EXPECT_THROW(f.next_frame(buf), FramingError);
}

TEST(ContentLengthFramer, EndOfInputInsideBodyIsFramingError) {
    ContentLengthFramer f;
    std::string buf = "Content-Length: 10\r\n\r\n{}";
    EXPECT_THROW(f.finish(buf), FramingError);

    std::string empty;
    EXPECT_FALSE(f.finish(empty).has_value());
}

// ---- Mode selection ----

TEST(Framing, ModeNames) {
    EXPECT_EQ(framing_mode_from_string("newline"), FramingMode::Newline);
    EXPECT_EQ(framing_mode_from_string("content-length"), FramingMode::ContentLength);
    EXPECT_THROW(framing_mode_from_string("websocket"), std::invalid_argument);
    EXPECT_EQ(to_string(FramingMode::ContentLength), "content-length");
    EXPECT_EQ(make_framer(FramingMode::ContentLength)->mode(), FramingMode::ContentLength);
    EXPECT_EQ(make_framer(FramingMode::Newline)->mode(), FramingMode::Newline);
}
