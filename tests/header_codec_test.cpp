#include <gtest/gtest.h>
#include "header_codec.hpp"
#include <stomp/types.hpp>

using namespace stomp;
using namespace stomp::internal;

TEST(HeaderCodecTest, Escape_ReservedCharacters_AreSubstituted) {
    EXPECT_EQ(HeaderCodec::Escape("a:b"), "a\\cb");
    EXPECT_EQ(HeaderCodec::Escape("line1\nline2"), "line1\\nline2");
    EXPECT_EQ(HeaderCodec::Escape("cr\r"), "cr\\r");
    EXPECT_EQ(HeaderCodec::Escape("back\\slash"), "back\\\\slash");
    EXPECT_EQ(HeaderCodec::Escape("plain"), "plain");
}

TEST(HeaderCodecTest, Escape_SinglePass_DoesNotDoubleEscape) {
    // The backslash produced for ':' must not be escaped again
    EXPECT_EQ(HeaderCodec::Escape(":\\"), "\\c\\\\");
}

TEST(HeaderCodecTest, Unescape_KnownSequences_AreRestored) {
    EXPECT_EQ(HeaderCodec::Unescape("a\\cb\\n\\r\\\\"), "a:b\n\r\\");
    EXPECT_EQ(HeaderCodec::Unescape("no escapes"), "no escapes");
}

TEST(HeaderCodecTest, Unescape_UnknownSequence_ThrowsProtocolError) {
    try {
        HeaderCodec::Unescape("bad\\t");
        FAIL() << "Expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), error_code::INVALID_HEADER_ESCAPE);
    }
}

TEST(HeaderCodecTest, Unescape_TrailingBackslash_ThrowsProtocolError) {
    EXPECT_THROW(HeaderCodec::Unescape("dangling\\"), ProtocolError);
}

TEST(HeaderCodecTest, EncodeDecode_PlainHeaders_RoundTrip) {
    HeaderMap headers{{"destination", "/queue/a"}, {"receipt", "77"}, {"x-empty", ""}};

    EXPECT_EQ(HeaderCodec::DecodeHeaders(HeaderCodec::EncodeHeaders(headers)), headers);
}

TEST(HeaderCodecTest, EncodeHeaders_EscapesNamesAndValues) {
    HeaderMap encoded = HeaderCodec::EncodeHeaders({{"key:1", "a\nb"}});

    ASSERT_NE(encoded.Find("key\\c1"), nullptr);
    EXPECT_EQ(*encoded.Find("key\\c1"), "a\\nb");
}

TEST(HeaderCodecTest, ToString_JoinsLinesWithoutTrailingEol) {
    HeaderMap headers{{"a", "1"}, {"b", "2"}};

    EXPECT_EQ(HeaderCodec::ToString(headers), "a:1\nb:2");
    EXPECT_EQ(HeaderCodec::ToString(HeaderMap{}), "");
}

TEST(HeaderCodecTest, FromString_SkipsMalformedLines) {
    HeaderMap headers = HeaderCodec::FromString("a:1\nnocolon\n:novalue\nb:2\n");

    EXPECT_EQ(headers.Size(), 2u);
    EXPECT_EQ(headers.GetOr("a"), "1");
    EXPECT_EQ(headers.GetOr("b"), "2");
}

TEST(HeaderCodecTest, FromString_RepeatedName_KeepsFirstValue) {
    HeaderMap headers = HeaderCodec::FromString("foo:first\nfoo:second");

    EXPECT_EQ(headers.Size(), 1u);
    EXPECT_EQ(headers.GetOr("foo"), "first");
}

TEST(HeaderCodecTest, FromString_ValueKeepsLaterColons) {
    HeaderMap headers = HeaderCodec::FromString("time:12:30:00\r\nempty:\r\n");

    EXPECT_EQ(headers.GetOr("time"), "12:30:00");
    ASSERT_TRUE(headers.Contains("empty"));
    EXPECT_EQ(headers.GetOr("empty", "missing"), "");
}

TEST(HeaderMapTest, Add_ExistingName_IsRejected) {
    HeaderMap headers;

    EXPECT_TRUE(headers.Add("id", "1"));
    EXPECT_FALSE(headers.Add("id", "2"));
    EXPECT_EQ(headers.GetOr("id"), "1");
}

TEST(HeaderMapTest, Set_ReplacesInPlaceAndKeepsOrder) {
    HeaderMap headers{{"a", "1"}, {"b", "2"}};
    headers.Set("a", "3");
    headers.Set("c", "4");

    HeaderMap expected{{"a", "3"}, {"b", "2"}, {"c", "4"}};
    EXPECT_EQ(headers, expected);
}

TEST(HeaderMapTest, Erase_RemovesOnlyNamedHeader) {
    HeaderMap headers{{"a", "1"}, {"b", "2"}};

    EXPECT_TRUE(headers.Erase("a"));
    EXPECT_FALSE(headers.Erase("a"));
    EXPECT_EQ(headers.Size(), 1u);
    EXPECT_EQ(headers.Find("a"), nullptr);
}
