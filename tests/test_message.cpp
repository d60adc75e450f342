#include <gtest/gtest.h>
#include <string>

#include "proto/message.hpp"

using namespace xfer;

TEST(Classify, Markers)
{
    EXPECT_EQ(classify("-----BEGIN XFER MESSAGE-----").kind, Kind::TransferBegin);
    EXPECT_EQ(classify("-----END XFER MESSAGE-----").kind, Kind::TransferEnd);
    EXPECT_EQ(classify("-----BEGIN XFER HEADER-----").kind, Kind::HeaderBegin);
    EXPECT_EQ(classify("-----END XFER HEADER-----").kind, Kind::HeaderEnd);
}

TEST(Classify, MarkersAreExactMatches)
{
    EXPECT_EQ(classify(" -----BEGIN XFER MESSAGE-----").kind, Kind::Unrecognized);
    EXPECT_EQ(classify("-----BEGIN XFER MESSAGE----- ").kind, Kind::Unrecognized);
    EXPECT_EQ(classify("-----begin xfer message-----").kind, Kind::Unrecognized);
}

TEST(Classify, HeaderFields)
{
    auto len = classify("LEN:10");
    EXPECT_EQ(len.kind, Kind::HeaderField);
    EXPECT_EQ(len.name, "LEN");
    EXPECT_EQ(len.value, "10");

    auto hash = classify("HASH:abcdef123");
    EXPECT_EQ(hash.kind, Kind::HeaderField);
    EXPECT_EQ(hash.name, "HASH");
    EXPECT_EQ(hash.value, "abcdef123");

    // the value is everything after the first colon, even if empty or odd
    auto empty = classify("LEN:");
    EXPECT_EQ(empty.kind, Kind::HeaderField);
    EXPECT_EQ(empty.value, "");
    EXPECT_EQ(classify("HASH:a:b").value, "a:b");
}

TEST(Classify, DataChunk)
{
    auto m = classify("0000000042:dGVzdCBkYXRh");
    ASSERT_EQ(m.kind, Kind::DataChunk);
    EXPECT_EQ(m.chunk.seq, 42u);
    EXPECT_EQ(m.chunk.payload, "dGVzdCBkYXRh");
}

TEST(Classify, DataChunkLargestSequence)
{
    auto m = classify("9999999999:QQ==");
    ASSERT_EQ(m.kind, Kind::DataChunk);
    EXPECT_EQ(m.chunk.seq, 9999999999ULL);
}

TEST(Classify, DataChunkPayloadIsOpaque)
{
    // not base64, still a chunk; decoding happens at reassembly
    auto m = classify("0000000001:not base64!");
    ASSERT_EQ(m.kind, Kind::DataChunk);
    EXPECT_EQ(m.chunk.payload, "not base64!");
}

TEST(Classify, Rejects)
{
    EXPECT_EQ(classify("").kind, Kind::Unrecognized);
    EXPECT_EQ(classify("invalid message").kind, Kind::Unrecognized);
    EXPECT_EQ(classify("not a real message").kind, Kind::Unrecognized);
    EXPECT_EQ(classify("invalid:format").kind, Kind::Unrecognized);
    EXPECT_EQ(classify("000000042:abc").kind, Kind::Unrecognized);    // 9 digits
    EXPECT_EQ(classify("00000000042:abc").kind, Kind::Unrecognized);  // 11 digits
    EXPECT_EQ(classify("0000000042:").kind, Kind::Unrecognized);      // empty payload
    EXPECT_EQ(classify("0000000042").kind, Kind::Unrecognized);
    EXPECT_EQ(classify("00000a0042:abc").kind, Kind::Unrecognized);
    EXPECT_EQ(classify("0000000042:ab\ncd").kind, Kind::Unrecognized);
    EXPECT_EQ(classify("len:10").kind, Kind::Unrecognized);
}

TEST(Classify, HandlesEmbeddedNul)
{
    std::string s("0000000001:A", 12);
    s.push_back('\0');
    auto m = classify(s);
    EXPECT_EQ(m.kind, Kind::DataChunk);
    EXPECT_EQ(m.chunk.payload.size(), 2u);
}
