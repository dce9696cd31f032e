#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "proto/frame.hpp"

using namespace frame;

TEST(Frame, ChunkCountIsCeilingWithoutEmptyTail)
{
    const std::string blob(10, 'x');
    EXPECT_EQ(make_chunks(blob, 3).size(), 4u);
    EXPECT_EQ(make_chunks(blob, 5).size(), 2u);
    EXPECT_EQ(make_chunks(blob, 10).size(), 1u);
    EXPECT_EQ(make_chunks(blob, 100).size(), 1u);

    auto c = make_chunks(blob, 3);
    EXPECT_EQ(c.back().payload, "x");
    for (std::size_t i = 0; i < c.size(); ++i)
        EXPECT_EQ(c[i].index, i);
}

TEST(Frame, EmptyBlobStillYieldsHeaderChunk)
{
    auto c = make_chunks("", 100);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].index, 0u);
    EXPECT_TRUE(c[0].payload.empty());
}

TEST(Frame, ZeroChunkSizeRejected)
{
    testing::internal::CaptureStderr();
    EXPECT_TRUE(make_chunks("abc", 0).empty());
    testing::internal::GetCapturedStderr();
}

TEST(Frame, Utf8BoundariesMayAddChunks)
{
    // four 3-byte sequences never share a 4-byte chunk, so text slicing needs one extra code
    const std::string euro = "\xE2\x82\xAC";
    const std::string blob = euro + euro + euro + euro;

    auto c = make_chunks(blob, 4, true);
    ASSERT_EQ(c.size(), 4u);
    for (std::size_t i = 0; i < c.size(); ++i)
    {
        EXPECT_EQ(c[i].index, i);
        EXPECT_EQ(c[i].payload, euro);
    }
    EXPECT_EQ(make_chunks(blob, 4, false).size(), 3u);
}

TEST(Frame, Utf8BoundariesKeepSequencesWhole)
{
    // "aé€" = 61 C3 A9 E2 82 AC
    const std::string blob = "a\xC3\xA9\xE2\x82\xAC";
    auto              c    = make_chunks(blob, 4, true);
    std::string       joined;
    for (const auto &ch : c)
    {
        ASSERT_FALSE(ch.payload.empty());
        EXPECT_NE(static_cast<unsigned char>(ch.payload[0]) & 0xC0, 0x80);
        joined += ch.payload;
    }
    EXPECT_EQ(joined, blob);
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].payload, "a\xC3\xA9");

    // byte slicing splits the sequence
    auto raw = make_chunks(blob, 4, false);
    EXPECT_EQ(raw[1].payload, "\x82\xAC");
}

TEST(Frame, SerializeHeaderOnlyOnFirstFrame)
{
    codec::Flags f;
    f.was_text_encoded = true;
    f.was_compressed   = true;
    EXPECT_EQ(serialize(Chunk{0, "QUJD"}, f, "file.bin"), "b64::z:::f::file.bin::/f::::c0::QUJD");
    EXPECT_EQ(serialize(Chunk{1, "REVG"}, f, "file.bin"), "::c1::REVG");
    EXPECT_EQ(serialize(Chunk{0, "text"}, codec::Flags{}, ""), "::c0::text");
}

TEST(Frame, ParseFirstFrame)
{
    diag::Error err;
    auto        p = parse("b64::z:::f::file.bin::/f::::c0::QUJD", err);
    ASSERT_TRUE(p.has_value()) << err.detail;
    EXPECT_EQ(p->index, 0u);
    EXPECT_TRUE(p->text_encoded);
    EXPECT_TRUE(p->compressed);
    ASSERT_TRUE(p->filename.has_value());
    EXPECT_EQ(*p->filename, "file.bin");
    EXPECT_EQ(p->payload, "QUJD");
    EXPECT_FALSE(p->demoted);
}

TEST(Frame, ParseLaterFrameAndEmptyPayload)
{
    diag::Error err;
    auto        p = parse("::c42::payload ::c7:: stays", err);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->index, 42u);
    EXPECT_EQ(p->payload, "payload ::c7:: stays");

    p = parse("::c3::", err);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->index, 3u);
    EXPECT_TRUE(p->payload.empty());
}

TEST(Frame, ParseMissingTagFails)
{
    diag::Error err;
    EXPECT_FALSE(parse("just some text", err).has_value());
    EXPECT_EQ(err.code, diag::Code::FrameMissingIndexTag);
    EXPECT_NE(err.detail.find("just some text"), std::string::npos);

    err = diag::Error{};
    EXPECT_FALSE(parse("::c::x", err).has_value());
    EXPECT_FALSE(parse("::c1234567890::x", err).has_value());  // too many digits
    EXPECT_FALSE(parse("::c12", err).has_value());
}

TEST(Frame, ParseSkipsMalformedTagToNextOne)
{
    diag::Error err;
    auto        p = parse("::c12a::x::c4::y", err);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->index, 4u);
    EXPECT_EQ(p->payload, "::c12a::x" "y");
    EXPECT_TRUE(p->demoted);
}

TEST(Frame, StrayPrefixIsKeptAsPayload)
{
    diag::Error err;
    auto        p = parse("junk::c0::x", err);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->index, 0u);
    EXPECT_EQ(p->stray_prefix, 4u);
    EXPECT_EQ(p->payload, "junkx");
    EXPECT_TRUE(p->demoted);
}

TEST(Frame, HeaderOnLaterIndexIsDemoted)
{
    diag::Error err;
    auto        p = parse("b64:::f::a.bin::/f::::c1::abc", err);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->index, 1u);
    EXPECT_FALSE(p->text_encoded);
    EXPECT_FALSE(p->filename.has_value());
    EXPECT_EQ(p->payload, "b64:::f::a.bin::/f::abc");
    EXPECT_TRUE(p->demoted);
}

TEST(Frame, SerializeAllMatchesSerialOrder)
{
    auto         chunks = make_chunks(std::string(1000, 'q'), 7);
    codec::Flags f;
    auto         serial   = serialize_all(chunks, f, "q.txt", 1);
    auto         parallel = serialize_all(chunks, f, "q.txt", 4);
    ASSERT_EQ(serial.size(), chunks.size());
    EXPECT_EQ(serial, parallel);
    EXPECT_EQ(parallel[0].rfind("::f::q.txt::/f::::c0::", 0), 0u);
    EXPECT_EQ(parallel[5].rfind("::c5::", 0), 0u);
}

TEST(Frame, ValidFilename)
{
    EXPECT_TRUE(valid_filename("report.pdf"));
    EXPECT_TRUE(valid_filename("with space.txt"));
    EXPECT_FALSE(valid_filename("a:b.txt"));
    EXPECT_FALSE(valid_filename("dir/file"));
    EXPECT_FALSE(valid_filename(".."));
    EXPECT_FALSE(valid_filename(""));
}
