#include <gtest/gtest.h>
#include <string>

#include "util/diag.hpp"

TEST(Diag, FailFillsErrorAndReturnsFalse)
{
    diag::Error err;
    EXPECT_FALSE(err);
    EXPECT_FALSE(diag::fail(err, diag::Code::IncompleteSequence, "missing frames"));
    EXPECT_TRUE(err);
    EXPECT_EQ(err.code, diag::Code::IncompleteSequence);
    EXPECT_EQ(err.detail, "missing frames");
}

TEST(Diag, FatalVersusAdvisory)
{
    EXPECT_TRUE(diag::is_fatal(diag::Code::FrameMissingIndexTag));
    EXPECT_TRUE(diag::is_fatal(diag::Code::PipelineCorruptArchive));
    EXPECT_TRUE(diag::is_fatal(diag::Code::RenderFailed));
    EXPECT_FALSE(diag::is_fatal(diag::Code::DuplicateFrame));
    EXPECT_FALSE(diag::is_fatal(diag::Code::ByteSizeClamped));
    EXPECT_FALSE(diag::is_fatal(diag::Code::None));
}

TEST(Diag, Names)
{
    EXPECT_STREQ(diag::to_string(diag::Code::OutOfOrderFrame), "OutOfOrderWarning");
    EXPECT_STREQ(diag::to_string(diag::Code::IncompleteSequence), "IncompleteSequenceError");
    EXPECT_STREQ(diag::to_string(diag::Code::ProtocolMissingHeader), "ProtocolError(MissingHeader)");
}

TEST(Diag, FormatIndicesCollapsesRuns)
{
    EXPECT_EQ(diag::format_indices({}), "");
    EXPECT_EQ(diag::format_indices({2}), "2");
    EXPECT_EQ(diag::format_indices({0, 3, 7, 8, 9}), "0,3,7-9");
}

TEST(Diag, ExcerptIsShortAndPrintable)
{
    const std::string text = std::string("ab\x01") + std::string(100, 'x');
    const std::string e    = diag::excerpt(text);
    EXPECT_LE(e.size(), 52u);
    EXPECT_EQ(e.find('\x01'), std::string::npos);
}
