#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

#include "plan/presets.hpp"
#include "render/loopback_renderer.hpp"
#include "render/page_layout.hpp"
#include "render/text_dump_renderer.hpp"

namespace fs = std::filesystem;

namespace
{

fs::path fresh_dir(const std::string &tag)
{
    fs::path p = fs::temp_directory_path() / ("qrdrive-render-" + tag + "-" + std::to_string(::getpid()));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

std::string slurp(const fs::path &p)
{
    std::ifstream      ifs(p);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

}  // namespace

TEST(PageLayout, RowMajorAcrossPages)
{
    auto        l = plan::make_layout(plan::OutputType::Letter, 10, 4, plan::Ecc::L);
    diag::Error err;
    auto        g = plan::geometry(l, err);
    ASSERT_TRUE(g.has_value());

    auto p = render::place(5, l, *g);
    ASSERT_EQ(p.size(), 5u);
    EXPECT_EQ(p[0].page, 0u);
    EXPECT_EQ(p[3].page, 0u);
    EXPECT_EQ(p[4].page, 1u);
    EXPECT_EQ(p[1].row, 0u);
    EXPECT_EQ(p[1].col, 1u);
    EXPECT_EQ(p[2].row, 1u);
    EXPECT_EQ(p[2].col, 0u);
    EXPECT_DOUBLE_EQ(p[1].x, 4.5);  // 0.5 + 3.5 + 0.5
    EXPECT_DOUBLE_EQ(p[2].y, 5.75);  // 0.5 + 4.75 + 0.5
    EXPECT_DOUBLE_EQ(p[4].x, 0.5);
    EXPECT_DOUBLE_EQ(p[0].text_w, 0.0);
}

TEST(PageLayout, TextAreaFollowsSide)
{
    auto l = plan::make_layout(plan::OutputType::Letter, 10, 4, plan::Ecc::L,
                               plan::TextSide::Below, 0.2);
    diag::Error err;
    auto        g = plan::geometry(l, err);
    ASSERT_TRUE(g.has_value());
    auto p = render::place(1, l, *g);
    EXPECT_DOUBLE_EQ(p[0].text_w, 3.5);
    EXPECT_NEAR(p[0].text_h, 0.95, 1e-9);

    EXPECT_EQ(render::text_capacity(0.0, 1.0), 0u);
    EXPECT_GT(render::text_capacity(3.5, 0.95), 500u);
}

TEST(TextDumpRenderer, WritesCodesAndManifest)
{
    const auto dir = fresh_dir("dump");
    auto       l   = plan::make_layout(plan::OutputType::Letter, 10, 4, plan::Ecc::L);
    render::TextDumpRenderer r(dir.string());

    const std::vector<std::string> frames = {"::f::a.txt::/f::::c0::he", "::c1::llo"};
    ASSERT_TRUE(r.begin("a.txt", frames.size()));
    for (std::size_t i = 0; i < frames.size(); ++i)
        ASSERT_TRUE(r.render_code(i, frames[i], l, render::StyleOptions{}));
    ASSERT_TRUE(r.render_pages(frames, l));

    EXPECT_EQ(slurp(dir / "a.txt.0.txt"), frames[0]);
    EXPECT_EQ(slurp(dir / "a.txt.1.txt"), frames[1]);
    const std::string manifest = slurp(dir / "a.txt.pages.txt");
    EXPECT_NE(manifest.find("page=1 row=0 col=0 index=0"), std::string::npos);
    EXPECT_NE(manifest.find("page=1 row=0 col=1 index=1"), std::string::npos);
    EXPECT_EQ(r.written().size(), 3u);

    r.abort();
    EXPECT_FALSE(fs::exists(dir / "a.txt.0.txt"));
    EXPECT_FALSE(fs::exists(dir / "a.txt.pages.txt"));
    fs::remove_all(dir);
}

TEST(TextDumpRenderer, InlineTextThatDoesNotFitFails)
{
    const auto dir = fresh_dir("fit");
    auto       l   = plan::make_layout(plan::OutputType::Letter, 10, 4, plan::Ecc::L,
                                       plan::TextSide::Right, 0.01);
    render::TextDumpRenderer r(dir.string());
    const std::vector<std::string> frames = {"::f::b.txt::/f::::c0::" + std::string(400, 'x')};

    ASSERT_TRUE(r.begin("b.txt", 1));
    ASSERT_TRUE(r.render_code(0, frames[0], l, render::StyleOptions{}));
    testing::internal::CaptureStderr();
    EXPECT_FALSE(r.render_pages(frames, l));
    std::string log = testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("does not fit"), std::string::npos);
    fs::remove_all(dir);
}

TEST(TextDumpRenderer, IndexOutsideRunRejected)
{
    render::TextDumpRenderer r(fs::temp_directory_path().string());
    ASSERT_TRUE(r.begin("c.txt", 1));
    testing::internal::CaptureStderr();
    EXPECT_FALSE(r.render_code(3, "::c3::", plan::LayoutPlan{}, render::StyleOptions{}));
    testing::internal::GetCapturedStderr();
    EXPECT_FALSE(r.begin("", 1));
}

TEST(LoopbackRenderer, CollectsAndCountsPages)
{
    render::LoopbackRenderer r;
    auto l = plan::make_layout(plan::OutputType::Letter, 10, 4, plan::Ecc::L);
    std::vector<std::string> frames(9, "::c0::");
    ASSERT_TRUE(r.begin("x", frames.size()));
    for (std::size_t i = 0; i < frames.size(); ++i)
        ASSERT_TRUE(r.render_code(i, frames[i], l, render::StyleOptions{}));
    ASSERT_TRUE(r.render_pages(frames, l));
    EXPECT_EQ(r.pages(), 3u);
    EXPECT_EQ(r.codes().size(), 9u);
}
