#include <algorithm>
#include <gtest/gtest.h>

#include "plan/capacity.hpp"
#include "plan/presets.hpp"

using namespace plan;

namespace
{

LayoutPlan letter_2x2(unsigned border)
{
    LayoutPlan l;  // 8.5 x 11 with 0.5 in margins
    l.columns        = 2;
    l.rows           = 2;
    l.border_modules = border;
    return l;
}

// planner ceiling, 0 when no code fits
std::size_t ceiling_of(const LayoutPlan &l)
{
    diag::Error err;
    auto        r = plan::plan(l, std::nullopt, false, err);
    return r ? r->chunk_bytes : 0;
}

bool has(const Result &r, diag::Code c)
{
    return std::any_of(r.warnings.begin(), r.warnings.end(),
                       [c](const diag::Warning &w) { return w.code == c; });
}

}  // namespace

TEST(Capacity, LetterTwoByTwoBorderOne)
{
    diag::Error err;
    auto        r = plan::plan(letter_2x2(1), std::nullopt, false, err);
    ASSERT_TRUE(r.has_value()) << err.detail;
    EXPECT_LT(r->chunk_bytes, 2953u);
    EXPECT_EQ(r->chunk_bytes, 2303u);
    EXPECT_EQ(r->version, 35u);
    EXPECT_TRUE(r->warnings.empty());
    EXPECT_DOUBLE_EQ(r->geom.cell_w, 3.5);
    EXPECT_DOUBLE_EQ(r->geom.cell_h, 4.75);
}

TEST(Capacity, CeilingIsMonotonicInPageSize)
{
    diag::Error err;
    std::size_t prev = 0;
    for (double w = 2.0; w <= 12.0; w += 0.25)
    {
        LayoutPlan l;
        l.page_width  = w;
        l.page_height = w;
        auto r        = plan::plan(l, std::nullopt, false, err);
        if (!r)
        {
            EXPECT_EQ(err.code, diag::Code::PlanLayoutTooSmall);
            EXPECT_EQ(prev, 0u);
            continue;
        }
        EXPECT_GE(r->chunk_bytes, prev) << "page " << w;
        prev = r->chunk_bytes;
    }
    EXPECT_EQ(prev, 2953u);
}

TEST(Capacity, StrongerCorrectionHoldsLess)
{
    const Tier &top = TIERS.front();
    EXPECT_EQ(tier_bytes(top, Ecc::L), 2953u);
    EXPECT_EQ(tier_bytes(top, Ecc::M), 2214u);
    EXPECT_EQ(tier_bytes(top, Ecc::H), 1181u);

    diag::Error err;
    LayoutPlan  l = letter_2x2(1);
    l.ecc         = Ecc::H;
    auto r        = plan::plan(l, std::nullopt, false, err);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->chunk_bytes, tier_bytes(TIERS[1], Ecc::H));
}

TEST(Capacity, ExplicitSizeWithinCeilingIsKept)
{
    diag::Error err;
    auto        r = plan::plan(letter_2x2(4), std::size_t{500}, false, err);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->chunk_bytes, 500u);
    EXPECT_EQ(r->ceiling, 2303u);
    EXPECT_TRUE(r->warnings.empty());
    EXPECT_EQ(r->version, 15u);
}

TEST(Capacity, ExplicitSizeAboveCeilingIsClamped)
{
    diag::Error err;
    testing::internal::CaptureStderr();
    auto r = plan::plan(letter_2x2(4), std::size_t{2500}, false, err);
    testing::internal::GetCapturedStderr();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->chunk_bytes, 2303u);
    ASSERT_EQ(r->warnings.size(), 1u);
    EXPECT_EQ(r->warnings[0].code, diag::Code::ByteSizeClamped);
    EXPECT_EQ(r->warnings[0].expected, 2303u);
    EXPECT_EQ(r->warnings[0].actual, 2500u);
}

TEST(Capacity, OverrideKeepsSizeButWarns)
{
    diag::Error err;
    testing::internal::CaptureStderr();
    auto r = plan::plan(letter_2x2(4), std::size_t{2500}, true, err);
    testing::internal::GetCapturedStderr();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->chunk_bytes, 2500u);
    EXPECT_TRUE(has(*r, diag::Code::LegibilityRisk));
    EXPECT_FALSE(has(*r, diag::Code::ByteSizeClamped));
}

TEST(Capacity, OverrideNeverExceedsLargestCode)
{
    diag::Error err;
    testing::internal::CaptureStderr();
    auto r = plan::plan(letter_2x2(4), std::size_t{5000}, true, err);
    testing::internal::GetCapturedStderr();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->chunk_bytes, 2953u);
    EXPECT_TRUE(has(*r, diag::Code::ByteSizeClamped));
    EXPECT_TRUE(has(*r, diag::Code::LegibilityRisk));
}

TEST(Capacity, LayoutTooSmall)
{
    LayoutPlan l = make_layout(OutputType::PlayingCard, 10, 40, Ecc::L);
    diag::Error err;
    EXPECT_FALSE(plan::plan(l, std::nullopt, false, err).has_value());
    EXPECT_EQ(err.code, diag::Code::PlanLayoutTooSmall);
}

TEST(Capacity, InvalidLayouts)
{
    diag::Error err;
    LayoutPlan  l;
    l.columns = 0;
    EXPECT_FALSE(plan::plan(l, std::nullopt, false, err).has_value());
    EXPECT_EQ(err.code, diag::Code::PlanInvalidLayout);

    err = diag::Error{};
    EXPECT_FALSE(plan::plan(LayoutPlan{}, std::size_t{0}, false, err).has_value());
    EXPECT_EQ(err.code, diag::Code::PlanInvalidLayout);

    err           = diag::Error{};
    l             = LayoutPlan{};
    l.page_height = -1;
    EXPECT_FALSE(plan::plan(l, std::nullopt, false, err).has_value());
    EXPECT_EQ(err.code, diag::Code::PlanInvalidLayout);
}

TEST(Capacity, TextShareShrinksTheCode)
{
    diag::Error err;
    LayoutPlan  l  = letter_2x2(1);
    auto        r0 = plan::plan(l, std::nullopt, false, err);
    l.text_side    = TextSide::Right;
    l.text_share   = 0.5;
    auto r1        = plan::plan(l, std::nullopt, false, err);
    ASSERT_TRUE(r0 && r1);
    EXPECT_LT(r1->chunk_bytes, r0->chunk_bytes);
}

TEST(Capacity, WiderBorderNeverGrowsTheCode)
{
    std::size_t prev = ceiling_of(letter_2x2(0));
    for (unsigned b = 1; b <= 60; ++b)
    {
        const std::size_t c = ceiling_of(letter_2x2(b));
        EXPECT_LE(c, prev) << "border " << b;
        prev = c;
    }
    EXPECT_LT(prev, ceiling_of(letter_2x2(0)));
}

TEST(Capacity, PixelDensityNeverGrowsTheCode)
{
    LayoutPlan  l    = letter_2x2(4);
    std::size_t prev = ceiling_of(l);
    for (unsigned px = 1; px <= 40; ++px)
    {
        l.pixel_density     = px;
        const std::size_t c = ceiling_of(l);
        EXPECT_LE(c, prev) << "pixel density " << px;
        prev = c;
    }
}

TEST(Capacity, WiderMarginsNeverGrowTheCode)
{
    std::size_t prev = ceiling_of(letter_2x2(4));
    for (double m = 0.5; m <= 3.0; m += 0.125)
    {
        LayoutPlan l      = letter_2x2(4);
        l.margin_left     = m;
        l.margin_right    = m;
        l.margin_top      = m;
        l.margin_bottom   = m;
        l.margin_interior = m;
        const std::size_t c = ceiling_of(l);
        EXPECT_LE(c, prev) << "margin " << m;
        prev = c;
    }
    EXPECT_EQ(prev, 0u);
}

TEST(Capacity, MoreCellsNeverGrowTheCode)
{
    std::size_t prev = ceiling_of(letter_2x2(4));
    for (unsigned n = 3; n <= 12; ++n)
    {
        LayoutPlan l = letter_2x2(4);
        l.columns    = n;
        l.rows       = n;
        const std::size_t c = ceiling_of(l);
        EXPECT_LE(c, prev) << n << "x" << n;
        prev = c;
    }
}

TEST(Capacity, TextShareSweepNeverGrowsTheCode)
{
    for (TextSide side : {TextSide::Right, TextSide::Below})
    {
        std::size_t prev = ceiling_of(letter_2x2(1));
        for (int pct = 0; pct <= 95; pct += 5)
        {
            LayoutPlan l        = letter_2x2(1);
            l.text_side         = side;
            l.text_share        = pct / 100.0;
            const std::size_t c = ceiling_of(l);
            EXPECT_LE(c, prev) << "share " << pct;
            prev = c;
        }
        EXPECT_LT(prev, ceiling_of(letter_2x2(1)));
    }
}

TEST(Capacity, VersionForBytes)
{
    EXPECT_EQ(version_for_bytes(0, Ecc::L), 5u);
    EXPECT_EQ(version_for_bytes(106, Ecc::L), 5u);
    EXPECT_EQ(version_for_bytes(107, Ecc::L), 10u);
    EXPECT_EQ(version_for_bytes(2953, Ecc::L), 40u);
    EXPECT_EQ(version_for_bytes(9999, Ecc::L), 40u);
    EXPECT_EQ(version_for_bytes(79, Ecc::M), 5u);
    EXPECT_EQ(version_for_bytes(80, Ecc::M), 10u);
}

TEST(Presets, ExpandToConcreteLayouts)
{
    diag::Error err;
    auto        letter = make_layout(OutputType::Letter, 10, 4, Ecc::L);
    EXPECT_EQ(letter.columns, 2u);
    EXPECT_EQ(letter.rows, 2u);
    EXPECT_TRUE(letter.paged);
    EXPECT_EQ(plan::plan(letter, std::nullopt, false, err)->chunk_bytes, 2303u);

    auto index = make_layout(OutputType::IndexCard, 10, 4, Ecc::L);
    EXPECT_DOUBLE_EQ(index.page_width, 3.0);
    EXPECT_DOUBLE_EQ(index.margin_top, 0.5);
    EXPECT_EQ(plan::plan(index, std::nullopt, false, err)->chunk_bytes, 1273u);

    auto card = make_layout(OutputType::PlayingCard, 10, 4, Ecc::L);
    auto rc   = plan::plan(card, std::nullopt, false, err);
    ASSERT_TRUE(rc.has_value());
    EXPECT_EQ(rc->chunk_bytes, 520u);
    // the chosen code and its quiet zone fit the card at the legibility floor
    const double code_edge = (77.0 + 2 * 4) * MIN_MODULE_EDGE_IN;
    EXPECT_LE(code_edge, std::min(rc->geom.cell_w, rc->geom.cell_h));

    auto png = make_layout(OutputType::Png, 10, 4, Ecc::L);
    EXPECT_FALSE(png.paged);
    EXPECT_EQ(plan::plan(png, std::nullopt, false, err)->chunk_bytes, 2953u);
}

TEST(Presets, Names)
{
    EXPECT_EQ(parse_output_type("index"), OutputType::IndexCard);
    EXPECT_EQ(parse_output_type("PNG"), OutputType::Png);
    EXPECT_FALSE(parse_output_type("a4").has_value());
    EXPECT_STREQ(output_type_name(OutputType::PlayingCard), "playing_card");
    EXPECT_EQ(parse_ecc("m"), Ecc::M);
    EXPECT_FALSE(parse_ecc("Q").has_value());
}
