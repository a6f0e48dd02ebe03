#include "core/scaling_planner.h"

#include <gtest/gtest.h>

using namespace wallspan::core;

namespace {

const DisplayRect k_hd_display{1080, 1920, 0, 0};

ScalingPlan plan(Extent source, const DisplayRect& target, FitPolicy policy) {
    ScalingOptions options;
    options.policy = policy;
    return plan_scaling(source, target, {target}, options);
}

} // namespace

TEST(ScalingPlanner, FitCentresNarrowImage) {
    const ScalingPlan p = plan({600, 800}, k_hd_display, FitPolicy::Fit);
    EXPECT_EQ(p.current, (Extent{600, 800}));
    EXPECT_EQ(p.target, (Extent{1080, 1440}));
    EXPECT_EQ(p.fit_offsets, (Offset{0, 240}));
    EXPECT_DOUBLE_EQ(p.error_fraction, 0.25);
}

TEST(ScalingPlanner, FitCentresWideImageVertically) {
    const ScalingPlan p = plan({100, 400}, k_hd_display, FitPolicy::Fit);
    EXPECT_EQ(p.target, (Extent{480, 1920}));
    EXPECT_EQ(p.fit_offsets, (Offset{300, 0}));
    EXPECT_NEAR(p.error_fraction, 600.0 / 1080.0, 1e-12);
}

TEST(ScalingPlanner, FillCoversDisplay) {
    const ScalingPlan p = plan({600, 800}, k_hd_display, FitPolicy::Fill);
    EXPECT_EQ(p.target, (Extent{1440, 1920}));
    EXPECT_EQ(p.fit_offsets, (Offset{0, 0}));
    EXPECT_DOUBLE_EQ(p.error_fraction, 0.25);
}

TEST(ScalingPlanner, FillErrorIsCroppedShare) {
    const ScalingPlan p = plan({100, 400}, k_hd_display, FitPolicy::Fill);
    EXPECT_EQ(p.target, (Extent{1080, 4320}));
    EXPECT_NEAR(p.error_fraction, 1.0 - 1920.0 / 4320.0, 1e-12);
}

TEST(ScalingPlanner, MatchingAspectHasNoError) {
    const DisplayRect display{768, 1024, 0, 0};
    for (FitPolicy policy : {FitPolicy::Fill, FitPolicy::Fit}) {
        const ScalingPlan p = plan({384, 512}, display, policy);
        EXPECT_EQ(p.target, (Extent{768, 1024}));
        EXPECT_EQ(p.fit_offsets, (Offset{0, 0}));
        EXPECT_DOUBLE_EQ(p.error_fraction, 0.0);
    }
}

TEST(ScalingPlanner, PoliciesBoundTheDisplay) {
    const std::vector<Extent> sources = {
        {600, 800}, {800, 600}, {1, 1000}, {1000, 1}, {1080, 1920}, {1200, 1600}, {333, 777}, {2160, 3840},
    };
    const std::vector<DisplayRect> displays = {k_hd_display, {1024, 1280, 0, 0}, {1920, 1080, 0, 0}};
    for (const auto& display : displays) {
        for (const auto& source : sources) {
            const ScalingPlan fill = plan(source, display, FitPolicy::Fill);
            EXPECT_GE(fill.target.height, display.height);
            EXPECT_GE(fill.target.width, display.width);
            EXPECT_GE(fill.error_fraction, 0.0);
            EXPECT_LE(fill.error_fraction, 1.0);

            const ScalingPlan fit = plan(source, display, FitPolicy::Fit);
            EXPECT_LE(fit.target.height, display.height);
            EXPECT_LE(fit.target.width, display.width);
            EXPECT_LE(fit.fit_offsets.y + fit.target.height, display.height);
            EXPECT_LE(fit.fit_offsets.x + fit.target.width, display.width);
            EXPECT_GE(fit.error_fraction, 0.0);
            EXPECT_LE(fit.error_fraction, 1.0);
        }
    }
}

TEST(ScalingPlanner, SingleImageErrorComparesWithTotalDisplayArea) {
    const std::vector<DisplayRect> displays = {{768, 1024, 0, 0}, {768, 1024, 0, 1024}};
    const DisplayRect combined{768, 2048, 0, 0};
    ScalingOptions options;
    options.single_image = true;

    const ScalingPlan exact = plan_scaling({384, 1024}, combined, displays, options);
    EXPECT_EQ(exact.target, (Extent{768, 2048}));
    EXPECT_DOUBLE_EQ(exact.error_fraction, 0.0);

    const ScalingPlan square = plan_scaling({768, 1024}, combined, displays, options);
    EXPECT_EQ(square.target, (Extent{1536, 2048}));
    EXPECT_DOUBLE_EQ(square.error_fraction, 1.0);
}
