#include <gtest/gtest.h>

#include "pursuit/guidance/tracking_pipeline.hpp"

using namespace pursuit;

namespace {

// Model space is 640x360, screen is 1920x1080 (scale 3)
BoundingBox model_box(float cx, float cy, float half = 4.0f, int class_id = 0) {
    return BoundingBox{cx - half, cy - half, cx + half, cy + half, 0.9f, class_id};
}

}  // namespace

class TrackingPipelineTest : public ::testing::Test {
protected:
    TrackingPipeline pipeline;

    // Target at screen (300, 0), subject box over the screen center
    Detections detections{
        model_box(100.0f, 0.0f),
        model_box(320.0f, 180.0f, 10.0f, 7),
    };
};

TEST_F(TrackingPipelineTest, StartsDisabled) {
    EXPECT_FALSE(pipeline.is_enabled());
    EXPECT_FLOAT_EQ(pipeline.scale_factors().x, 3.0f);
    EXPECT_FLOAT_EQ(pipeline.scale_factors().y, 3.0f);
}

TEST_F(TrackingPipelineTest, DetectionsAreRescaledBeforeSelection) {
    TickResult r = pipeline.tick(detections, {0.0f, 0.0f});

    ASSERT_TRUE(r.target.has_value());
    EXPECT_FLOAT_EQ(r.target->center_x(), 300.0f);
    EXPECT_FLOAT_EQ(r.target->center_y(), 0.0f);
    EXPECT_EQ(r.candidate_count, 1u);
    ASSERT_EQ(r.screen_detections.size(), 2u);
    EXPECT_FLOAT_EQ(r.screen_detections[1].center_x(), 960.0f);
}

TEST_F(TrackingPipelineTest, DisabledSelectsButDoesNotMove) {
    TickResult r = pipeline.tick(detections, {0.0f, 0.0f});

    EXPECT_TRUE(r.target.has_value());
    EXPECT_FALSE(r.moved());
    EXPECT_EQ(pipeline.controller().phase(), ControlPhase::IDLE);
}

TEST_F(TrackingPipelineTest, EnabledMovesTowardTarget) {
    pipeline.set_enabled(true);
    TickResult r = pipeline.tick(detections, {0.0f, 0.0f});

    // error (300, 0): P=45, D=15, raw=60, smoothed=51, clamped to 30
    EXPECT_TRUE(r.moved());
    EXPECT_NEAR(r.movement.x, 30.0f, 1e-4f);
    EXPECT_NEAR(r.movement.y, 0.0f, 1e-4f);
}

TEST_F(TrackingPipelineTest, NoTargetLeavesControllerUntouched) {
    pipeline.set_enabled(true);
    pipeline.tick(detections, {0.0f, 0.0f});
    ControllerState before = pipeline.controller().state();

    TickResult r = pipeline.tick({model_box(320.0f, 180.0f, 10.0f)}, {0.0f, 0.0f});

    EXPECT_FALSE(r.target.has_value());
    EXPECT_FALSE(r.moved());
    EXPECT_EQ(pipeline.controller().state().previous_error, before.previous_error);
    EXPECT_EQ(pipeline.controller().state().previous_output, before.previous_output);
}

TEST_F(TrackingPipelineTest, ReEnableResetsController) {
    pipeline.set_enabled(true);
    pipeline.tick(detections, {0.0f, 0.0f});
    ASSERT_NE(pipeline.controller().state().previous_output, (Point2D{0.0f, 0.0f}));

    pipeline.set_enabled(false);
    EXPECT_NE(pipeline.controller().state().previous_output, (Point2D{0.0f, 0.0f}));

    pipeline.set_enabled(true);
    EXPECT_EQ(pipeline.controller().state().previous_output, (Point2D{0.0f, 0.0f}));
    EXPECT_EQ(pipeline.controller().state().previous_error, (Point2D{0.0f, 0.0f}));
}

TEST_F(TrackingPipelineTest, EnableWhileEnabledKeepsHistory) {
    pipeline.set_enabled(true);
    pipeline.tick(detections, {0.0f, 0.0f});
    Point2D out = pipeline.controller().state().previous_output;

    pipeline.set_enabled(true);

    EXPECT_EQ(pipeline.controller().state().previous_output, out);
}

TEST_F(TrackingPipelineTest, Toggle) {
    EXPECT_TRUE(pipeline.toggle());
    EXPECT_TRUE(pipeline.is_enabled());
    EXPECT_FALSE(pipeline.toggle());
    EXPECT_FALSE(pipeline.is_enabled());
}

TEST_F(TrackingPipelineTest, Stats) {
    pipeline.tick(detections, {0.0f, 0.0f});
    pipeline.set_enabled(true);
    pipeline.tick(detections, {0.0f, 0.0f});
    pipeline.tick({}, {0.0f, 0.0f});
    // Cursor within the dead zone of the target
    pipeline.tick(detections, {299.0f, 1.0f});

    const PipelineStats& s = pipeline.stats();
    EXPECT_EQ(s.ticks, 4u);
    EXPECT_EQ(s.ticks_with_target, 3u);
    EXPECT_EQ(s.ticks_engaged, 2u);
    EXPECT_EQ(s.ticks_moved, 1u);
    EXPECT_EQ(s.total_detections, 6u);

    pipeline.reset_stats();
    EXPECT_EQ(pipeline.stats().ticks, 0u);
}

TEST_F(TrackingPipelineTest, CursorConvergesOnStationaryTarget) {
    pipeline.set_enabled(true);
    Point2D cursor{0.0f, 0.0f};

    for (int i = 0; i < 200; ++i) {
        TickResult r = pipeline.tick(detections, cursor);
        cursor = cursor + r.movement;
    }

    EXPECT_LT(distance(cursor, {300.0f, 0.0f}), 5.0f);
}

TEST(TrackingPipelineConfigTest, CustomSizesAndStartEnabled) {
    PipelineConfig config;
    config.model_size = Size2D{640.0f, 640.0f};
    config.selector.surface_size = Size2D{1280.0f, 640.0f};
    config.controller.max_speed = 5.0f;
    config.start_enabled = true;

    TrackingPipeline p{config};

    EXPECT_TRUE(p.is_enabled());
    EXPECT_FLOAT_EQ(p.scale_factors().x, 2.0f);
    EXPECT_FLOAT_EQ(p.scale_factors().y, 1.0f);
    EXPECT_EQ(p.selector().self_anchor(), (Point2D{640.0f, 320.0f}));
    EXPECT_FLOAT_EQ(p.controller().params().max_speed, 5.0f);
}
