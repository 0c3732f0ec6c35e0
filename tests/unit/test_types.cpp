#include <gtest/gtest.h>

#include "pursuit/core/coordinate.hpp"
#include "pursuit/core/types.hpp"

using namespace pursuit;

TEST(TypesTest, PointArithmetic) {
    Point2D a{3.0f, -2.0f};
    Point2D b{1.0f, 4.0f};

    EXPECT_EQ(a + b, (Point2D{4.0f, 2.0f}));
    EXPECT_EQ(a - b, (Point2D{2.0f, -6.0f}));
    EXPECT_EQ(a * 2.0f, (Point2D{6.0f, -4.0f}));
    EXPECT_EQ(0.5f * b, (Point2D{0.5f, 2.0f}));
    EXPECT_NE(a, b);
}

TEST(TypesTest, PointNormAndDistance) {
    EXPECT_FLOAT_EQ((Point2D{3.0f, 4.0f}).norm(), 5.0f);
    EXPECT_FLOAT_EQ((Point2D{}).norm(), 0.0f);
    EXPECT_FLOAT_EQ(distance({1.0f, 1.0f}, {4.0f, 5.0f}), 5.0f);
}

TEST(TypesTest, BoundingBoxDerivedValues) {
    BoundingBox box{100.0f, 200.0f, 150.0f, 300.0f, 0.8f, 3};

    EXPECT_FLOAT_EQ(box.center_x(), 125.0f);
    EXPECT_FLOAT_EQ(box.center_y(), 250.0f);
    EXPECT_FLOAT_EQ(box.width(), 50.0f);
    EXPECT_FLOAT_EQ(box.height(), 100.0f);
    EXPECT_EQ(box.center(), (Point2D{125.0f, 250.0f}));
}

TEST(TypesTest, BoundingBoxContainsIsInclusive) {
    BoundingBox box{10.0f, 20.0f, 30.0f, 40.0f, 0.5f, 0};

    EXPECT_TRUE(box.contains({20.0f, 30.0f}));
    EXPECT_TRUE(box.contains({10.0f, 30.0f}));   // Left edge
    EXPECT_TRUE(box.contains({30.0f, 30.0f}));   // Right edge
    EXPECT_TRUE(box.contains({20.0f, 20.0f}));   // Top edge
    EXPECT_TRUE(box.contains({20.0f, 40.0f}));   // Bottom edge
    EXPECT_TRUE(box.contains({30.0f, 40.0f}));   // Corner

    EXPECT_FALSE(box.contains({9.99f, 30.0f}));
    EXPECT_FALSE(box.contains({20.0f, 40.01f}));
}

TEST(TypesTest, DegenerateBoxContainsItsPoint) {
    BoundingBox point_box{5.0f, 5.0f, 5.0f, 5.0f, 1.0f, 0};
    EXPECT_TRUE(point_box.contains({5.0f, 5.0f}));
    EXPECT_FLOAT_EQ(point_box.width(), 0.0f);
}

TEST(TypesTest, BoundingBoxScaled) {
    BoundingBox box{10.0f, 20.0f, 30.0f, 40.0f, 0.7f, 2};
    BoundingBox s = box.scaled(3.0f, 2.0f);

    EXPECT_FLOAT_EQ(s.x1, 30.0f);
    EXPECT_FLOAT_EQ(s.y1, 40.0f);
    EXPECT_FLOAT_EQ(s.x2, 90.0f);
    EXPECT_FLOAT_EQ(s.y2, 80.0f);
    EXPECT_FLOAT_EQ(s.score, 0.7f);
    EXPECT_EQ(s.class_id, 2);
}

TEST(CoordinateTest, ScaleFactorsDefault) {
    ScaleFactors f = get_scale_factors();
    EXPECT_FLOAT_EQ(f.x, 3.0f);
    EXPECT_FLOAT_EQ(f.y, 3.0f);

    ScaleFactors g = get_scale_factors({640.0f, 640.0f}, {1920.0f, 1080.0f});
    EXPECT_FLOAT_EQ(g.x, 3.0f);
    EXPECT_FLOAT_EQ(g.y, 1.6875f);
}

TEST(CoordinateTest, ModelCenterMapsToScreenCenter) {
    Point2D screen = map_to_screen({320.0f, 180.0f});
    EXPECT_FLOAT_EQ(screen.x, 960.0f);
    EXPECT_FLOAT_EQ(screen.y, 540.0f);

    Point2D model = map_to_model(screen);
    EXPECT_FLOAT_EQ(model.x, 320.0f);
    EXPECT_FLOAT_EQ(model.y, 180.0f);
}

TEST(CoordinateTest, ScaleCoordinatesPerAxis) {
    Point2D p = scale_coordinates({100.0f, 100.0f}, {200.0f, 400.0f}, {400.0f, 100.0f});
    EXPECT_FLOAT_EQ(p.x, 200.0f);
    EXPECT_FLOAT_EQ(p.y, 25.0f);
}

TEST(CoordinateTest, MapDetectionsToScreen) {
    Detections model{
        BoundingBox{0.0f, 0.0f, 10.0f, 10.0f, 0.9f, 0},
        BoundingBox{310.0f, 170.0f, 330.0f, 190.0f, 0.6f, 1},
    };

    Detections screen = map_to_screen(model, get_scale_factors());

    ASSERT_EQ(screen.size(), 2u);
    EXPECT_FLOAT_EQ(screen[0].x2, 30.0f);
    EXPECT_FLOAT_EQ(screen[1].center_x(), 960.0f);
    EXPECT_FLOAT_EQ(screen[1].center_y(), 540.0f);
    EXPECT_EQ(screen[1].class_id, 1);
}

TEST(CoordinateTest, SurfaceCenter) {
    EXPECT_EQ(surface_center(DEFAULT_SCREEN_SIZE), (Point2D{960.0f, 540.0f}));
}
