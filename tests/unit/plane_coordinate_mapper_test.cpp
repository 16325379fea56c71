#include <gtest/gtest.h>

#include "services/coordinate/plane_coordinate_mapper.hpp"

#include <random>

using namespace tomo_viewer;
using namespace tomo_viewer::services;
using namespace tomo_viewer::services::coordinate;

class PlaneCoordinateMapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        mapper.setVolumeShape(core::VolumeShape{20, 30, 40});
        mapper.setCursor(Point3D(10, 12, 7));
    }

    PlaneCoordinateMapper mapper;
};

// ==================== Plane transforms ====================

TEST(PlaneTransformTest, RoundTripForPointsOnPlane) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> coord(-5.0, 50.0);
    std::uniform_real_distribution<double> pixel(-10.0, 60.0);

    for (int trial = 0; trial < 50; ++trial) {
        const Point3D p1(coord(rng), coord(rng), coord(rng));
        const Point3D p2(coord(rng), coord(rng), coord(rng));
        auto frame = buildPlaneFrame(p1, p2);
        if (!frame) {
            continue;
        }

        // Points on the plane are generated from raster coordinates
        const Point3D onPlane = planeToVolume(pixel(rng), pixel(rng), *frame);
        const RasterCoordinate raster = volumeToPlane(onPlane, *frame);
        const Point3D back = planeToVolume(raster.x, raster.y, *frame);

        EXPECT_NEAR(back.x, onPlane.x, 1e-4);
        EXPECT_NEAR(back.y, onPlane.y, 1e-4);
        EXPECT_NEAR(back.z, onPlane.z, 1e-4);
    }
}

TEST(PlaneTransformTest, ForwardInverseOfRasterCoordinates) {
    auto frame = buildPlaneFrame(Point3D(3, 4, 5), Point3D(9, 1, 12));
    ASSERT_TRUE(frame.has_value());

    const RasterCoordinate raster = volumeToPlane(planeToVolume(13.5, 2.25, *frame), *frame);
    EXPECT_NEAR(raster.x, 13.5, 1e-9);
    EXPECT_NEAR(raster.y, 2.25, 1e-9);
}

TEST(PlaneTransformTest, OriginMapsToCenterOfFirstRow) {
    auto frame = buildPlaneFrame(Point3D(0, 0, 0), Point3D(0, 0, 10));
    ASSERT_TRUE(frame.has_value());
    const RasterCoordinate raster = volumeToPlane(Point3D(0, 0, 0), *frame);
    EXPECT_DOUBLE_EQ(raster.x, 20.0);
    EXPECT_DOUBLE_EQ(raster.y, 0.0);
}

TEST(PlaneTransformTest, ClampToVolume) {
    const core::VolumeShape shape{5, 6, 7};
    const Point3D clamped = clampToVolume(Point3D(-1.5, 8.0, 2.5), shape);
    EXPECT_DOUBLE_EQ(clamped.x, 0.0);
    EXPECT_DOUBLE_EQ(clamped.y, 5.0);
    EXPECT_DOUBLE_EQ(clamped.z, 2.5);
}

TEST(PlaneTransformTest, ToVoxelIndexRoundsAndClamps) {
    const core::VolumeShape shape{5, 6, 7};
    EXPECT_EQ(toVoxelIndex(Point3D(2.6, -3.0, 10.0), shape), VoxelIndex(3, 0, 4));
    EXPECT_TRUE(toVoxelIndex(Point3D(100, 100, 100), shape).isValid(shape));
}

// ==================== View dispatch ====================

TEST_F(PlaneCoordinateMapperTest, XYUsesCursorDepth) {
    auto point = mapper.toVolume(SliceKind::XY, RasterCoordinate(3.5, 4.0));
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(*point, Point3D(3.5, 4.0, 7.0));
}

TEST_F(PlaneCoordinateMapperTest, XZUsesCursorRow) {
    auto point = mapper.toVolume(SliceKind::XZ, RasterCoordinate(3.0, 9.0));
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(*point, Point3D(3.0, 12.0, 9.0));
}

TEST_F(PlaneCoordinateMapperTest, AxisViewsRoundTrip) {
    const Point3D p(11.0, 12.0, 7.0);
    for (auto view : {SliceKind::XY, SliceKind::XZ}) {
        auto raster = mapper.toRaster(view, p);
        ASSERT_TRUE(raster.has_value());
        auto back = mapper.toVolume(view, *raster);
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, p);
    }
}

TEST_F(PlaneCoordinateMapperTest, ObliqueWithoutPlaneFails) {
    auto point = mapper.toVolume(SliceKind::Oblique, RasterCoordinate(1, 1));
    ASSERT_FALSE(point.has_value());
    EXPECT_EQ(point.error().code, GeometryError::Code::NoPlane);
    EXPECT_FALSE(mapper.toRaster(SliceKind::Oblique, Point3D()).has_value());
}

TEST_F(PlaneCoordinateMapperTest, ObliqueUsesFrame) {
    auto frame = buildPlaneFrame(Point3D(0, 0, 0), Point3D(0, 0, 10));
    ASSERT_TRUE(frame.has_value());
    mapper.setPlane(*frame);
    ASSERT_TRUE(mapper.hasPlane());

    auto point = mapper.toVolume(SliceKind::Oblique, RasterCoordinate(20, 5));
    ASSERT_TRUE(point.has_value());
    EXPECT_NEAR(point->z, 5.0, 1e-12);

    mapper.clearPlane();
    EXPECT_FALSE(mapper.hasPlane());
}

TEST_F(PlaneCoordinateMapperTest, PickClampsIntoVolume) {
    auto point = mapper.pick(SliceKind::XY, RasterCoordinate(-4.0, 55.0));
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(*point, Point3D(0.0, 29.0, 7.0));
}

TEST_F(PlaneCoordinateMapperTest, CopyIsIndependent) {
    PlaneCoordinateMapper copy = mapper;
    copy.setCursor(Point3D(0, 0, 0));
    EXPECT_EQ(mapper.cursor(), Point3D(10, 12, 7));
    EXPECT_EQ(copy.volumeShape(), mapper.volumeShape());
}
