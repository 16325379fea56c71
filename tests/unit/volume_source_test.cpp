#include <gtest/gtest.h>

#include "core/image_volume_source.hpp"
#include "services/contrast/contrast_window.hpp"
#include "services/slice/axis_slice_renderer.hpp"

#include "../test_utils/volume_generator.hpp"

#include <cmath>

using namespace tomo_viewer;
using namespace tomo_viewer::core;

class VolumeSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        volume = test_utils::createRampVolume(10, 10, 10);
    }

    VolumeHandle volume;
};

// ==================== Shape and Access ====================

TEST_F(VolumeSourceTest, ShapeIsZYX) {
    auto rect = test_utils::wrap(test_utils::createImage(7, 5, 3));
    EXPECT_EQ(rect->shape(), (VolumeShape{3, 5, 7}));
    EXPECT_EQ(rect->shape().total(), 105u);
    EXPECT_EQ(rect->voxelType(), VoxelType::Float32);
}

TEST_F(VolumeSourceTest, VoxelUsesCOrder) {
    EXPECT_FLOAT_EQ(volume->voxel(2, 3, 4), 234.0f);
    EXPECT_FLOAT_EQ(volume->at(2 * 100 + 3 * 10 + 4), 234.0f);
}

TEST_F(VolumeSourceTest, ReadXYReturnsRowsOfX) {
    auto slice = volume->readXY(5);
    ASSERT_EQ(slice.width, 10);
    ASSERT_EQ(slice.height, 10);
    EXPECT_FLOAT_EQ(slice.at(3, 4), 543.0f);
    EXPECT_FLOAT_EQ(slice.at(0, 0), 500.0f);
}

TEST_F(VolumeSourceTest, ReadXZReturnsRowsOfZ) {
    auto rect = test_utils::wrap(test_utils::createImage(6, 4, 3, [](double x, double y, double z) {
        return x + 10.0 * y + 100.0 * z;
    }));
    auto slice = rect->readXZ(2);
    ASSERT_EQ(slice.width, 6);
    ASSERT_EQ(slice.height, 3);
    EXPECT_FLOAT_EQ(slice.at(5, 1), 125.0f);
    EXPECT_FLOAT_EQ(slice.at(0, 2), 220.0f);
}

// ==================== Trilinear Sampling ====================

TEST_F(VolumeSourceTest, SampleIsExactAtLatticePoints) {
    for (int z = 0; z < 10; z += 3) {
        for (int y = 0; y < 10; y += 2) {
            for (int x = 0; x < 10; ++x) {
                EXPECT_EQ(volume->sample(x, y, z), volume->voxel(z, y, x))
                    << "at (" << x << ", " << y << ", " << z << ")";
            }
        }
    }
}

TEST_F(VolumeSourceTest, SampleBlendsLinearly) {
    // The ramp is linear, so trilinear interpolation reproduces it exactly
    EXPECT_NEAR(volume->sample(2.5, 3.25, 4.75), 2.5 + 32.5 + 475.0, 1e-3);
}

TEST_F(VolumeSourceTest, SampleClampsOutOfRangeCoordinates) {
    EXPECT_FLOAT_EQ(volume->sample(-5.0, -1.0, -0.5), 0.0f);
    EXPECT_FLOAT_EQ(volume->sample(20.0, 9.0, 100.0), volume->voxel(9, 9, 9));
    EXPECT_FLOAT_EQ(volume->sample(4.0, -3.0, 2.0), volume->voxel(2, 0, 4));
}

TEST_F(VolumeSourceTest, SingleVoxelVolume) {
    auto single = test_utils::createConstantVolume(1, 1, 1, 7.5f);
    EXPECT_FLOAT_EQ(single->sample(0.3, -2.0, 4.0), 7.5f);
}

TEST_F(VolumeSourceTest, HeaderStatsComeFromConstructor) {
    auto plain = test_utils::wrap(test_utils::createImage(2, 2, 2));
    EXPECT_FALSE(plain->headerStats().has_value());

    auto hinted = test_utils::wrap(test_utils::createImage(2, 2, 2), "hinted",
                                   HeaderStats{-1.0, 1.0, 0.0});
    ASSERT_TRUE(hinted->headerStats().has_value());
    EXPECT_DOUBLE_EQ(hinted->headerStats()->max, 1.0);
    EXPECT_EQ(hinted->name(), "hinted");
}

// ==================== End to end ====================

TEST_F(VolumeSourceTest, XYSliceAtZ5MatchesNormalizedValue) {
    const auto range = services::ContrastRange::repaired(0.0, 999.0);
    auto raster = services::renderAxisSlice(*volume, services::SliceKind::XY, 5, range);

    ASSERT_EQ(raster.width, 10);
    ASSERT_EQ(raster.height, 10);
    EXPECT_EQ(raster.at(3, 4), services::normalize(543.0f, range));
}
