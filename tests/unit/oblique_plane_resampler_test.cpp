// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include <gtest/gtest.h>

#include "services/coordinate/plane_coordinate_mapper.hpp"
#include "services/oblique/oblique_plane_resampler.hpp"

#include "../test_utils/volume_generator.hpp"

#include <cmath>

using namespace tomo_viewer;
using namespace tomo_viewer::services;

namespace {

void expectOrthonormal(const PlaneFrame& frame) {
    EXPECT_NEAR(frame.tangentV.length(), 1.0, 1e-9);
    EXPECT_NEAR(frame.lateralA.length(), 1.0, 1e-9);
    EXPECT_NEAR(frame.normalB.length(), 1.0, 1e-9);
    EXPECT_NEAR(frame.tangentV.dot(frame.lateralA), 0.0, 1e-9);
    EXPECT_NEAR(frame.tangentV.dot(frame.normalB), 0.0, 1e-9);
    EXPECT_NEAR(frame.lateralA.dot(frame.normalB), 0.0, 1e-9);

    // Right-handed: normalB = tangentV x lateralA
    const Vector3D expected = frame.tangentV.cross(frame.lateralA);
    EXPECT_NEAR(expected.x, frame.normalB.x, 1e-9);
    EXPECT_NEAR(expected.y, frame.normalB.y, 1e-9);
    EXPECT_NEAR(expected.z, frame.normalB.z, 1e-9);
}

}  // namespace

// ==================== Frame construction ====================

TEST(PlaneFrameTest, VerticalSegment) {
    auto frame = buildPlaneFrame(Point3D(0, 0, 0), Point3D(0, 0, 10));
    ASSERT_TRUE(frame.has_value());

    EXPECT_EQ(frame->tangentV, Vector3D(0, 0, 1));
    EXPECT_EQ(frame->height, 10);
    EXPECT_EQ(frame->halfWidth, 20);
    EXPECT_EQ(frame->width(), 40);
    expectOrthonormal(*frame);

    const Point3D mapped = coordinate::planeToVolume(20, 5, *frame);
    EXPECT_NEAR(mapped.x, 0.0, 1e-12);
    EXPECT_NEAR(mapped.y, 0.0, 1e-12);
    EXPECT_NEAR(mapped.z, 5.0, 1e-12);
}

TEST(PlaneFrameTest, HorizontalSegmentUsesZUp) {
    auto frame = buildPlaneFrame(Point3D(1, 1, 4), Point3D(7, 9, 4));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->height, 10);
    expectOrthonormal(*frame);
    // a = v x (0,0,1) lies in the XY plane
    EXPECT_NEAR(frame->lateralA.z, 0.0, 1e-12);
}

TEST(PlaneFrameTest, ObliqueSegmentsAreOrthonormal) {
    const Point3D starts[] = {{0, 0, 0}, {3.5, 2.25, 1}, {10, 0, 10}};
    const Point3D ends[] = {{1, 2, 3}, {3.6, 2.2, 9}, {0, 10, 0.5}};
    for (int i = 0; i < 3; ++i) {
        auto frame = buildPlaneFrame(starts[i], ends[i]);
        ASSERT_TRUE(frame.has_value());
        expectOrthonormal(*frame);
        EXPECT_GE(frame->height, 1);
    }
}

TEST(PlaneFrameTest, ShortSegmentHasHeightOne) {
    auto frame = buildPlaneFrame(Point3D(0, 0, 0), Point3D(0.2, 0, 0));
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->height, 1);
}

TEST(PlaneFrameTest, CoincidentPointsAreDegenerate) {
    auto frame = buildPlaneFrame(Point3D(2, 2, 2), Point3D(2, 2, 2 + 1e-8));
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error().code, GeometryError::Code::DegeneratePlane);
}

TEST(PlaneFrameTest, LateralWidthIsConfigurable) {
    auto frame = buildPlaneFrame(Point3D(0, 0, 0), Point3D(5, 0, 0), 64);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->halfWidth, 32);
}

// ==================== Resampling ====================

class ObliquePlaneResamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        volume = test_utils::createRampVolume(10, 10, 10);
    }

    core::VolumeHandle volume;
    ObliquePlaneResampler resampler;
};

TEST_F(ObliquePlaneResamplerTest, TrilinearSampleIsExactAtLattice) {
    EXPECT_EQ(trilinearSample(*volume, 3, 4, 5), 543.0f);
    EXPECT_EQ(trilinearSample(*volume, 0, 9, 9), 990.0f);
}

TEST_F(ObliquePlaneResamplerTest, ResamplePlaneFollowsGrid) {
    auto frame = buildPlaneFrame(Point3D(5, 5, 0), Point3D(5, 5, 9), 4);
    ASSERT_TRUE(frame.has_value());

    auto slice = resamplePlane(*volume, *frame);
    ASSERT_EQ(slice.width, 4);
    ASSERT_EQ(slice.height, 9);

    for (int py = 0; py < slice.height; ++py) {
        for (int px = 0; px < slice.width; ++px) {
            const Point3D p = coordinate::clampToVolume(
                coordinate::planeToVolume(px, py, *frame), volume->shape());
            EXPECT_NEAR(slice.at(px, py), p.x + 10.0 * p.y + 100.0 * p.z, 1e-3)
                << "pixel (" << px << ", " << py << ")";
        }
    }
}

TEST_F(ObliquePlaneResamplerTest, ResampleClampsOutsideVolume) {
    auto frame = buildPlaneFrame(Point3D(0, 0, 0), Point3D(0, 0, 5));
    ASSERT_TRUE(frame.has_value());
    auto slice = resamplePlane(*volume, *frame);
    for (float value : slice.values) {
        EXPECT_GE(value, 0.0f);
        EXPECT_LE(value, 999.0f);
    }
}

TEST_F(ObliquePlaneResamplerTest, DefineIncrementsVersion) {
    EXPECT_FALSE(resampler.hasPlane());
    EXPECT_EQ(resampler.planeVersion(), 0u);

    auto v1 = resampler.definePlane(Point3D(1, 1, 1), Point3D(1, 8, 1), 1);
    ASSERT_TRUE(v1.has_value());
    auto v2 = resampler.definePlane(Point3D(1, 1, 1), Point3D(8, 1, 1), 1);
    ASSERT_TRUE(v2.has_value());

    EXPECT_LT(*v1, *v2);
    EXPECT_EQ(resampler.planeVersion(), *v2);
}

TEST_F(ObliquePlaneResamplerTest, DegenerateDefinitionKeepsPriorPlane) {
    ASSERT_TRUE(resampler.definePlane(Point3D(0, 0, 0), Point3D(0, 0, 10), 0).has_value());
    const auto before = resampler.currentFrame();
    const auto version = resampler.planeVersion();

    auto result = resampler.definePlane(Point3D(3, 3, 3), Point3D(3, 3, 3), 3);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GeometryError::Code::DegeneratePlane);

    ASSERT_TRUE(resampler.hasPlane());
    EXPECT_EQ(resampler.planeVersion(), version);
    EXPECT_EQ(resampler.currentFrame()->origin, before->origin);
    EXPECT_EQ(resampler.currentFrame()->tangentV, before->tangentV);
}

TEST_F(ObliquePlaneResamplerTest, UpdatePlaneForZTranslatesOriginalPoints) {
    ASSERT_TRUE(resampler.definePlane(Point3D(2, 2, 4), Point3D(6, 5, 4), 4).has_value());

    ASSERT_TRUE(resampler.updatePlaneForZ(7).has_value());
    EXPECT_DOUBLE_EQ(resampler.currentFrame()->origin.z, 7.0);

    // Absolute with respect to the original picks, not cumulative
    ASSERT_TRUE(resampler.updatePlaneForZ(7).has_value());
    EXPECT_DOUBLE_EQ(resampler.currentFrame()->origin.z, 7.0);

    ASSERT_TRUE(resampler.updatePlaneForZ(1).has_value());
    EXPECT_DOUBLE_EQ(resampler.currentFrame()->origin.z, 1.0);
    EXPECT_DOUBLE_EQ(resampler.currentFrame()->origin.x, 2.0);
}

TEST_F(ObliquePlaneResamplerTest, UpdateWithoutPlaneFails) {
    auto result = resampler.updatePlaneForZ(3);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GeometryError::Code::NoPlane);
}

TEST_F(ObliquePlaneResamplerTest, RenderProducesWindowedRaster) {
    ASSERT_TRUE(resampler.definePlane(Point3D(0, 0, 0), Point3D(0, 0, 10), 0).has_value());
    const ContrastRange range{0.0, 999.0};

    auto raster = resampler.render(*volume, range);
    ASSERT_TRUE(raster.has_value());
    EXPECT_EQ(raster->width, 40);
    EXPECT_EQ(raster->height, 10);
    // Center column samples (0, 0, py)
    EXPECT_EQ(raster->at(20, 5), normalize(500.0f, range));
}

TEST_F(ObliquePlaneResamplerTest, RenderWithoutPlaneFails) {
    auto raster = resampler.render(*volume, ContrastRange{});
    ASSERT_FALSE(raster.has_value());
    EXPECT_EQ(raster.error().code, GeometryError::Code::NoPlane);
}

TEST_F(ObliquePlaneResamplerTest, ClearPlaneForgetsDefinition) {
    ASSERT_TRUE(resampler.definePlane(Point3D(0, 0, 0), Point3D(1, 0, 0), 0).has_value());
    resampler.clearPlane();
    EXPECT_FALSE(resampler.hasPlane());
    EXPECT_FALSE(resampler.currentFrame().has_value());
}

TEST_F(ObliquePlaneResamplerTest, CallbackReceivesEachDefinition) {
    std::vector<std::uint64_t> versions;
    resampler.setPlaneDefinedCallback([&](const PlaneFrame&, std::uint64_t version) {
        versions.push_back(version);
    });

    ASSERT_TRUE(resampler.definePlane(Point3D(0, 0, 0), Point3D(4, 0, 0), 0).has_value());
    ASSERT_TRUE(resampler.updatePlaneForZ(2).has_value());
    EXPECT_FALSE(resampler.definePlane(Point3D(1, 1, 1), Point3D(1, 1, 1), 0).has_value());

    EXPECT_EQ(versions, (std::vector<std::uint64_t>{1, 2}));
}

TEST_F(ObliquePlaneResamplerTest, CallbackSeesStoredDefinition) {
    std::vector<double> originZ;
    resampler.setPlaneDefinedCallback([&](const PlaneFrame& frame, std::uint64_t version) {
        originZ.push_back(frame.origin.z);
        if (version == 1) {
            // Re-anchoring from inside the callback relies on the new points and baseZ
            ASSERT_TRUE(resampler.updatePlaneForZ(7).has_value());
        }
    });

    ASSERT_TRUE(resampler.definePlane(Point3D(0, 0, 5), Point3D(4, 0, 5), 5).has_value());

    EXPECT_EQ(originZ, (std::vector<double>{5.0, 7.0}));
    EXPECT_EQ(resampler.planeVersion(), 2u);
    EXPECT_DOUBLE_EQ(resampler.currentFrame()->origin.z, 7.0);
}

TEST_F(ObliquePlaneResamplerTest, MoveKeepsPlane) {
    ASSERT_TRUE(resampler.definePlane(Point3D(0, 0, 0), Point3D(4, 0, 0), 0).has_value());
    ObliquePlaneResampler moved(std::move(resampler));
    EXPECT_TRUE(moved.hasPlane());
    EXPECT_EQ(moved.planeVersion(), 1u);
}
