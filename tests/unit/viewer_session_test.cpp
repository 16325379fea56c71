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

#include "services/navigation/viewer_session.hpp"
#include "services/slice/axis_slice_renderer.hpp"
#include "../test_utils/volume_generator.hpp"

#include <map>

using namespace tomo_viewer;
using namespace tomo_viewer::services;

namespace {

class ViewerSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        volumes_["a.mrc"] = test_utils::createRampVolume(10, 10, 10);
        volumes_["b.mrc"] = test_utils::createNoiseVolume(12, 8, 6);
        volumes_["c.mrc"] = test_utils::createConstantVolume(4, 4, 4, 3.0f);
        volumes_["d.mrc"] = test_utils::createRampVolume(6, 6, 6);
    }

    core::VolumeOpener opener() const {
        // Copy: background tasks may outlive a single test body statement
        auto volumes = volumes_;
        return [volumes](const std::filesystem::path& path)
                   -> std::expected<core::VolumeHandle, core::VolumeError> {
            auto it = volumes.find(path.string());
            if (it == volumes.end()) {
                return std::unexpected(core::VolumeError{
                    core::VolumeError::Code::FileNotFound, path.string()});
            }
            return it->second;
        };
    }

    ViewerSession makeSession(core::ViewerConfig config = {}) const {
        return ViewerSession(config, opener());
    }

    std::map<std::string, core::VolumeHandle> volumes_;
};

}  // anonymous namespace

// ==================== Configuration ====================

TEST_F(ViewerSessionTest, CreateRejectsInvalidConfig) {
    core::ViewerConfig config;
    config.prefetch.workerCount = -1;
    auto session = ViewerSession::create(config, opener());
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().code, core::ConfigError::Code::InvalidValue);

    config = {};
    config.cache.capacity = -5;
    EXPECT_FALSE(ViewerSession::create(config, opener()).has_value());
}

TEST_F(ViewerSessionTest, CreateAppliesLoggingSection) {
    const logging::LogLevel previous = logging::LoggerFactory::getGlobalLevel();

    core::ViewerConfig config;
    config.logging.level = logging::LogLevel::Warning;
    auto session = ViewerSession::create(config, opener());
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(logging::LoggerFactory::getGlobalLevel(), logging::LogLevel::Warning);
    EXPECT_TRUE(session->open({"a.mrc"}).has_value());

    logging::LoggerFactory::setGlobalLevel(previous);
}

TEST_F(ViewerSessionTest, InvalidConfigFallsBackToDefaults) {
    core::ViewerConfig config;
    config.prefetch.workerCount = -1;
    config.cache.capacity = -5;
    auto session = makeSession(config);

    EXPECT_EQ(session.config().prefetch.workerCount, core::ViewerConfig{}.prefetch.workerCount);
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());
    EXPECT_EQ(session.cacheStatus().capacity,
              static_cast<std::size_t>(core::ViewerConfig{}.cache.capacity));
}

// ==================== Files ====================

TEST_F(ViewerSessionTest, EmptyFileListIsRejected) {
    auto session = makeSession();
    auto result = session.open({});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::VolumeError::Code::FileNotFound);
    EXPECT_FALSE(session.isOpen());
}

TEST_F(ViewerSessionTest, OpenFailureLeavesSessionClosed) {
    auto session = makeSession();
    auto result = session.open({"missing.mrc"});
    ASSERT_FALSE(result.has_value());
    EXPECT_FALSE(session.isOpen());
    EXPECT_EQ(session.fileCount(), 0);
}

TEST_F(ViewerSessionTest, OpenCentersCursor) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc", "b.mrc"}).has_value());

    EXPECT_TRUE(session.isOpen());
    EXPECT_EQ(session.activeIndex(), 0);
    EXPECT_EQ(session.fileCount(), 2);
    EXPECT_EQ(session.shape(), (core::VolumeShape{10, 10, 10}));
    EXPECT_EQ(session.cursor(), (SliceCursor{5, 5, 5}));
    EXPECT_EQ(session.activeVolume(), volumes_["a.mrc"]);
}

TEST_F(ViewerSessionTest, ActiveIndexIsClamped) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc", "b.mrc"}, 7).has_value());
    EXPECT_EQ(session.activeIndex(), 1);
}

TEST_F(ViewerSessionTest, NextAndPreviousWalkTheList) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc", "b.mrc", "c.mrc"}).has_value());

    auto moved = session.previousFile();
    ASSERT_TRUE(moved.has_value());
    EXPECT_FALSE(*moved);
    EXPECT_EQ(session.activeIndex(), 0);

    moved = session.nextFile();
    ASSERT_TRUE(moved.has_value());
    EXPECT_TRUE(*moved);
    EXPECT_EQ(session.activeIndex(), 1);
    EXPECT_EQ(session.cursor(), (SliceCursor{6, 4, 3}));

    ASSERT_TRUE(session.nextFile().has_value());
    moved = session.nextFile();
    ASSERT_TRUE(moved.has_value());
    EXPECT_FALSE(*moved);
    EXPECT_EQ(session.activeIndex(), 2);

    moved = session.previousFile();
    ASSERT_TRUE(moved.has_value());
    EXPECT_TRUE(*moved);
    EXPECT_EQ(session.activeIndex(), 1);
}

TEST_F(ViewerSessionTest, FailedActivationKeepsPreviousFile) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc", "missing.mrc"}).has_value());

    auto result = session.activate(1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, core::VolumeError::Code::FileNotFound);
    EXPECT_EQ(session.activeIndex(), 0);
    EXPECT_EQ(session.activeVolume(), volumes_["a.mrc"]);

    EXPECT_FALSE(session.activate(5).has_value());
}

TEST_F(ViewerSessionTest, CloseReleasesEverything) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());
    session.close();

    EXPECT_FALSE(session.isOpen());
    EXPECT_EQ(session.activeVolume(), nullptr);
    auto raster = session.renderSlice(SliceKind::XY, 0);
    ASSERT_FALSE(raster.has_value());
    EXPECT_EQ(raster.error().code, GeometryError::Code::NoVolume);
}

// ==================== Cursor ====================

TEST_F(ViewerSessionTest, CursorIsClampedToVolume) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    EXPECT_EQ(session.setCursor(-5, 100, 3), (SliceCursor{0, 9, 3}));
    EXPECT_EQ(session.stepZ(100), 9);
    EXPECT_EQ(session.stepZ(-4), 5);
    EXPECT_DOUBLE_EQ(session.mapper().cursor().z, 5.0);
}

// ==================== Contrast & metadata ====================

TEST_F(ViewerSessionTest, InitialContrastDerivesFromStats) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    auto stats = session.stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_DOUBLE_EQ(stats->min, 0.0);
    EXPECT_DOUBLE_EQ(stats->max, 999.0);
    EXPECT_EQ(session.contrast(), defaultContrast(*stats));
    EXPECT_FALSE(session.hasPersistedContrast());

    auto histogram = session.histogram();
    ASSERT_TRUE(histogram.has_value());
    EXPECT_EQ(histogram->counts.size(), 256u);
}

TEST_F(ViewerSessionTest, ValidContrastOutsideHistogramIsKept) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    ContrastRange applied = session.setContrast(-1000.0, 1000.0);
    EXPECT_DOUBLE_EQ(applied.min, -1000.0);
    EXPECT_DOUBLE_EQ(applied.max, 1000.0);
    EXPECT_EQ(session.contrast(), applied);
    EXPECT_TRUE(session.hasPersistedContrast());
    EXPECT_EQ(normalize(500.0f, session.contrast()), 191);
}

TEST_F(ViewerSessionTest, CollapsedContrastIsRepairedIntoHistogramExtent) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    ContrastRange applied = session.setContrast(10.0, 10.0);
    EXPECT_TRUE(applied.isValid());
    EXPECT_GT(applied.max, applied.min);
    EXPECT_DOUBLE_EQ(applied.min, 0.0);
    EXPECT_DOUBLE_EQ(applied.max, 999.0);
}

TEST_F(ViewerSessionTest, InvertedContrastIsClippedToHistogramExtent) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    ContrastRange applied = session.setContrast(2000.0, -50.0);
    EXPECT_TRUE(applied.isValid());
    EXPECT_GE(applied.min, 0.0);
    EXPECT_LE(applied.max, 999.0);
}

TEST_F(ViewerSessionTest, ContrastChangeInvalidatesCache) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    ASSERT_TRUE(session.renderSlice(SliceKind::XY, 5).has_value());
    ASSERT_EQ(session.cacheStatus().size, 1u);

    session.setContrast(100.0, 200.0);
    EXPECT_EQ(session.cacheStatus().size, 0u);

    auto raster = session.renderSlice(SliceKind::XY, 5);
    ASSERT_TRUE(raster.has_value());
    auto expected = renderAxisSlice(*volumes_["a.mrc"], SliceKind::XY, 5,
                                    ContrastRange{100.0, 200.0});
    EXPECT_EQ(raster->pixels, expected.pixels);
}

TEST_F(ViewerSessionTest, ContrastPersistsAcrossFiles) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc", "d.mrc"}).has_value());

    ContrastRange applied = session.setContrast(100.0, 200.0);
    ASSERT_TRUE(session.nextFile().has_value());
    EXPECT_EQ(session.contrast(), applied);

    ASSERT_TRUE(session.previousFile().has_value());
    EXPECT_EQ(session.contrast(), applied);
}

// ==================== Slices ====================

TEST_F(ViewerSessionTest, SliceRenderingUsesCache) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    auto first = session.renderSlice(SliceKind::XY, 5);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->width, 10);
    EXPECT_EQ(first->height, 10);
    EXPECT_EQ(first->at(3, 4), normalize(543.0f, session.contrast()));

    auto second = session.renderSlice(SliceKind::XY, 5);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->pixels, first->pixels);

    const SliceCacheStatus status = session.cacheStatus();
    EXPECT_EQ(status.hits, 1u);
    EXPECT_EQ(status.misses, 1u);
    EXPECT_EQ(status.capacity, 128u);
}

TEST_F(ViewerSessionTest, SliceIndexIsClamped) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    auto clamped = session.renderSlice(SliceKind::XZ, 99);
    auto last = session.renderSlice(SliceKind::XZ, 9);
    ASSERT_TRUE(clamped.has_value());
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(clamped->pixels, last->pixels);
    EXPECT_EQ(session.cacheStatus().size, 1u);
}

TEST_F(ViewerSessionTest, CacheCapacityComesFromConfig) {
    core::ViewerConfig config;
    config.cache.capacity = 2;
    auto session = makeSession(config);
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    for (int z = 0; z < 5; ++z) {
        ASSERT_TRUE(session.renderSlice(SliceKind::XY, z).has_value());
    }
    EXPECT_EQ(session.cacheStatus().size, 2u);
    EXPECT_EQ(session.cacheStatus().evictions, 3u);
}

// ==================== Oblique plane ====================

TEST_F(ViewerSessionTest, PlaneRendersAtConfiguredWidth) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    auto version = session.definePlane(Point3D(2, 2, 5), Point3D(2, 8, 5));
    ASSERT_TRUE(version.has_value());
    ASSERT_TRUE(session.mapper().hasPlane());

    auto raster = session.renderPlane();
    ASSERT_TRUE(raster.has_value());
    EXPECT_EQ(raster->width, 40);
    EXPECT_EQ(raster->height, 6);

    auto again = session.renderSlice(SliceKind::Oblique, 0);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->pixels, raster->pixels);
    EXPECT_EQ(session.cacheStatus().hits, 1u);
}

TEST_F(ViewerSessionTest, DegeneratePlaneKeepsPrevious) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());
    ASSERT_TRUE(session.definePlane(Point3D(1, 1, 5), Point3D(8, 8, 5)).has_value());
    const auto before = session.planeFrame();

    auto result = session.definePlane(Point3D(4, 4, 5), Point3D(4, 4, 5));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, GeometryError::Code::DegeneratePlane);
    ASSERT_TRUE(session.planeFrame().has_value());
    EXPECT_EQ(session.planeFrame()->origin, before->origin);
}

TEST_F(ViewerSessionTest, PlaneFollowsDepth) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());
    ASSERT_TRUE(session.definePlane(Point3D(1, 1, 5), Point3D(8, 8, 5)).has_value());

    ASSERT_TRUE(session.updatePlaneForZ(7).has_value());
    EXPECT_DOUBLE_EQ(session.planeFrame()->origin.z, 7.0);

    ASSERT_TRUE(session.updatePlaneForZ(3).has_value());
    EXPECT_DOUBLE_EQ(session.planeFrame()->origin.z, 3.0);
}

TEST_F(ViewerSessionTest, PlaneIsRequiredForObliqueRendering) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc"}).has_value());

    auto raster = session.renderPlane();
    ASSERT_FALSE(raster.has_value());
    EXPECT_EQ(raster.error().code, GeometryError::Code::NoPlane);

    auto moved = session.updatePlaneForZ(2);
    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().code, GeometryError::Code::NoPlane);
}

TEST_F(ViewerSessionTest, SwitchingFilesClearsPlane) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc", "d.mrc"}).has_value());
    ASSERT_TRUE(session.definePlane(Point3D(1, 1, 5), Point3D(8, 8, 5)).has_value());

    ASSERT_TRUE(session.nextFile().has_value());
    EXPECT_FALSE(session.planeFrame().has_value());
    EXPECT_FALSE(session.mapper().hasPlane());
}

// ==================== Prefetch ====================

TEST_F(ViewerSessionTest, NeighborSlicesArriveInTheirCaches) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc", "b.mrc", "c.mrc"}, 1).has_value());
    session.waitForBackground();

    EXPECT_EQ(session.pumpPrefetched(), 4u);
    EXPECT_TRUE(session.isResident(0));
    EXPECT_TRUE(session.isResident(2));

    // The center XY slice of the next file is served from the prefetched cache
    ASSERT_TRUE(session.nextFile().has_value());
    ASSERT_TRUE(session.renderSlice(SliceKind::XY, session.cursor().z).has_value());
    EXPECT_EQ(session.cacheStatus().hits, 1u);
    EXPECT_EQ(session.cacheStatus().misses, 0u);
}

TEST_F(ViewerSessionTest, ResidencyFollowsTheActiveWindow) {
    auto session = makeSession();
    ASSERT_TRUE(session.open({"a.mrc", "b.mrc", "c.mrc", "d.mrc"}).has_value());
    EXPECT_TRUE(session.isResident(0));

    ASSERT_TRUE(session.activate(2).has_value());
    EXPECT_FALSE(session.isResident(0));
    EXPECT_TRUE(session.isResident(2));

    ASSERT_TRUE(session.activate(3).has_value());
    EXPECT_TRUE(session.isResident(2));
    EXPECT_TRUE(session.isResident(3));
}

TEST_F(ViewerSessionTest, NeighborPrefetchCanBeDisabled) {
    core::ViewerConfig config;
    config.prefetch.neighbors = false;
    auto session = makeSession(config);
    ASSERT_TRUE(session.open({"a.mrc", "b.mrc"}).has_value());
    session.waitForBackground();

    EXPECT_EQ(session.pumpPrefetched(), 0u);
    EXPECT_FALSE(session.isResident(1));
}
