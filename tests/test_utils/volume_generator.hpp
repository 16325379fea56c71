#pragma once

/// @file volume_generator.hpp
/// @brief Synthetic volume generators for unit tests
///
/// Creates deterministic ITK float images and wraps them as VolumeSource
/// handles. All generators produce platform-independent, reproducible data.

#include "core/image_volume_source.hpp"
#include "core/volume_io.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include <itkImage.h>
#include <itkImageRegionIterator.h>

namespace tomo_viewer::test_utils {

using FloatImageType = itk::Image<float, 3>;

/// Create a zero-filled float image
/// @param nx Columns (fastest axis)
/// @param ny Rows
/// @param nz Sections
inline FloatImageType::Pointer createImage(int nx, int ny, int nz) {
    auto image = FloatImageType::New();

    FloatImageType::SizeType size;
    size[0] = nx;
    size[1] = ny;
    size[2] = nz;

    FloatImageType::IndexType start;
    start.Fill(0);

    FloatImageType::RegionType region;
    region.SetSize(size);
    region.SetIndex(start);

    image->SetRegions(region);
    image->Allocate();
    image->FillBuffer(0.0f);
    return image;
}

/// Fill every voxel with fn(x, y, z)
template <typename Fn>
inline FloatImageType::Pointer createImage(int nx, int ny, int nz, Fn&& fn) {
    auto image = createImage(nx, ny, nz);
    itk::ImageRegionIterator<FloatImageType> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto idx = it.GetIndex();
        it.Set(static_cast<float>(fn(static_cast<double>(idx[0]),
                                     static_cast<double>(idx[1]),
                                     static_cast<double>(idx[2]))));
    }
    return image;
}

/// Wrap an image as a shared volume handle
inline core::VolumeHandle wrap(FloatImageType::Pointer image,
                               std::string name = "synthetic",
                               std::optional<core::HeaderStats> hint = std::nullopt) {
    return std::make_shared<core::ImageVolumeSource>(image, std::move(name), hint);
}

/// Volume whose value is x + 10y + 100z (unique per voxel for dims <= 10)
inline core::VolumeHandle createRampVolume(int nx = 10, int ny = 10, int nz = 10) {
    return wrap(createImage(nx, ny, nz, [](double x, double y, double z) {
        return x + 10.0 * y + 100.0 * z;
    }), "ramp");
}

/// Volume filled with a single value
inline core::VolumeHandle createConstantVolume(int nx, int ny, int nz, float value) {
    auto image = createImage(nx, ny, nz);
    image->FillBuffer(value);
    return wrap(image, "constant");
}

/// Volume of Gaussian noise around @p mean with a fixed seed
inline core::VolumeHandle createNoiseVolume(int nx, int ny, int nz,
                                            double mean = 100.0, double stddev = 20.0,
                                            unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(mean, stddev);
    return wrap(createImage(nx, ny, nz, [&](double, double, double) {
        return noise(rng);
    }), "noise");
}

}  // namespace tomo_viewer::test_utils
