#include "core/volume_source.hpp"
#include "core/trilinear_interpolation.hpp"

namespace tomo_viewer::core {

float VolumeSource::at(std::size_t flatIndex) const {
    const std::byte* base = data();
    return dispatchVoxelType(voxelType(), [&](auto tag) {
        return loadVoxel<decltype(tag)>(base, flatIndex);
    });
}

float VolumeSource::voxel(std::size_t z, std::size_t y, std::size_t x) const {
    const auto dims = shape();
    return at((z * dims.y + y) * dims.x + x);
}

float VolumeSource::sample(double x, double y, double z) const {
    const auto dims = shape();
    const std::byte* base = data();
    return dispatchVoxelType(voxelType(), [&](auto tag) {
        return trilinearAt<decltype(tag)>(base, dims, x, y, z);
    });
}

FloatSlice VolumeSource::readXY(std::size_t z) const {
    const auto dims = shape();
    FloatSlice slice;
    slice.width = static_cast<int>(dims.x);
    slice.height = static_cast<int>(dims.y);
    slice.values.resize(dims.x * dims.y);

    const std::byte* base = data();
    const std::size_t offset = z * dims.y * dims.x;
    dispatchVoxelType(voxelType(), [&](auto tag) {
        using T = decltype(tag);
        for (std::size_t i = 0; i < slice.values.size(); ++i) {
            slice.values[i] = loadVoxel<T>(base, offset + i);
        }
    });
    return slice;
}

FloatSlice VolumeSource::readXZ(std::size_t y) const {
    const auto dims = shape();
    FloatSlice slice;
    slice.width = static_cast<int>(dims.x);
    slice.height = static_cast<int>(dims.z);
    slice.values.resize(dims.x * dims.z);

    // One contiguous X run per Z plane, strided by a full XY plane
    const std::byte* base = data();
    const std::size_t planeStride = dims.y * dims.x;
    dispatchVoxelType(voxelType(), [&](auto tag) {
        using T = decltype(tag);
        for (std::size_t z = 0; z < dims.z; ++z) {
            const std::size_t src = z * planeStride + y * dims.x;
            float* dst = slice.values.data() + z * dims.x;
            for (std::size_t x = 0; x < dims.x; ++x) {
                dst[x] = loadVoxel<T>(base, src + x);
            }
        }
    });
    return slice;
}

}  // namespace tomo_viewer::core
