#include "services/slice/axis_slice_renderer.hpp"

#include <algorithm>

namespace tomo_viewer::services {

int sliceCount(const core::VolumeShape& shape, SliceKind kind) noexcept {
    switch (kind) {
        case SliceKind::XY: return static_cast<int>(shape.z);
        case SliceKind::XZ: return static_cast<int>(shape.y);
        case SliceKind::Oblique: return 0;
    }
    return 0;
}

int clampSliceIndex(const core::VolumeShape& shape, SliceKind kind, int index) noexcept {
    const int count = sliceCount(shape, kind);
    if (count <= 0) {
        return 0;
    }
    return std::clamp(index, 0, count - 1);
}

Raster renderAxisSlice(const core::VolumeSource& volume, SliceKind kind, int index,
                       const ContrastRange& range) {
    const auto shape = volume.shape();
    const auto clamped = static_cast<std::size_t>(clampSliceIndex(shape, kind, index));
    if (kind == SliceKind::XZ) {
        return applyContrast(volume.readXZ(clamped), range);
    }
    return applyContrast(volume.readXY(clamped), range);
}

}  // namespace tomo_viewer::services
