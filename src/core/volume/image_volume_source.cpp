#include "core/image_volume_source.hpp"

#include <utility>

namespace tomo_viewer::core {

ImageVolumeSource::ImageVolumeSource(ImageType::Pointer image,
                                     std::string name,
                                     std::optional<HeaderStats> headerStats)
    : image_(std::move(image))
    , name_(std::move(name))
    , headerStats_(headerStats)
{
    if (image_) {
        const auto size = image_->GetBufferedRegion().GetSize();
        shape_.x = size[0];
        shape_.y = size[1];
        shape_.z = size[2];
    }
}

ImageVolumeSource::~ImageVolumeSource() = default;

VolumeShape ImageVolumeSource::shape() const noexcept {
    return shape_;
}

VoxelType ImageVolumeSource::voxelType() const noexcept {
    return VoxelType::Float32;
}

const std::byte* ImageVolumeSource::data() const noexcept {
    if (!image_) {
        return nullptr;
    }
    return reinterpret_cast<const std::byte*>(image_->GetBufferPointer());
}

std::string ImageVolumeSource::name() const {
    return name_;
}

std::optional<HeaderStats> ImageVolumeSource::headerStats() const {
    return headerStats_;
}

ImageVolumeSource::ImageType::Pointer ImageVolumeSource::image() const {
    return image_;
}

}  // namespace tomo_viewer::core
