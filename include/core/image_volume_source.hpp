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

/**
 * @file image_volume_source.hpp
 * @brief VolumeSource over an in-memory ITK float image
 * @details Wraps an itk::Image<float, 3> whose pixel buffer already has the
 *          C-order (Z, Y, X) layout expected by VolumeSource (ITK stores x
 *          fastest). Used for volumes read through ITK's ImageIO factories and
 *          for synthetic volumes built in memory.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/volume_source.hpp"

#include <optional>
#include <string>

#include <itkImage.h>

namespace tomo_viewer::core {

class ImageVolumeSource : public VolumeSource {
public:
    using ImageType = itk::Image<float, 3>;

    /**
     * @brief Wrap an allocated image
     * @param image Image with a buffered region equal to its largest region
     * @param name Display name
     * @param headerStats Optional trusted statistics to report as a header hint
     */
    explicit ImageVolumeSource(ImageType::Pointer image,
                               std::string name = "image",
                               std::optional<HeaderStats> headerStats = std::nullopt);
    ~ImageVolumeSource() override;

    [[nodiscard]] VolumeShape shape() const noexcept override;
    [[nodiscard]] VoxelType voxelType() const noexcept override;
    [[nodiscard]] const std::byte* data() const noexcept override;
    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::optional<HeaderStats> headerStats() const override;

    /// Underlying ITK image
    [[nodiscard]] ImageType::Pointer image() const;

private:
    ImageType::Pointer image_;
    VolumeShape shape_;
    std::string name_;
    std::optional<HeaderStats> headerStats_;
};

}  // namespace tomo_viewer::core
