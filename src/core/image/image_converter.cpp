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

#include "core/image_converter.hpp"

#include <cstring>

namespace dicom_organizer::core {

namespace {

template <typename TImage>
Image convert(const TImage* itkImage, PixelType pixelType)
{
    constexpr unsigned int Dimension = TImage::ImageDimension;

    Image image;
    image.dimension = Dimension;
    image.pixelType = pixelType;

    if (itkImage == nullptr) {
        return image;
    }

    const auto region = itkImage->GetBufferedRegion();
    const auto size = region.GetSize();
    const auto& spacing = itkImage->GetSpacing();
    const auto& origin = itkImage->GetOrigin();
    const auto& direction = itkImage->GetDirection();

    auto& spatial = image.spatial;
    spatial.size.reserve(Dimension);
    spatial.spacing.reserve(Dimension);
    spatial.origin.reserve(Dimension);
    spatial.direction.reserve(Dimension * Dimension);
    for (unsigned int d = 0; d < Dimension; ++d) {
        spatial.size.push_back(static_cast<size_t>(size[d]));
        spatial.spacing.push_back(spacing[d]);
        spatial.origin.push_back(origin[d]);
    }
    for (unsigned int row = 0; row < Dimension; ++row) {
        for (unsigned int col = 0; col < Dimension; ++col) {
            spatial.direction.push_back(direction[row][col]);
        }
    }

    const size_t byteCount = region.GetNumberOfPixels() * sizeof(typename TImage::PixelType);
    image.pixelData.resize(byteCount);
    if (byteCount > 0) {
        std::memcpy(image.pixelData.data(), itkImage->GetBufferPointer(), byteCount);
    }

    return image;
}

} // anonymous namespace

Image ImageConverter::toImage(const FloatSliceType* itkImage)
{
    return convert(itkImage, PixelType::Float32);
}

Image ImageConverter::toImage(const ThumbnailSliceType* itkImage)
{
    return convert(itkImage, PixelType::UInt8);
}

Image ImageConverter::toImage(const FloatVolumeType* itkImage)
{
    return convert(itkImage, PixelType::Float32);
}

} // namespace dicom_organizer::core
