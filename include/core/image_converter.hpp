/**
 * @file image_converter.hpp
 * @brief Conversion of ITK images into engine Image values
 * @details Copies geometry (size, spacing, origin, direction) and the pixel
 *          buffer of an ITK image into the backend-neutral core::Image handed
 *          to callers.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "engine_types.hpp"

#include <itkImage.h>

namespace dicom_organizer::core {

/**
 * @brief Converts ITK rasters to core::Image
 */
class ImageConverter {
public:
    using FloatSliceType = itk::Image<float, 2>;
    using ThumbnailSliceType = itk::Image<unsigned char, 2>;
    using FloatVolumeType = itk::Image<float, 3>;

    /**
     * @brief Convert a full-precision slice
     */
    static Image toImage(const FloatSliceType* itkImage);

    /**
     * @brief Convert a thumbnail slice
     */
    static Image toImage(const ThumbnailSliceType* itkImage);

    /**
     * @brief Convert a float volume
     */
    static Image toImage(const FloatVolumeType* itkImage);
};

} // namespace dicom_organizer::core
