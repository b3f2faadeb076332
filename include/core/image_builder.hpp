/**
 * @file image_builder.hpp
 * @brief Requests reconstructed slice and volume images from the backend
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "backend_gateway.hpp"
#include "engine_types.hpp"

#include <expected>
#include <memory>
#include <vector>

namespace dicom_organizer::core {

/**
 * @brief Slice and volume reconstruction requests
 *
 * Neither operation returns a partially built image: a backend answer that
 * lacks an image or carries unpopulated geometry is a BuildError.
 */
class ImageBuilder {
public:
    explicit ImageBuilder(BackendGateway& gateway);
    ~ImageBuilder();

    ImageBuilder(const ImageBuilder&) = delete;
    ImageBuilder& operator=(const ImageBuilder&) = delete;

    /**
     * @brief Retrieve one 2D slice image
     * @param file File containing the slice
     * @param asThumbnail Cast to unsigned char for previews
     * @return 2D image, BuildError on failure
     */
    std::expected<Image, EngineErrorInfo>
    getSlice(const DicomFile& file, bool asThumbnail = false);

    /**
     * @brief Reconstruct a volume from an ordered file sequence
     * @param orderedFiles Series files, in slice order
     * @param singleSortedSeries Tell the backend the order is final
     * @return 3D image with populated spatial parameters, BuildError on failure
     */
    std::expected<Image, EngineErrorInfo>
    buildVolume(const std::vector<DicomFile>& orderedFiles, bool singleSortedSeries = true);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_organizer::core
