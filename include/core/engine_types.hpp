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
 * @file engine_types.hpp
 * @brief Shared value types of the series organization engine
 * @details Defines the caller-owned DicomFile blob, tag request descriptors,
 *          reconstructed Image with its spatial parameters, the volume
 *          grouping map, and the EngineError taxonomy returned through
 *          std::expected by every public operation.
 *
 * ## Thread Safety
 * - All types are plain values; DicomFile content is immutable and may be
 *   shared across threads once captured
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dicom_organizer::core {

/// Error categories reported by the engine
enum class EngineError {
    InitError,             ///< Backend failed to start
    BackendUnavailable,    ///< Operation attempted without a live backend
    TaskExecutionError,    ///< Backend reported failure for a generic task
    TagReadError,          ///< Tag read failed at the transport/backend level
    CategorizeError,       ///< Grouping failed or backend output was malformed
    OrderError,            ///< Instance ordering could not collect its keys
    BuildError,            ///< Slice or volume reconstruction failed
    InvalidConfiguration,  ///< Engine configuration rejected
    FileNotFound,          ///< Input path does not exist
    FileReadError          ///< Input path could not be read
};

/// Error result with message
struct EngineErrorInfo {
    EngineError code;
    std::string message;
};

/**
 * @brief Stable name of an error code for log output
 */
std::string to_string(EngineError code);

/**
 * @brief Opaque named binary blob supplied by the caller
 *
 * Content is shared, never copied, between the caller's object and any
 * sanitized transit copy; two DicomFile values refer to the same input when
 * sameAs() holds.
 */
struct DicomFile {
    std::string name;
    std::shared_ptr<const std::vector<uint8_t>> content;

    /**
     * @brief Capture an in-memory blob
     */
    static DicomFile fromBytes(std::string name, std::vector<uint8_t> bytes);

    /**
     * @brief Read a file from disk into a blob named after its path
     * @param filePath Path to read
     * @return Captured file, FileNotFound or FileReadError on failure
     */
    static std::expected<DicomFile, EngineErrorInfo>
    fromPath(const std::filesystem::path& filePath);

    [[nodiscard]] size_t size() const noexcept {
        return content ? content->size() : 0;
    }

    /// True when both values carry the same name and the same byte buffer
    [[nodiscard]] bool sameAs(const DicomFile& other) const noexcept {
        return content == other.content && name == other.name;
    }
};

/// Tag request: caller-facing name plus backend-facing "gggg|eeee" code
struct TagSpec {
    std::string name;
    std::string tag;
};

/// Tag name => tag value
using TagValues = std::map<std::string, std::string>;

/// Volume ID => files of that volume
using VolumesToFilesMap = std::map<std::string, std::vector<DicomFile>>;

/// Pixel component type of a reconstructed raster
enum class PixelType {
    UInt8,
    Float32
};

/// Size in bytes of one pixel of the given type
size_t pixelTypeSize(PixelType type) noexcept;

/// Geometric metadata of a reconstructed image
struct SpatialParameters {
    std::vector<size_t> size;
    std::vector<double> spacing;
    std::vector<double> origin;
    std::vector<double> direction;  ///< Row-major dimension x dimension matrix

    /**
     * @brief Check every vector matches the given dimension
     */
    [[nodiscard]] bool isPopulated(unsigned int dimension) const noexcept {
        return dimension > 0 &&
               size.size() == dimension &&
               spacing.size() == dimension &&
               origin.size() == dimension &&
               direction.size() == static_cast<size_t>(dimension) * dimension;
    }

    /// Number of pixels described by size
    [[nodiscard]] size_t pixelCount() const noexcept;
};

/// Reconstructed 2D slice or 3D volume
struct Image {
    unsigned int dimension = 0;
    PixelType pixelType = PixelType::Float32;
    SpatialParameters spatial;
    std::vector<uint8_t> pixelData;  ///< x-fastest raw buffer

    /**
     * @brief Check geometry is populated and the buffer matches it
     */
    [[nodiscard]] bool isValid() const noexcept {
        return spatial.isPopulated(dimension) &&
               pixelData.size() == spatial.pixelCount() * pixelTypeSize(pixelType);
    }
};

} // namespace dicom_organizer::core
