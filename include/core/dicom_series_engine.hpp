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
 * @file dicom_series_engine.hpp
 * @brief Caller-facing DICOM series organization engine
 * @details Turns an unordered set of slice files into ordered volume groups
 *          and requests slice or volume reconstructions for them. Decoding is
 *          delegated to the backend created by the configured launcher; the
 *          engine owns only the orchestration, grouping and ordering.
 *
 * ## Typical use
 * @code
 * DicomSeriesEngine engine(config, services::makeGdcmBackendLauncher());
 * auto volumes = engine.categorize(files);
 * auto image = engine.buildVolume(volumes->begin()->second);
 * @endcode
 *
 * ## Thread Safety
 * - initialize() is single-flight across threads
 * - Other operations may be called from several threads; backend work is
 *   serialized inside the gateway
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "decoding_backend.hpp"
#include "engine_config.hpp"
#include "engine_types.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dicom_organizer::core {

/// Progress callback for categorize and ordering
using ProgressCallback = std::function<void(size_t current, size_t total, const std::string& message)>;

/**
 * @brief Series organization engine
 */
class DicomSeriesEngine {
public:
    DicomSeriesEngine(EngineConfig config, BackendLauncher launcher);
    ~DicomSeriesEngine();

    // Non-copyable, movable
    DicomSeriesEngine(const DicomSeriesEngine&) = delete;
    DicomSeriesEngine& operator=(const DicomSeriesEngine&) = delete;
    DicomSeriesEngine(DicomSeriesEngine&&) noexcept;
    DicomSeriesEngine& operator=(DicomSeriesEngine&&) noexcept;

    /**
     * @brief Set progress callback for long-running operations
     */
    void setProgressCallback(ProgressCallback callback);

    /**
     * @brief Start the backend; concurrent callers share one attempt
     */
    std::expected<void, EngineErrorInfo> initialize();

    /**
     * @brief Whether the backend is live
     */
    [[nodiscard]] bool isInitialized() const;

    /**
     * @brief Tear down the backend; the next call bootstraps again
     */
    void shutdown();

    /**
     * @brief Group files into volumes, ordering each volume when enabled
     * @param files Input files
     * @return Volume ID => files; all-or-nothing
     */
    std::expected<VolumesToFilesMap, EngineErrorInfo>
    categorize(const std::vector<DicomFile>& files);

    /**
     * @brief Order one volume's files by Instance Number
     */
    std::expected<std::vector<DicomFile>, EngineErrorInfo>
    orderByInstance(const std::vector<DicomFile>& files);

    /**
     * @brief Read named tags from one file; absent tags are omitted
     */
    std::expected<TagValues, EngineErrorInfo>
    readTags(const DicomFile& file, const std::vector<TagSpec>& tags);

    /**
     * @brief Retrieve one slice image
     */
    std::expected<Image, EngineErrorInfo>
    getSlice(const DicomFile& file, bool asThumbnail = false);

    /**
     * @brief Reconstruct a volume from a categorized group
     */
    std::expected<Image, EngineErrorInfo>
    buildVolume(const std::vector<DicomFile>& files);

    /**
     * @brief Configuration this engine was created with
     */
    [[nodiscard]] const EngineConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_organizer::core
