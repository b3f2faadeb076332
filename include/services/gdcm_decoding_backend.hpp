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
 * @file gdcm_decoding_backend.hpp
 * @brief In-process decoding backend built on ITK and GDCM
 * @details Implements the "dicom" pipeline (categorize, getSliceImage), the
 *          dedicated tag-reading call and whole-series reconstruction. Binary
 *          inputs are materialized into a per-task scratch directory that is
 *          removed when the task finishes; tag reads parse the payload from
 *          memory.
 *
 * ## Thread Safety
 * - Not reentrant; BackendGateway serializes all calls
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/decoding_backend.hpp"

#include <filesystem>
#include <memory>

namespace dicom_organizer::services {

/**
 * @brief ITK/GDCM implementation of the decoding backend
 */
class GdcmDecodingBackend : public core::IDecodingBackend {
public:
    /// Name of the only pipeline this backend provides
    static constexpr const char* kPipelineName = "dicom";

    /**
     * @param workingDirectory Existing directory for per-task scratch files
     * @param ownsWorkingDirectory Remove the directory on destruction
     */
    explicit GdcmDecodingBackend(std::filesystem::path workingDirectory,
                                 bool ownsWorkingDirectory = false);
    ~GdcmDecodingBackend() override;

    GdcmDecodingBackend(const GdcmDecodingBackend&) = delete;
    GdcmDecodingBackend& operator=(const GdcmDecodingBackend&) = delete;

    std::expected<core::TaskResult, core::EngineErrorInfo>
    runPipeline(const std::string& pipeline,
                const std::vector<std::string>& args,
                const std::vector<core::TaskInput>& inputs,
                const std::vector<core::TaskOutputSpec>& outputs) override;

    std::expected<core::TagCodeValues, core::EngineErrorInfo>
    readDicomTags(const core::BinaryFile& file,
                  const std::vector<std::string>& tagCodes) override;

    std::expected<core::Image, core::EngineErrorInfo>
    readImageDicomFileSeries(const std::vector<core::BinaryFile>& files,
                             bool singleSortedSeries) override;

    /**
     * @brief Directory holding the per-task scratch directories
     */
    [[nodiscard]] const std::filesystem::path& workingDirectory() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Launcher creating a GdcmDecodingBackend from a BackendConfig
 *
 * Accepts only the "dicom" pipeline. Uses config.scratchDirectory, creating
 * it if needed, or a unique directory under the system temp path that is
 * removed with the backend.
 */
core::BackendLauncher makeGdcmBackendLauncher();

} // namespace dicom_organizer::services
