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
 * @file decoding_backend.hpp
 * @brief Task protocol and interface of the delegated decoding backend
 * @details The engine never touches DICOM bytes itself. Every decode, tag
 *          extraction and reconstruction is sent to an IDecodingBackend as a
 *          named pipeline with positional string arguments and typed input
 *          and output descriptors, or through the two dedicated tag and
 *          series-reconstruction calls. A BackendLauncher creates the backend
 *          from the engine's BackendConfig.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "engine_config.hpp"
#include "engine_types.hpp"

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dicom_organizer::core {

/// Payload kinds of the task protocol
enum class InterfaceType {
    BinaryFile,
    TextStream,
    Image
};

/// Binary payload keyed by a path-like identifier
struct BinaryFile {
    std::string path;
    std::shared_ptr<const std::vector<uint8_t>> data;
};

/// Free text payload
struct TextStream {
    std::string data;
};

/// Typed task input
struct TaskInput {
    InterfaceType type = InterfaceType::BinaryFile;
    std::variant<BinaryFile, TextStream> data;
};

/// Requested output slot
struct TaskOutputSpec {
    InterfaceType type = InterfaceType::TextStream;
};

/// Produced output, in the order of the requested TaskOutputSpec list
struct TaskOutput {
    InterfaceType type = InterfaceType::TextStream;
    std::variant<std::monostate, BinaryFile, TextStream, Image> data;
};

/// Structured result of one pipeline run
struct TaskResult {
    int returnCode = 0;
    std::string stderrText;
    std::vector<TaskOutput> outputs;
};

/// Tag code => value pairs as returned by the backend
using TagCodeValues = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Interface of a decoding backend
 *
 * Implementations perform the byte-level DICOM work. Calls are issued one at
 * a time by BackendGateway; an implementation does not need to be reentrant.
 * Failures are reported as EngineErrorInfo with TaskExecutionError; thrown
 * exceptions are caught by the gateway and reported the same way.
 */
class IDecodingBackend {
public:
    virtual ~IDecodingBackend() = default;

    /**
     * @brief Run a named pipeline
     * @param pipeline Pipeline name (e.g. "dicom")
     * @param args Positional string arguments
     * @param inputs Typed input payloads
     * @param outputs Requested output slots
     * @return Pipeline result; a non-zero returnCode signals task failure
     */
    virtual std::expected<TaskResult, EngineErrorInfo>
    runPipeline(const std::string& pipeline,
                const std::vector<std::string>& args,
                const std::vector<TaskInput>& inputs,
                const std::vector<TaskOutputSpec>& outputs) = 0;

    /**
     * @brief Read tag values out of one file
     * @param file File payload
     * @param tagCodes Requested "gggg|eeee" codes
     * @return Pairs for the tags present in the file; absent tags are omitted
     */
    virtual std::expected<TagCodeValues, EngineErrorInfo>
    readDicomTags(const BinaryFile& file,
                  const std::vector<std::string>& tagCodes) = 0;

    /**
     * @brief Reconstruct one volume from a file series
     * @param files Series files
     * @param singleSortedSeries Treat files as one series already in order
     * @return Reconstructed 3D image
     */
    virtual std::expected<Image, EngineErrorInfo>
    readImageDicomFileSeries(const std::vector<BinaryFile>& files,
                             bool singleSortedSeries) = 0;
};

/// Creates a live backend for the given configuration
using BackendLauncher = std::function<
    std::expected<std::unique_ptr<IDecodingBackend>, EngineErrorInfo>(const BackendConfig&)>;

} // namespace dicom_organizer::core
