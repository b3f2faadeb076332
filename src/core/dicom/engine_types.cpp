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

#include "core/engine_types.hpp"

#include <fstream>
#include <iterator>

namespace dicom_organizer::core {

std::string to_string(EngineError code)
{
    switch (code) {
        case EngineError::InitError:            return "InitError";
        case EngineError::BackendUnavailable:   return "BackendUnavailable";
        case EngineError::TaskExecutionError:   return "TaskExecutionError";
        case EngineError::TagReadError:         return "TagReadError";
        case EngineError::CategorizeError:      return "CategorizeError";
        case EngineError::OrderError:           return "OrderError";
        case EngineError::BuildError:           return "BuildError";
        case EngineError::InvalidConfiguration: return "InvalidConfiguration";
        case EngineError::FileNotFound:         return "FileNotFound";
        case EngineError::FileReadError:        return "FileReadError";
    }
    return "Unknown";
}

DicomFile DicomFile::fromBytes(std::string name, std::vector<uint8_t> bytes)
{
    return DicomFile{
        std::move(name),
        std::make_shared<const std::vector<uint8_t>>(std::move(bytes))
    };
}

std::expected<DicomFile, EngineErrorInfo>
DicomFile::fromPath(const std::filesystem::path& filePath)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filePath, ec)) {
        return std::unexpected(EngineErrorInfo{
            EngineError::FileNotFound,
            "File not found: " + filePath.string()
        });
    }

    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        return std::unexpected(EngineErrorInfo{
            EngineError::FileReadError,
            "Cannot open file: " + filePath.string()
        });
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::unexpected(EngineErrorInfo{
            EngineError::FileReadError,
            "Failed to read file: " + filePath.string()
        });
    }

    return fromBytes(filePath.generic_string(), std::move(bytes));
}

size_t pixelTypeSize(PixelType type) noexcept
{
    switch (type) {
        case PixelType::UInt8:   return 1;
        case PixelType::Float32: return 4;
    }
    return 1;
}

size_t SpatialParameters::pixelCount() const noexcept
{
    if (size.empty()) {
        return 0;
    }
    size_t count = 1;
    for (size_t extent : size) {
        count *= extent;
    }
    return count;
}

} // namespace dicom_organizer::core
