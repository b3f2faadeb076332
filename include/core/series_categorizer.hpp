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
 * @file series_categorizer.hpp
 * @brief Partitions an unordered file set into volume groups
 * @details Every file is sent to the backend under its positional index so
 *          that duplicate names cannot collide. The backend answers with a
 *          JSON object mapping volume keys to index lists, which is mapped
 *          back onto the caller's files. The answer must be an exact
 *          partition of the submitted indexes; anything else fails the whole
 *          call.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "backend_gateway.hpp"
#include "engine_types.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace dicom_organizer::core {

/**
 * @brief Backend-driven volume grouping
 */
class SeriesCategorizer {
public:
    explicit SeriesCategorizer(BackendGateway& gateway);
    ~SeriesCategorizer();

    SeriesCategorizer(const SeriesCategorizer&) = delete;
    SeriesCategorizer& operator=(const SeriesCategorizer&) = delete;

    /**
     * @brief Group files into volumes
     * @param files Input files in caller order
     * @return Volume ID => files in backend order, CategorizeError on failure
     */
    std::expected<VolumesToFilesMap, EngineErrorInfo>
    categorize(const std::vector<DicomFile>& files);

    /**
     * @brief Map a backend grouping of index identifiers back onto files
     * @param groupingJson Backend text output
     * @param files Files the identifiers index into
     * @return Volume ID => files, CategorizeError unless the grouping is an
     *         exact partition of [0, files.size())
     */
    static std::expected<VolumesToFilesMap, EngineErrorInfo>
    rehydrate(const std::string& groupingJson, const std::vector<DicomFile>& files);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_organizer::core
