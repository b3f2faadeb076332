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
 * @file engine_config.hpp
 * @brief Construction-time configuration of the series organization engine
 * @details Backend discovery settings, the instance-ordering policy and the
 *          logging configuration are passed explicitly to the engine instead
 *          of living in process-wide state. A JSON form can be loaded from
 *          disk; missing keys keep their defaults.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "engine_types.hpp"
#include "logging.hpp"

#include <expected>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace dicom_organizer::core {

/**
 * @brief Settings used to locate and start the decoding backend
 */
struct BackendConfig {
    /// Pipeline the launcher resolves for every task
    std::string pipelineName = "dicom";

    /// Root for backend transit files; empty selects a unique temp directory
    std::filesystem::path scratchDirectory;

    /// Issue a no-op tag read after start so the first real read is warm
    bool preloadTagReader = true;

    [[nodiscard]] bool isValid() const noexcept {
        return !pipelineName.empty();
    }
};

/**
 * @brief Engine configuration
 */
struct EngineConfig {
    BackendConfig backend;

    /// Reorder each categorized volume by Instance Number (0020|0013)
    bool sortByInstanceNumber = true;

    /// Applied by the first engine only; the logger setup is process-wide
    logging::LogConfig logging;

    [[nodiscard]] bool isValid() const noexcept {
        return backend.isValid();
    }
};

/**
 * @brief Build a configuration from its JSON form
 * @param json Object with optional "backend", "sort_by_instance_number", "logging"
 * @return Configuration, InvalidConfiguration on type mismatch
 */
std::expected<EngineConfig, EngineErrorInfo>
engineConfigFromJson(const nlohmann::json& json);

/**
 * @brief Load a configuration file
 * @param configPath Path to a JSON configuration file
 * @return Configuration, FileNotFound or InvalidConfiguration on failure
 */
std::expected<EngineConfig, EngineErrorInfo>
loadEngineConfig(const std::filesystem::path& configPath);

/**
 * @brief Serialize a configuration to its JSON form
 */
nlohmann::json engineConfigToJson(const EngineConfig& config);

} // namespace dicom_organizer::core
