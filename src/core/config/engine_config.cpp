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

#include "core/engine_config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace dicom_organizer::core {

namespace {

BackendConfig backendConfigFromJson(const nlohmann::json& j) {
    BackendConfig config;
    config.pipelineName = j.value("pipeline_name", config.pipelineName);
    config.scratchDirectory = j.value("scratch_directory", std::string{});
    config.preloadTagReader = j.value("preload_tag_reader", config.preloadTagReader);
    return config;
}

logging::LogConfig logConfigFromJson(const nlohmann::json& j) {
    logging::LogConfig config;
    config.level = logging::logLevelFromString(
        j.value("level", logging::to_string(config.level)));
    config.enableFileLogging = j.value("enable_file_logging", config.enableFileLogging);
    config.logDirectory = j.value("log_directory", std::string{});
    config.pattern = j.value("pattern", config.pattern);
    config.maxFileSize = j.value("max_file_size", config.maxFileSize);
    config.maxFiles = j.value("max_files", config.maxFiles);
    return config;
}

} // anonymous namespace

std::expected<EngineConfig, EngineErrorInfo>
engineConfigFromJson(const nlohmann::json& json)
{
    if (!json.is_object()) {
        return std::unexpected(EngineErrorInfo{
            EngineError::InvalidConfiguration,
            "Engine configuration must be a JSON object"
        });
    }

    try {
        EngineConfig config;
        if (json.contains("backend")) {
            config.backend = backendConfigFromJson(json.at("backend"));
        }
        config.sortByInstanceNumber =
            json.value("sort_by_instance_number", config.sortByInstanceNumber);
        if (json.contains("logging")) {
            config.logging = logConfigFromJson(json.at("logging"));
        }

        if (!config.isValid()) {
            return std::unexpected(EngineErrorInfo{
                EngineError::InvalidConfiguration,
                "Backend pipeline name must not be empty"
            });
        }
        return config;

    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(EngineErrorInfo{
            EngineError::InvalidConfiguration,
            std::string("Invalid engine configuration: ") + e.what()
        });
    }
}

std::expected<EngineConfig, EngineErrorInfo>
loadEngineConfig(const std::filesystem::path& configPath)
{
    if (!std::filesystem::exists(configPath)) {
        return std::unexpected(EngineErrorInfo{
            EngineError::FileNotFound,
            "Configuration file not found: " + configPath.string()
        });
    }

    std::ifstream in(configPath);
    if (!in) {
        return std::unexpected(EngineErrorInfo{
            EngineError::FileReadError,
            "Cannot open configuration file: " + configPath.string()
        });
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(EngineErrorInfo{
            EngineError::InvalidConfiguration,
            std::string("Malformed configuration file: ") + e.what()
        });
    }

    return engineConfigFromJson(json);
}

nlohmann::json engineConfigToJson(const EngineConfig& config)
{
    return {
        {"backend", {
            {"pipeline_name", config.backend.pipelineName},
            {"scratch_directory", config.backend.scratchDirectory.string()},
            {"preload_tag_reader", config.backend.preloadTagReader}
        }},
        {"sort_by_instance_number", config.sortByInstanceNumber},
        {"logging", {
            {"level", logging::to_string(config.logging.level)},
            {"enable_file_logging", config.logging.enableFileLogging},
            {"log_directory", config.logging.logDirectory.string()},
            {"pattern", config.logging.pattern},
            {"max_file_size", config.logging.maxFileSize},
            {"max_files", config.logging.maxFiles}
        }}
    };
}

} // namespace dicom_organizer::core
