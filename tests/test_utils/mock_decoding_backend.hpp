#pragma once

#include "core/decoding_backend.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace dicom_organizer::test_utils {

/// Recorded pipeline request
struct RecordedTask {
    std::string pipeline;
    std::vector<std::string> args;
    std::vector<core::TaskInput> inputs;
    std::vector<core::TaskOutputSpec> outputs;
};

/// Recorded series reconstruction request
struct RecordedSeriesRead {
    std::vector<std::string> paths;
    bool singleSortedSeries = false;
};

/**
 * @brief Shared script and request log of a MockDecodingBackend
 *
 * Tests keep the state while the gateway owns the backend itself.
 */
struct MockBackendState {
    std::mutex mutex;

    // Launch behaviour
    std::atomic<int> launchCount{0};
    std::chrono::milliseconds launchDelay{0};
    bool failLaunch = false;
    bool throwOnLaunch = false;

    // Warm-up / tag behaviour
    bool failWarmUp = false;
    bool failTagReads = false;
    /// Sanitized file name => (tag code => value)
    std::map<std::string, std::map<std::string, std::string>> tagsByFile;
    std::vector<std::string> tagReadPaths;
    int warmUpCount = 0;

    // Pipeline behaviour
    /// Builds the categorize JSON from the submitted identifiers
    std::function<std::string(const std::vector<std::string>&)> categorizeResponse;
    int pipelineReturnCode = 0;
    bool throwOnPipeline = false;
    bool omitOutputs = false;
    core::Image sliceImage;
    std::vector<RecordedTask> tasks;

    // Series behaviour
    bool failSeriesRead = false;
    core::Image volumeImage;
    std::vector<RecordedSeriesRead> seriesReads;
};

/// Valid image of the given dimension filled with zeros
inline core::Image makeImage(unsigned int dimension, size_t extent = 4,
                             core::PixelType type = core::PixelType::Float32)
{
    core::Image image;
    image.dimension = dimension;
    image.pixelType = type;
    for (unsigned int d = 0; d < dimension; ++d) {
        image.spatial.size.push_back(extent);
        image.spatial.spacing.push_back(1.0);
        image.spatial.origin.push_back(0.0);
    }
    for (unsigned int row = 0; row < dimension; ++row) {
        for (unsigned int col = 0; col < dimension; ++col) {
            image.spatial.direction.push_back(row == col ? 1.0 : 0.0);
        }
    }
    image.pixelData.assign(image.spatial.pixelCount() * core::pixelTypeSize(type), 0);
    return image;
}

/// Everything-in-one-volume grouping
inline std::string singleVolumeGrouping(const std::vector<std::string>& ids)
{
    std::string json = R"({"volume-1":[)";
    for (size_t i = 0; i < ids.size(); ++i) {
        json += (i ? ",\"" : "\"") + ids[i] + "\"";
    }
    return json + "]}";
}

/**
 * @brief Scripted decoding backend
 */
class MockDecodingBackend : public core::IDecodingBackend {
public:
    explicit MockDecodingBackend(std::shared_ptr<MockBackendState> state)
        : state_(std::move(state)) {}

    std::expected<core::TaskResult, core::EngineErrorInfo>
    runPipeline(const std::string& pipeline,
                const std::vector<std::string>& args,
                const std::vector<core::TaskInput>& inputs,
                const std::vector<core::TaskOutputSpec>& outputs) override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->tasks.push_back(RecordedTask{pipeline, args, inputs, outputs});

        if (state_->throwOnPipeline) {
            throw std::runtime_error("worker crashed");
        }

        core::TaskResult result;
        result.returnCode = state_->pipelineReturnCode;
        if (result.returnCode != 0) {
            result.stderrText = "pipeline failed";
            return result;
        }
        if (state_->omitOutputs) {
            return result;
        }

        const std::string action = argumentValue(args, "--action");
        if (action == "categorize") {
            std::vector<std::string> ids;
            for (const auto& input : inputs) {
                ids.push_back(std::get<core::BinaryFile>(input.data).path);
            }
            std::function<std::string(const std::vector<std::string>&)> respond =
                singleVolumeGrouping;
            if (state_->categorizeResponse) {
                respond = state_->categorizeResponse;
            }
            result.outputs.push_back(core::TaskOutput{
                core::InterfaceType::TextStream, core::TextStream{respond(ids)}});
        } else if (action == "getSliceImage") {
            result.outputs.push_back(core::TaskOutput{
                core::InterfaceType::Image, state_->sliceImage});
        } else {
            result.returnCode = 1;
            result.stderrText = "unknown action";
        }
        return result;
    }

    std::expected<core::TagCodeValues, core::EngineErrorInfo>
    readDicomTags(const core::BinaryFile& file,
                  const std::vector<std::string>& tagCodes) override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (file.path.empty()) {
            ++state_->warmUpCount;
            if (state_->failWarmUp) {
                return std::unexpected(core::EngineErrorInfo{
                    core::EngineError::TaskExecutionError, "empty file"});
            }
            return core::TagCodeValues{};
        }

        state_->tagReadPaths.push_back(file.path);
        if (state_->failTagReads) {
            return std::unexpected(core::EngineErrorInfo{
                core::EngineError::TaskExecutionError, "tag read failed"});
        }

        core::TagCodeValues values;
        auto fileIt = state_->tagsByFile.find(file.path);
        if (fileIt == state_->tagsByFile.end()) {
            return values;
        }
        for (const auto& code : tagCodes) {
            auto tagIt = fileIt->second.find(code);
            if (tagIt != fileIt->second.end()) {
                values.emplace_back(code, tagIt->second);
            }
        }
        return values;
    }

    std::expected<core::Image, core::EngineErrorInfo>
    readImageDicomFileSeries(const std::vector<core::BinaryFile>& files,
                             bool singleSortedSeries) override
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        RecordedSeriesRead read;
        read.singleSortedSeries = singleSortedSeries;
        for (const auto& file : files) {
            read.paths.push_back(file.path);
        }
        state_->seriesReads.push_back(std::move(read));

        if (state_->failSeriesRead) {
            return std::unexpected(core::EngineErrorInfo{
                core::EngineError::TaskExecutionError, "series read failed"});
        }
        return state_->volumeImage;
    }

private:
    static std::string argumentValue(const std::vector<std::string>& args, const std::string& key)
    {
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == key) {
                return args[i + 1];
            }
        }
        return {};
    }

    std::shared_ptr<MockBackendState> state_;
};

/// Launcher counting launches and creating MockDecodingBackend instances
inline core::BackendLauncher makeMockLauncher(std::shared_ptr<MockBackendState> state)
{
    return [state](const core::BackendConfig&)
        -> std::expected<std::unique_ptr<core::IDecodingBackend>, core::EngineErrorInfo> {
        state->launchCount.fetch_add(1);
        if (state->launchDelay.count() > 0) {
            std::this_thread::sleep_for(state->launchDelay);
        }
        if (state->throwOnLaunch) {
            throw std::runtime_error("spawn failed");
        }
        if (state->failLaunch) {
            return std::unexpected(core::EngineErrorInfo{
                core::EngineError::InitError, "worker unavailable"});
        }
        return std::make_unique<MockDecodingBackend>(state);
    };
}

/// DicomFile with a few bytes of distinguishable content
inline core::DicomFile makeFile(const std::string& name)
{
    return core::DicomFile::fromBytes(name, std::vector<uint8_t>(name.begin(), name.end()));
}

} // namespace dicom_organizer::test_utils
