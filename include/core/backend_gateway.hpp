/**
 * @file backend_gateway.hpp
 * @brief Lazily started, single-flight connection to the decoding backend
 * @details BackendGateway owns the BackendHandle. The first initialize()
 *          call bootstraps the backend through the configured launcher;
 *          concurrent callers wait for that same attempt and observe the same
 *          outcome. After start the tag-reading capability is warmed with a
 *          harmless request whose failure is ignored.
 *
 * ## Thread Safety
 * - initialize() may be called from any number of threads concurrently
 * - Task calls are serialized: the backend processes one task to completion
 *   before the next one is submitted
 * - shutdown() must not race with in-flight task calls
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "decoding_backend.hpp"
#include "engine_config.hpp"
#include "engine_types.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace dicom_organizer::core {

/**
 * @brief Gateway to the delegated decoding backend
 */
class BackendGateway {
public:
    BackendGateway(BackendConfig config, BackendLauncher launcher);
    ~BackendGateway();

    // Non-copyable, non-movable: callers hold references to it
    BackendGateway(const BackendGateway&) = delete;
    BackendGateway& operator=(const BackendGateway&) = delete;
    BackendGateway(BackendGateway&&) = delete;
    BackendGateway& operator=(BackendGateway&&) = delete;

    /**
     * @brief Start the backend once; idempotent and safe to call concurrently
     * @return Shared outcome of the single bootstrap attempt (InitError on failure)
     */
    std::expected<void, EngineErrorInfo> initialize();

    /**
     * @brief Whether a backend handle is live
     */
    [[nodiscard]] bool isInitialized() const;

    /**
     * @brief Tear down the backend handle and allow a new bootstrap
     */
    void shutdown();

    /**
     * @brief Run a named backend task
     * @param taskName Pipeline name, normally config().pipelineName
     * @return Result, BackendUnavailable without a handle, TaskExecutionError
     *         when the backend reports failure
     */
    std::expected<TaskResult, EngineErrorInfo>
    runTask(const std::string& taskName,
            const std::vector<std::string>& args,
            const std::vector<TaskInput>& inputs,
            const std::vector<TaskOutputSpec>& outputs);

    /**
     * @brief Dedicated tag-reading call
     */
    std::expected<TagCodeValues, EngineErrorInfo>
    readDicomTags(const BinaryFile& file, const std::vector<std::string>& tagCodes);

    /**
     * @brief Dedicated whole-series reconstruction call
     */
    std::expected<Image, EngineErrorInfo>
    readImageDicomFileSeries(const std::vector<BinaryFile>& files, bool singleSortedSeries);

    /**
     * @brief Configuration this gateway was created with
     */
    [[nodiscard]] const BackendConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_organizer::core
