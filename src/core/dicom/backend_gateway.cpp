#include "core/backend_gateway.hpp"

#include "core/logging.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <type_traits>

namespace dicom_organizer::core {

class BackendGateway::Impl {
public:
    using InitOutcome = std::expected<void, EngineErrorInfo>;

    BackendConfig config;
    BackendLauncher launcher;
    std::shared_ptr<spdlog::logger> logger;

    /// Guards initializeCheck
    std::mutex stateMutex;
    /// Empty while not started; shared by every caller once started
    std::shared_future<InitOutcome> initializeCheck;

    /// Guards backend; held for the whole duration of a task
    std::mutex taskMutex;
    std::unique_ptr<IDecodingBackend> backend;
    std::atomic<bool> ready{false};

    Impl(BackendConfig cfg, BackendLauncher launch)
        : config(std::move(cfg))
        , launcher(std::move(launch))
        , logger(logging::LoggerFactory::create("BackendGateway")) {}

    InitOutcome bootstrap()
    {
        logger->info("Starting decoding backend (pipeline: {})", config.pipelineName);

        if (!config.isValid()) {
            return std::unexpected(EngineErrorInfo{
                EngineError::InitError,
                "Invalid backend configuration: pipeline name is empty"
            });
        }
        if (!launcher) {
            return std::unexpected(EngineErrorInfo{
                EngineError::InitError,
                "No backend launcher configured"
            });
        }

        std::unique_ptr<IDecodingBackend> launched;
        try {
            auto result = launcher(config);
            if (!result) {
                return std::unexpected(EngineErrorInfo{
                    EngineError::InitError,
                    "Could not start decoding backend: " + result.error().message
                });
            }
            launched = std::move(result.value());
        } catch (const std::exception& e) {
            return std::unexpected(EngineErrorInfo{
                EngineError::InitError,
                std::string("Could not start decoding backend: ") + e.what()
            });
        }

        if (!launched) {
            return std::unexpected(EngineErrorInfo{
                EngineError::InitError,
                "Could not start decoding backend: launcher returned no handle"
            });
        }

        if (config.preloadTagReader) {
            preloadTagReader(*launched);
        }

        {
            std::lock_guard<std::mutex> lock(taskMutex);
            backend = std::move(launched);
            ready.store(true);
        }

        logger->info("Decoding backend ready");
        return {};
    }

    /// A failed warm-up leaves the backend usable; only the failure is logged
    void preloadTagReader(IDecodingBackend& target)
    {
        BinaryFile empty{"", std::make_shared<const std::vector<uint8_t>>()};
        try {
            auto warm = target.readDicomTags(empty, {});
            if (!warm) {
                logger->debug("Tag reader warm-up failed (ignored): {}", warm.error().message);
            }
        } catch (const std::exception& e) {
            logger->debug("Tag reader warm-up threw (ignored): {}", e.what());
        }
    }

    template <typename Fn>
    std::invoke_result_t<Fn, IDecodingBackend&>
    withBackend(const std::string& operation, Fn&& fn)
    {
        std::lock_guard<std::mutex> lock(taskMutex);
        if (!backend) {
            return std::unexpected(EngineErrorInfo{
                EngineError::BackendUnavailable,
                "Decoding backend is not initialized (" + operation + ")"
            });
        }

        try {
            auto result = fn(*backend);
            if (!result) {
                logger->debug("{} failed: {}", operation, result.error().message);
                return std::unexpected(EngineErrorInfo{
                    EngineError::TaskExecutionError,
                    result.error().message
                });
            }
            return result;
        } catch (const std::exception& e) {
            logger->debug("{} threw: {}", operation, e.what());
            return std::unexpected(EngineErrorInfo{
                EngineError::TaskExecutionError,
                operation + " failed: " + e.what()
            });
        }
    }
};

BackendGateway::BackendGateway(BackendConfig config, BackendLauncher launcher)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(launcher)))
{
}

BackendGateway::~BackendGateway() = default;

std::expected<void, EngineErrorInfo> BackendGateway::initialize()
{
    std::promise<Impl::InitOutcome> promise;
    std::shared_future<Impl::InitOutcome> pending;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        if (!impl_->initializeCheck.valid()) {
            impl_->initializeCheck = promise.get_future().share();
            owner = true;
        }
        pending = impl_->initializeCheck;
    }

    if (owner) {
        Impl::InitOutcome outcome;
        try {
            outcome = impl_->bootstrap();
        } catch (const std::exception& e) {
            outcome = std::unexpected(EngineErrorInfo{
                EngineError::InitError,
                std::string("Backend bootstrap failed: ") + e.what()
            });
        }
        if (!outcome) {
            impl_->logger->error("Backend initialization failed: {}", outcome.error().message);
        }
        promise.set_value(std::move(outcome));
    }

    return pending.get();
}

bool BackendGateway::isInitialized() const
{
    return impl_->ready.load();
}

void BackendGateway::shutdown()
{
    std::shared_future<Impl::InitOutcome> pending;
    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        pending = impl_->initializeCheck;
    }
    if (pending.valid()) {
        pending.wait();
    }

    std::unique_ptr<IDecodingBackend> released;
    {
        std::lock_guard<std::mutex> lock(impl_->taskMutex);
        released = std::move(impl_->backend);
        impl_->ready.store(false);
    }
    {
        std::lock_guard<std::mutex> lock(impl_->stateMutex);
        impl_->initializeCheck = {};
    }

    if (released) {
        released.reset();
        impl_->logger->info("Decoding backend shut down");
    }
}

std::expected<TaskResult, EngineErrorInfo>
BackendGateway::runTask(const std::string& taskName,
                        const std::vector<std::string>& args,
                        const std::vector<TaskInput>& inputs,
                        const std::vector<TaskOutputSpec>& outputs)
{
    impl_->logger->debug("Running task '{}' ({} args, {} inputs, {} outputs)",
                         taskName, args.size(), inputs.size(), outputs.size());

    auto result = impl_->withBackend("task " + taskName,
        [&](IDecodingBackend& backend) {
            return backend.runPipeline(taskName, args, inputs, outputs);
        });
    if (!result) {
        return result;
    }

    if (result->returnCode != 0) {
        return std::unexpected(EngineErrorInfo{
            EngineError::TaskExecutionError,
            "Task '" + taskName + "' exited with code " +
                std::to_string(result->returnCode) +
                (result->stderrText.empty() ? "" : ": " + result->stderrText)
        });
    }

    if (result->outputs.size() < outputs.size()) {
        return std::unexpected(EngineErrorInfo{
            EngineError::TaskExecutionError,
            "Task '" + taskName + "' produced " + std::to_string(result->outputs.size()) +
                " outputs, expected " + std::to_string(outputs.size())
        });
    }

    return result;
}

std::expected<TagCodeValues, EngineErrorInfo>
BackendGateway::readDicomTags(const BinaryFile& file, const std::vector<std::string>& tagCodes)
{
    return impl_->withBackend("readDicomTags",
        [&](IDecodingBackend& backend) {
            return backend.readDicomTags(file, tagCodes);
        });
}

std::expected<Image, EngineErrorInfo>
BackendGateway::readImageDicomFileSeries(const std::vector<BinaryFile>& files,
                                         bool singleSortedSeries)
{
    return impl_->withBackend("readImageDicomFileSeries",
        [&](IDecodingBackend& backend) {
            return backend.readImageDicomFileSeries(files, singleSortedSeries);
        });
}

const BackendConfig& BackendGateway::config() const
{
    return impl_->config;
}

} // namespace dicom_organizer::core
