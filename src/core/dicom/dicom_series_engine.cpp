#include "core/dicom_series_engine.hpp"

#include "core/backend_gateway.hpp"
#include "core/image_builder.hpp"
#include "core/instance_orderer.hpp"
#include "core/logging.hpp"
#include "core/series_categorizer.hpp"
#include "core/tag_reader.hpp"

namespace dicom_organizer::core {

class DicomSeriesEngine::Impl {
public:
    EngineConfig config;
    BackendGateway gateway;
    TagReader tagReader;
    SeriesCategorizer categorizer;
    InstanceOrderer orderer;
    ImageBuilder imageBuilder;
    ProgressCallback progressCallback;
    std::shared_ptr<spdlog::logger> logger;

    Impl(EngineConfig cfg, BackendLauncher launcher)
        : config(std::move(cfg))
        , gateway(config.backend, std::move(launcher))
        , tagReader(gateway)
        , categorizer(gateway)
        , orderer(tagReader)
        , imageBuilder(gateway)
        , logger(logging::LoggerFactory::create("DicomSeriesEngine")) {}

    void reportProgress(size_t current, size_t total, const std::string& message)
    {
        if (progressCallback) {
            progressCallback(current, total, message);
        }
    }
};

DicomSeriesEngine::DicomSeriesEngine(EngineConfig config, BackendLauncher launcher)
{
    bool configureLogging = !logging::LoggerFactory::isConfigured();
    if (configureLogging) {
        logging::LoggerFactory::configure(config.logging);
    }
    impl_ = std::make_unique<Impl>(std::move(config), std::move(launcher));
    if (!configureLogging) {
        impl_->logger->debug("Logging already configured; keeping level {} instead of {}",
                             logging::to_string(logging::LoggerFactory::getGlobalLevel()),
                             logging::to_string(impl_->config.logging.level));
    }
}

DicomSeriesEngine::~DicomSeriesEngine() = default;

DicomSeriesEngine::DicomSeriesEngine(DicomSeriesEngine&&) noexcept = default;
DicomSeriesEngine& DicomSeriesEngine::operator=(DicomSeriesEngine&&) noexcept = default;

void DicomSeriesEngine::setProgressCallback(ProgressCallback callback)
{
    impl_->progressCallback = std::move(callback);
}

std::expected<void, EngineErrorInfo> DicomSeriesEngine::initialize()
{
    return impl_->gateway.initialize();
}

bool DicomSeriesEngine::isInitialized() const
{
    return impl_->gateway.isInitialized();
}

void DicomSeriesEngine::shutdown()
{
    impl_->gateway.shutdown();
}

std::expected<VolumesToFilesMap, EngineErrorInfo>
DicomSeriesEngine::categorize(const std::vector<DicomFile>& files)
{
    impl_->reportProgress(0, 100, "Categorizing files...");

    auto volumes = impl_->categorizer.categorize(files);
    if (!volumes) {
        return volumes;
    }

    if (!impl_->config.sortByInstanceNumber) {
        impl_->reportProgress(100, 100, "Categorization complete");
        return volumes;
    }

    const size_t total = volumes->size();
    size_t index = 0;
    for (auto& [volumeKey, volumeFiles] : *volumes) {
        impl_->reportProgress(index, total, "Ordering volume: " + volumeKey.substr(0, 20) + "...");

        auto ordered = impl_->orderer.orderByInstance(volumeFiles);
        if (!ordered) {
            impl_->logger->error("Failed to order volume {}: {}", volumeKey, ordered.error().message);
            return std::unexpected(ordered.error());
        }
        volumeFiles = std::move(*ordered);
        ++index;
    }

    impl_->reportProgress(total, total, "Categorization complete");
    return volumes;
}

std::expected<std::vector<DicomFile>, EngineErrorInfo>
DicomSeriesEngine::orderByInstance(const std::vector<DicomFile>& files)
{
    return impl_->orderer.orderByInstance(files);
}

std::expected<TagValues, EngineErrorInfo>
DicomSeriesEngine::readTags(const DicomFile& file, const std::vector<TagSpec>& tags)
{
    return impl_->tagReader.readTags(file, tags);
}

std::expected<Image, EngineErrorInfo>
DicomSeriesEngine::getSlice(const DicomFile& file, bool asThumbnail)
{
    return impl_->imageBuilder.getSlice(file, asThumbnail);
}

std::expected<Image, EngineErrorInfo>
DicomSeriesEngine::buildVolume(const std::vector<DicomFile>& files)
{
    return impl_->imageBuilder.buildVolume(files, impl_->config.sortByInstanceNumber);
}

const EngineConfig& DicomSeriesEngine::config() const
{
    return impl_->config;
}

} // namespace dicom_organizer::core
