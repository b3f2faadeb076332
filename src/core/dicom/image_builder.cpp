#include "core/image_builder.hpp"

#include "core/identifier_sanitizer.hpp"
#include "core/logging.hpp"

namespace dicom_organizer::core {

class ImageBuilder::Impl {
public:
    BackendGateway& gateway;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(BackendGateway& gw)
        : gateway(gw)
        , logger(logging::LoggerFactory::create("ImageBuilder")) {}

    std::unexpected<EngineErrorInfo> buildFailure(const std::string& message)
    {
        logger->error("{}", message);
        return std::unexpected(EngineErrorInfo{EngineError::BuildError, message});
    }

    std::unexpected<EngineErrorInfo> relabel(const EngineErrorInfo& error, const std::string& context)
    {
        if (error.code == EngineError::BackendUnavailable || error.code == EngineError::InitError) {
            return std::unexpected(error);
        }
        return buildFailure(context + ": " + error.message);
    }
};

ImageBuilder::ImageBuilder(BackendGateway& gateway)
    : impl_(std::make_unique<Impl>(gateway))
{
}

ImageBuilder::~ImageBuilder() = default;

std::expected<Image, EngineErrorInfo>
ImageBuilder::getSlice(const DicomFile& file, bool asThumbnail)
{
    if (auto init = impl_->gateway.initialize(); !init) {
        return std::unexpected(init.error());
    }

    const std::string identifier = sanitizeFileName(file.name);

    const std::vector<TaskInput> inputs = {
        TaskInput{InterfaceType::BinaryFile, BinaryFile{identifier, file.content}}
    };

    const std::vector<std::string> args = {
        "--action", "getSliceImage",
        "--thumbnail", asThumbnail ? "true" : "false",
        "--file", identifier,
        "--memory-io", "0"
    };

    const std::vector<TaskOutputSpec> outputs = {{InterfaceType::Image}};

    auto result = impl_->gateway.runTask(impl_->gateway.config().pipelineName, args, inputs, outputs);
    if (!result) {
        return impl_->relabel(result.error(), "Failed to get slice of " + file.name);
    }

    auto* image = std::get_if<Image>(&result->outputs.front().data);
    if (image == nullptr) {
        return impl_->buildFailure("Slice request for " + file.name + " returned no image");
    }
    if (image->dimension != 2 || !image->isValid()) {
        return impl_->buildFailure("Slice request for " + file.name + " returned a malformed image");
    }

    impl_->logger->debug("Slice of {} built ({}x{}{})", file.name,
                         image->spatial.size[0], image->spatial.size[1],
                         asThumbnail ? ", thumbnail" : "");
    return std::move(*image);
}

std::expected<Image, EngineErrorInfo>
ImageBuilder::buildVolume(const std::vector<DicomFile>& orderedFiles, bool singleSortedSeries)
{
    if (auto init = impl_->gateway.initialize(); !init) {
        return std::unexpected(init.error());
    }

    if (orderedFiles.empty()) {
        return impl_->buildFailure("No slices provided");
    }

    impl_->logger->info("Building volume from {} files", orderedFiles.size());

    std::vector<BinaryFile> inputImages;
    inputImages.reserve(orderedFiles.size());
    for (const auto& file : orderedFiles) {
        auto sanitized = sanitizeFile(file);
        inputImages.push_back(BinaryFile{std::move(sanitized.name), sanitized.content});
    }

    auto result = impl_->gateway.readImageDicomFileSeries(inputImages, singleSortedSeries);
    if (!result) {
        return impl_->relabel(result.error(), "Failed to build volume");
    }

    if (result->dimension != 3 || !result->isValid()) {
        return impl_->buildFailure("Volume reconstruction returned a malformed image");
    }

    impl_->logger->info("Volume built: {}x{}x{}",
                        result->spatial.size[0], result->spatial.size[1], result->spatial.size[2]);
    return result;
}

} // namespace dicom_organizer::core
