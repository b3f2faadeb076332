#include "core/tag_reader.hpp"

#include "core/identifier_sanitizer.hpp"
#include "core/logging.hpp"

#include <unordered_map>

namespace dicom_organizer::core {

class TagReader::Impl {
public:
    BackendGateway& gateway;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(BackendGateway& gw)
        : gateway(gw)
        , logger(logging::LoggerFactory::create("TagReader")) {}
};

TagReader::TagReader(BackendGateway& gateway)
    : impl_(std::make_unique<Impl>(gateway))
{
}

TagReader::~TagReader() = default;

std::expected<TagValues, EngineErrorInfo>
TagReader::readTags(const DicomFile& file, const std::vector<TagSpec>& tags)
{
    if (auto init = impl_->gateway.initialize(); !init) {
        return std::unexpected(init.error());
    }

    std::vector<std::string> tagCodes;
    tagCodes.reserve(tags.size());
    for (const auto& spec : tags) {
        tagCodes.push_back(spec.tag);
    }

    auto sanitized = sanitizeFile(file);
    auto result = impl_->gateway.readDicomTags(
        BinaryFile{sanitized.name, sanitized.content}, tagCodes);
    if (!result) {
        if (result.error().code == EngineError::BackendUnavailable) {
            return std::unexpected(result.error());
        }
        impl_->logger->error("Failed to read tags from {}: {}", file.name, result.error().message);
        return std::unexpected(EngineErrorInfo{
            EngineError::TagReadError,
            "Failed to read tags from " + file.name + ": " + result.error().message
        });
    }

    std::unordered_map<std::string, std::string> valuesByCode(result->begin(), result->end());

    TagValues values;
    for (const auto& spec : tags) {
        auto it = valuesByCode.find(spec.tag);
        if (it != valuesByCode.end()) {
            values[spec.name] = it->second;
        }
    }

    impl_->logger->debug("Read {}/{} tags from {}", values.size(), tags.size(), file.name);
    return values;
}

} // namespace dicom_organizer::core
