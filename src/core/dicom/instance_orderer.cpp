#include "core/instance_orderer.hpp"

#include "core/logging.hpp"

#include <charconv>
#include <limits>
#include <map>
#include <optional>

namespace dicom_organizer::core {

namespace {

/// Leading integer of an IS value, nullopt when there is none
std::optional<int64_t> tryParseLeadingInteger(std::string_view value) noexcept
{
    size_t pos = 0;
    while (pos < value.size() &&
           (value[pos] == ' ' || value[pos] == '\t' || value[pos] == '\r' || value[pos] == '\n')) {
        ++pos;
    }
    if (pos < value.size() && value[pos] == '+') {
        ++pos;
        if (pos < value.size() && value[pos] == '-') {
            return std::nullopt;
        }
    }

    int64_t key = 0;
    auto [ptr, ec] = std::from_chars(value.data() + pos, value.data() + value.size(), key);
    if (ec == std::errc::result_out_of_range) {
        return value[pos] == '-' ? std::numeric_limits<int64_t>::min()
                                 : std::numeric_limits<int64_t>::max();
    }
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return key;
}

} // anonymous namespace

class InstanceOrderer::Impl {
public:
    TagReader& tagReader;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(TagReader& reader)
        : tagReader(reader)
        , logger(logging::LoggerFactory::create("InstanceOrderer")) {}
};

InstanceOrderer::InstanceOrderer(TagReader& tagReader)
    : impl_(std::make_unique<Impl>(tagReader))
{
}

InstanceOrderer::~InstanceOrderer() = default;

std::expected<std::vector<DicomFile>, EngineErrorInfo>
InstanceOrderer::orderByInstance(const std::vector<DicomFile>& files)
{
    std::vector<KeyedFile> keyedFiles;
    keyedFiles.reserve(files.size());

    // One lookup at a time, in scan order
    for (const auto& file : files) {
        auto tags = impl_->tagReader.readTags(file, {kInstanceNumberTag});
        if (!tags) {
            if (tags.error().code == EngineError::BackendUnavailable ||
                tags.error().code == EngineError::InitError) {
                return std::unexpected(tags.error());
            }
            return std::unexpected(EngineErrorInfo{
                EngineError::OrderError,
                "Cannot read Instance Number of " + file.name + ": " + tags.error().message
            });
        }

        int64_t key = 0;
        auto it = tags->find(kInstanceNumberTag.name);
        if (it == tags->end()) {
            impl_->logger->warn("{} has no Instance Number; ordering it as 0", file.name);
        } else {
            auto parsed = tryParseLeadingInteger(it->second);
            if (parsed) {
                key = *parsed;
            } else {
                impl_->logger->warn("{} has non-numeric Instance Number '{}'; ordering it as 0",
                                    file.name, it->second);
            }
        }
        keyedFiles.emplace_back(key, file);
    }

    std::map<int64_t, size_t> keyCounts;
    for (const auto& [key, file] : keyedFiles) {
        if (++keyCounts[key] == 2) {
            impl_->logger->warn("Duplicate Instance Number {}; keeping the last file in scan order",
                                key);
        }
    }

    auto ordered = orderByKeys(keyedFiles);
    impl_->logger->debug("Ordered {} files into {} slices", files.size(), ordered.size());
    return ordered;
}

int64_t InstanceOrderer::parseOrderingKey(std::string_view value) noexcept
{
    return tryParseLeadingInteger(value).value_or(0);
}

std::vector<DicomFile> InstanceOrderer::orderByKeys(const std::vector<KeyedFile>& keyedFiles)
{
    std::map<int64_t, DicomFile> fileByKey;
    for (const auto& [key, file] : keyedFiles) {
        fileByKey.insert_or_assign(key, file);
    }

    std::vector<DicomFile> ordered;
    ordered.reserve(fileByKey.size());
    for (auto& [key, file] : fileByKey) {
        ordered.push_back(std::move(file));
    }
    return ordered;
}

} // namespace dicom_organizer::core
