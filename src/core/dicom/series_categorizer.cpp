#include "core/series_categorizer.hpp"

#include "core/logging.hpp"

#include <charconv>
#include <optional>

#include <nlohmann/json.hpp>

namespace dicom_organizer::core {

namespace {

std::unexpected<EngineErrorInfo> malformed(const std::string& detail)
{
    return std::unexpected(EngineErrorInfo{
        EngineError::CategorizeError,
        "Malformed categorization output: " + detail
    });
}

/// Strict decimal index; rejects signs, whitespace and trailing text
std::optional<size_t> parseIndex(const std::string& identifier)
{
    size_t index = 0;
    const char* first = identifier.data();
    const char* last = first + identifier.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (identifier.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return index;
}

} // anonymous namespace

class SeriesCategorizer::Impl {
public:
    BackendGateway& gateway;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(BackendGateway& gw)
        : gateway(gw)
        , logger(logging::LoggerFactory::create("SeriesCategorizer")) {}
};

SeriesCategorizer::SeriesCategorizer(BackendGateway& gateway)
    : impl_(std::make_unique<Impl>(gateway))
{
}

SeriesCategorizer::~SeriesCategorizer() = default;

std::expected<VolumesToFilesMap, EngineErrorInfo>
SeriesCategorizer::categorize(const std::vector<DicomFile>& files)
{
    if (auto init = impl_->gateway.initialize(); !init) {
        return std::unexpected(init.error());
    }

    if (files.empty()) {
        impl_->logger->debug("No files to categorize");
        return VolumesToFilesMap{};
    }

    impl_->logger->info("Categorizing {} files", files.size());

    // Positional identifiers keep duplicate file names apart
    std::vector<TaskInput> inputs;
    inputs.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        inputs.push_back(TaskInput{
            InterfaceType::BinaryFile,
            BinaryFile{std::to_string(i), files[i].content}
        });
    }

    std::vector<std::string> args = {"--action", "categorize", "--memory-io", "0", "--files"};
    for (const auto& input : inputs) {
        args.push_back(std::get<BinaryFile>(input.data).path);
    }

    const std::vector<TaskOutputSpec> outputs = {{InterfaceType::TextStream}};

    auto result = impl_->gateway.runTask(impl_->gateway.config().pipelineName, args, inputs, outputs);
    if (!result) {
        if (result.error().code == EngineError::BackendUnavailable) {
            return std::unexpected(result.error());
        }
        impl_->logger->error("Categorization failed: {}", result.error().message);
        return std::unexpected(EngineErrorInfo{
            EngineError::CategorizeError,
            "Categorization failed: " + result.error().message
        });
    }

    const auto* text = std::get_if<TextStream>(&result->outputs.front().data);
    if (text == nullptr) {
        impl_->logger->error("Categorization produced no text output");
        return malformed("expected a text stream output");
    }

    auto volumes = rehydrate(text->data, files);
    if (!volumes) {
        impl_->logger->error("{}", volumes.error().message);
        return volumes;
    }

    impl_->logger->info("Categorized {} files into {} volumes", files.size(), volumes->size());
    return volumes;
}

std::expected<VolumesToFilesMap, EngineErrorInfo>
SeriesCategorizer::rehydrate(const std::string& groupingJson, const std::vector<DicomFile>& files)
{
    nlohmann::json grouping;
    try {
        grouping = nlohmann::json::parse(groupingJson);
    } catch (const nlohmann::json::parse_error& e) {
        return malformed(e.what());
    }

    if (!grouping.is_object()) {
        return malformed("expected an object of volume ID => file identifiers");
    }

    std::vector<bool> assigned(files.size(), false);
    size_t assignedCount = 0;
    VolumesToFilesMap volumes;

    for (const auto& [volumeKey, identifiers] : grouping.items()) {
        if (!identifiers.is_array() || identifiers.empty()) {
            return malformed("volume '" + volumeKey + "' has no file list");
        }

        std::vector<DicomFile> volumeFiles;
        volumeFiles.reserve(identifiers.size());
        for (const auto& identifier : identifiers) {
            if (!identifier.is_string()) {
                return malformed("volume '" + volumeKey + "' lists a non-string identifier");
            }
            const auto& id = identifier.get_ref<const std::string&>();
            auto index = parseIndex(id);
            if (!index || *index >= files.size()) {
                return malformed("unknown file identifier '" + id + "'");
            }
            if (assigned[*index]) {
                return malformed("file identifier '" + id + "' assigned more than once");
            }
            assigned[*index] = true;
            ++assignedCount;
            volumeFiles.push_back(files[*index]);
        }
        volumes.emplace(volumeKey, std::move(volumeFiles));
    }

    if (assignedCount != files.size()) {
        return malformed(std::to_string(files.size() - assignedCount) +
                         " submitted files missing from every volume");
    }

    return volumes;
}

} // namespace dicom_organizer::core
