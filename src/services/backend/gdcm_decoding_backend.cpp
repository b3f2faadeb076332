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

#include "services/gdcm_decoding_backend.hpp"

#include "core/image_converter.hpp"
#include "core/logging.hpp"

#include <format>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string_view>

#include <gdcmDataSet.h>
#include <gdcmReader.h>
#include <gdcmStringFilter.h>
#include <gdcmTag.h>
#include <itkGDCMImageIO.h>
#include <itkGDCMSeriesFileNames.h>
#include <itkImageFileReader.h>
#include <itkImageSeriesReader.h>
#include <itkRescaleIntensityImageFilter.h>
#include <nlohmann/json.hpp>

namespace dicom_organizer::services {

namespace fs = std::filesystem;
using core::EngineError;
using core::EngineErrorInfo;
using core::ImageConverter;

namespace {

struct PipelineArguments {
    std::string action;
    std::vector<std::string> files;
    std::string file;
    bool thumbnail = false;
    std::vector<std::string> unknown;
};

PipelineArguments parseArguments(const std::vector<std::string>& args)
{
    PipelineArguments parsed;
    auto isOption = [](const std::string& arg) { return arg.rfind("--", 0) == 0; };

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        auto nextValue = [&]() -> std::string {
            if (i + 1 < args.size() && !isOption(args[i + 1])) {
                return args[++i];
            }
            return {};
        };

        if (arg == "--action") {
            parsed.action = nextValue();
        } else if (arg == "--file") {
            parsed.file = nextValue();
        } else if (arg == "--thumbnail") {
            parsed.thumbnail = nextValue() == "true";
        } else if (arg == "--memory-io") {
            nextValue();  // payloads always arrive in memory
        } else if (arg == "--files") {
            while (i + 1 < args.size() && !isOption(args[i + 1])) {
                parsed.files.push_back(args[++i]);
            }
        } else {
            parsed.unknown.push_back(arg);
        }
    }
    return parsed;
}

core::TaskResult failedTask(std::string message)
{
    core::TaskResult result;
    result.returnCode = 1;
    result.stderrText = std::move(message);
    return result;
}

std::unexpected<EngineErrorInfo> backendFailure(std::string message)
{
    return std::unexpected(EngineErrorInfo{EngineError::TaskExecutionError, std::move(message)});
}

std::string trimPadding(std::string value)
{
    while (!value.empty() && (value.back() == ' ' || value.back() == '\0')) {
        value.pop_back();
    }
    return value;
}

bool isPlainFileName(const std::string& name)
{
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\") == std::string::npos;
}

std::string uniqueName(std::string_view prefix)
{
    std::random_device device;
    std::mt19937_64 engine(device());
    return std::format("{}-{:016x}", prefix, engine());
}

/**
 * @brief Scratch directory of one task; removed on destruction
 *
 * Payloads are written under names private to the workspace, so inputs that
 * share an identifier never collide on disk. identifierOf() maps a written
 * file back to the identifier it arrived with.
 */
class TaskWorkspace {
public:
    TaskWorkspace(fs::path path, std::shared_ptr<spdlog::logger> logger)
        : path_(std::move(path)), logger_(std::move(logger)) {}

    ~TaskWorkspace()
    {
        if (!created_) {
            return;
        }
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            logger_->warn("Failed to remove task directory {}: {}", path_.string(), ec.message());
        }
    }

    TaskWorkspace(const TaskWorkspace&) = delete;
    TaskWorkspace& operator=(const TaskWorkspace&) = delete;

    /// Create the directory; an existing one belongs to someone else
    std::expected<void, std::string> create()
    {
        std::error_code ec;
        bool created = fs::create_directory(path_, ec);
        if (ec) {
            return std::unexpected("Cannot create task directory " + path_.string() +
                                   ": " + ec.message());
        }
        if (!created) {
            return std::unexpected("Task directory " + path_.string() + " already exists");
        }
        created_ = true;
        return {};
    }

    std::expected<fs::path, std::string> materialize(const core::BinaryFile& file)
    {
        size_t index = identifiers_.size();
        std::string diskName = isPlainFileName(file.path)
            ? std::format("{}-{}", index, file.path)
            : std::to_string(index);

        auto target = path_ / diskName;
        std::ofstream out(target, std::ios::binary);
        if (file.data && !file.data->empty()) {
            out.write(reinterpret_cast<const char*>(file.data->data()),
                      static_cast<std::streamsize>(file.data->size()));
        }
        out.close();
        if (!out) {
            return std::unexpected("Failed to write input '" + file.path + "'");
        }
        identifiers_.emplace(std::move(diskName), file.path);
        return target;
    }

    /// Identifier of a file written by materialize(), nullopt for foreign files
    std::optional<std::string> identifierOf(const fs::path& writtenFile) const
    {
        auto it = identifiers_.find(writtenFile.filename().string());
        if (it == identifiers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    std::shared_ptr<spdlog::logger> logger_;
    std::map<std::string, std::string> identifiers_;
    bool created_ = false;
};

} // anonymous namespace

class GdcmDecodingBackend::Impl {
public:
    fs::path root;
    bool ownsRoot = false;
    std::shared_ptr<spdlog::logger> logger;

    Impl(fs::path workingDirectory, bool owns)
        : root(std::move(workingDirectory))
        , ownsRoot(owns)
        , logger(logging::LoggerFactory::create("GdcmDecodingBackend")) {}

    ~Impl()
    {
        if (!ownsRoot) {
            return;
        }
        std::error_code ec;
        fs::remove_all(root, ec);
        if (ec) {
            logger->warn("Failed to remove scratch directory {}: {}", root.string(), ec.message());
        }
    }

    TaskWorkspace newWorkspace()
    {
        return TaskWorkspace(root / uniqueName("task"), logger);
    }

    std::expected<core::TaskResult, EngineErrorInfo>
    categorize(const PipelineArguments& args, const std::vector<core::TaskInput>& inputs)
    {
        if (args.files.empty()) {
            return failedTask("categorize requires --files");
        }

        auto workspace = newWorkspace();
        if (auto created = workspace.create(); !created) {
            return failedTask(created.error());
        }

        std::set<std::string> submitted(args.files.begin(), args.files.end());
        for (const auto& input : inputs) {
            const auto* file = std::get_if<core::BinaryFile>(&input.data);
            if (file == nullptr || submitted.count(file->path) == 0) {
                continue;
            }
            if (auto written = workspace.materialize(*file); !written) {
                return failedTask(written.error());
            }
        }

        auto namesGenerator = itk::GDCMSeriesFileNames::New();
        namesGenerator->SetUseSeriesDetails(true);
        namesGenerator->SetDirectory(workspace.path().string());

        nlohmann::json grouping = nlohmann::json::object();
        for (const auto& uid : namesGenerator->GetSeriesUIDs()) {
            nlohmann::json identifiers = nlohmann::json::array();
            for (const auto& fileName : namesGenerator->GetFileNames(uid)) {
                auto identifier = workspace.identifierOf(fileName);
                if (!identifier) {
                    return failedTask("Unexpected file in task directory: " + fileName);
                }
                identifiers.push_back(std::move(*identifier));
            }
            grouping[uid] = std::move(identifiers);
        }

        logger->debug("Categorized {} inputs into {} series", args.files.size(), grouping.size());

        core::TaskResult result;
        result.outputs.push_back(core::TaskOutput{
            core::InterfaceType::TextStream,
            core::TextStream{grouping.dump()}
        });
        return result;
    }

    std::expected<core::TaskResult, EngineErrorInfo>
    getSliceImage(const PipelineArguments& args, const std::vector<core::TaskInput>& inputs)
    {
        if (args.file.empty()) {
            return failedTask("getSliceImage requires --file");
        }

        const core::BinaryFile* source = nullptr;
        for (const auto& input : inputs) {
            const auto* file = std::get_if<core::BinaryFile>(&input.data);
            if (file != nullptr && file->path == args.file) {
                source = file;
                break;
            }
        }
        if (source == nullptr) {
            return failedTask("No input named '" + args.file + "'");
        }

        auto workspace = newWorkspace();
        if (auto created = workspace.create(); !created) {
            return failedTask(created.error());
        }
        auto path = workspace.materialize(*source);
        if (!path) {
            return failedTask(path.error());
        }

        auto gdcmIO = itk::GDCMImageIO::New();
        using ReaderType = itk::ImageFileReader<ImageConverter::FloatSliceType>;
        auto reader = ReaderType::New();
        reader->SetFileName(path->string());
        reader->SetImageIO(gdcmIO);
        reader->Update();

        core::Image image;
        if (args.thumbnail) {
            using RescaleType = itk::RescaleIntensityImageFilter<
                ImageConverter::FloatSliceType, ImageConverter::ThumbnailSliceType>;
            auto rescale = RescaleType::New();
            rescale->SetInput(reader->GetOutput());
            rescale->SetOutputMinimum(0);
            rescale->SetOutputMaximum(255);
            rescale->Update();
            image = ImageConverter::toImage(rescale->GetOutput());
        } else {
            image = ImageConverter::toImage(reader->GetOutput());
        }

        core::TaskResult result;
        result.outputs.push_back(core::TaskOutput{core::InterfaceType::Image, std::move(image)});
        return result;
    }
};

GdcmDecodingBackend::GdcmDecodingBackend(fs::path workingDirectory, bool ownsWorkingDirectory)
    : impl_(std::make_unique<Impl>(std::move(workingDirectory), ownsWorkingDirectory))
{
}

GdcmDecodingBackend::~GdcmDecodingBackend() = default;

std::expected<core::TaskResult, EngineErrorInfo>
GdcmDecodingBackend::runPipeline(const std::string& pipeline,
                                 const std::vector<std::string>& args,
                                 const std::vector<core::TaskInput>& inputs,
                                 const std::vector<core::TaskOutputSpec>& outputs)
{
    if (pipeline != kPipelineName) {
        return failedTask("Unknown pipeline '" + pipeline + "'");
    }

    auto parsed = parseArguments(args);
    if (!parsed.unknown.empty()) {
        return failedTask("Unknown argument '" + parsed.unknown.front() + "'");
    }

    auto expectOutput = [&outputs](core::InterfaceType type) {
        return !outputs.empty() && outputs.front().type == type;
    };

    try {
        if (parsed.action == "categorize") {
            if (!expectOutput(core::InterfaceType::TextStream)) {
                return failedTask("categorize writes a text stream output");
            }
            return impl_->categorize(parsed, inputs);
        }
        if (parsed.action == "getSliceImage") {
            if (!expectOutput(core::InterfaceType::Image)) {
                return failedTask("getSliceImage writes an image output");
            }
            return impl_->getSliceImage(parsed, inputs);
        }
    } catch (const itk::ExceptionObject& e) {
        impl_->logger->error("Pipeline action '{}' failed: {}", parsed.action, e.GetDescription());
        return failedTask(std::string("ITK: ") + e.GetDescription());
    }

    return failedTask("Unknown action '" + parsed.action + "'");
}

std::expected<core::TagCodeValues, EngineErrorInfo>
GdcmDecodingBackend::readDicomTags(const core::BinaryFile& file,
                                   const std::vector<std::string>& tagCodes)
{
    if (!file.data || file.data->empty()) {
        return backendFailure("Empty DICOM payload '" + file.path + "'");
    }

    std::istringstream stream(std::string(file.data->begin(), file.data->end()),
                              std::ios::in | std::ios::binary);
    gdcm::Reader reader;
    reader.SetStream(stream);
    if (!reader.Read()) {
        return backendFailure("Failed to parse DICOM payload '" + file.path + "'");
    }

    const auto& gdcmFile = reader.GetFile();
    gdcm::StringFilter filter;
    filter.SetFile(gdcmFile);

    core::TagCodeValues values;
    for (const auto& code : tagCodes) {
        gdcm::Tag tag;
        if (!tag.ReadFromPipeSeparatedString(code.c_str())) {
            continue;
        }
        const gdcm::DataSet& ds = tag.GetGroup() == 0x0002
            ? static_cast<const gdcm::DataSet&>(gdcmFile.GetHeader())
            : gdcmFile.GetDataSet();
        if (!ds.FindDataElement(tag)) {
            continue;
        }
        values.emplace_back(code, trimPadding(filter.ToString(tag)));
    }

    return values;
}

std::expected<core::Image, EngineErrorInfo>
GdcmDecodingBackend::readImageDicomFileSeries(const std::vector<core::BinaryFile>& files,
                                              bool singleSortedSeries)
{
    if (files.empty()) {
        return backendFailure("No series files provided");
    }

    auto workspace = impl_->newWorkspace();
    if (auto created = workspace.create(); !created) {
        return backendFailure(created.error());
    }

    std::vector<std::string> fileNames;
    fileNames.reserve(files.size());
    for (const auto& file : files) {
        auto path = workspace.materialize(file);
        if (!path) {
            return backendFailure(path.error());
        }
        fileNames.push_back(path->string());
    }

    try {
        if (!singleSortedSeries) {
            auto namesGenerator = itk::GDCMSeriesFileNames::New();
            namesGenerator->SetUseSeriesDetails(true);
            namesGenerator->SetDirectory(workspace.path().string());
            const auto& seriesUIDs = namesGenerator->GetSeriesUIDs();
            if (seriesUIDs.empty()) {
                return backendFailure("No DICOM series found among the inputs");
            }
            fileNames = namesGenerator->GetFileNames(seriesUIDs.front());
        }

        auto gdcmIO = itk::GDCMImageIO::New();
        using ReaderType = itk::ImageSeriesReader<ImageConverter::FloatVolumeType>;
        auto reader = ReaderType::New();
        reader->SetImageIO(gdcmIO);
        reader->SetFileNames(fileNames);
        reader->Update();

        impl_->logger->debug("Reconstructed series of {} files", fileNames.size());
        return ImageConverter::toImage(reader->GetOutput());

    } catch (const itk::ExceptionObject& e) {
        impl_->logger->error("Series reconstruction failed: {}", e.GetDescription());
        return backendFailure(std::string("Failed to read series: ") + e.GetDescription());
    }
}

const fs::path& GdcmDecodingBackend::workingDirectory() const
{
    return impl_->root;
}

core::BackendLauncher makeGdcmBackendLauncher()
{
    return [](const core::BackendConfig& config)
        -> std::expected<std::unique_ptr<core::IDecodingBackend>, EngineErrorInfo> {
        if (config.pipelineName != GdcmDecodingBackend::kPipelineName) {
            return std::unexpected(EngineErrorInfo{
                EngineError::InitError,
                "Unknown pipeline '" + config.pipelineName + "'"
            });
        }

        std::error_code ec;
        fs::path root = config.scratchDirectory;
        bool ownsRoot = false;
        if (root.empty()) {
            root = fs::temp_directory_path(ec) / uniqueName("dicom_organizer");
            if (ec) {
                return std::unexpected(EngineErrorInfo{
                    EngineError::InitError,
                    "No temporary directory available: " + ec.message()
                });
            }
            ownsRoot = true;
        }

        fs::create_directories(root, ec);
        if (ec) {
            return std::unexpected(EngineErrorInfo{
                EngineError::InitError,
                "Cannot create scratch directory " + root.string() + ": " + ec.message()
            });
        }

        return std::make_unique<GdcmDecodingBackend>(root, ownsRoot);
    };
}

} // namespace dicom_organizer::services
