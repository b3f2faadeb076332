/**
 * @file tag_reader.hpp
 * @brief Reads named DICOM tags out of one file through the backend
 * @details Tags are requested by their "gggg|eeee" code and returned keyed by
 *          the caller-facing name. Tags the file does not carry are omitted
 *          from the result; only transport or backend failure is an error.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "backend_gateway.hpp"
#include "engine_types.hpp"

#include <expected>
#include <memory>
#include <vector>

namespace dicom_organizer::core {

/// Instance Number, the primary slice ordering key
inline const TagSpec kInstanceNumberTag{"InstanceNumber", "0020|0013"};

/**
 * @brief Tag reader backed by the gateway's dedicated tag-reading call
 */
class TagReader {
public:
    explicit TagReader(BackendGateway& gateway);
    ~TagReader();

    TagReader(const TagReader&) = delete;
    TagReader& operator=(const TagReader&) = delete;

    /**
     * @brief Read a list of tags from a file
     * @param file File to read; sent to the backend under its sanitized name
     * @param tags Requested tags
     * @return Tag name => value for the tags present, TagReadError on failure
     */
    std::expected<TagValues, EngineErrorInfo>
    readTags(const DicomFile& file, const std::vector<TagSpec>& tags);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_organizer::core
