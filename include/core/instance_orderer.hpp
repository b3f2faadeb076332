/**
 * @file instance_orderer.hpp
 * @brief Reorders one volume's files by Instance Number (0020|0013)
 * @details Every file's Instance Number is read through the TagReader one
 *          file at a time in scan order. A missing or non-numeric value
 *          orders as 0. Files are then keyed by that number; when two files
 *          share a number the later one in scan order replaces the earlier
 *          one, so the result may be shorter than the input. Distinct keys
 *          are emitted in ascending numeric order.
 *
 * @note Dropping a file on a duplicate Instance Number is the established
 *       contract. Multi-frame or corrected acquisitions can legitimately
 *       repeat numbers; every collision is logged as a warning.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "engine_types.hpp"
#include "tag_reader.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace dicom_organizer::core {

/// Ordering key paired with the file it was read from, in scan order
using KeyedFile = std::pair<int64_t, DicomFile>;

/**
 * @brief Per-volume slice orderer
 */
class InstanceOrderer {
public:
    explicit InstanceOrderer(TagReader& tagReader);
    ~InstanceOrderer();

    InstanceOrderer(const InstanceOrderer&) = delete;
    InstanceOrderer& operator=(const InstanceOrderer&) = delete;

    /**
     * @brief Order a volume's files by Instance Number
     * @param files One volume group in scan order
     * @return Files in ascending key order (collapsed on duplicate keys),
     *         OrderError if a tag lookup fails at the transport level
     */
    std::expected<std::vector<DicomFile>, EngineErrorInfo>
    orderByInstance(const std::vector<DicomFile>& files);

    /**
     * @brief Parse an Instance Number value
     *
     * Leading whitespace and one '+' are skipped and the leading digits are
     * read; trailing text is ignored. Empty or non-numeric input yields 0, and
     * so does a second sign ("+-3"). Digit runs beyond the int64_t range
     * clamp to its minimum or maximum, keeping their place at either end.
     */
    static int64_t parseOrderingKey(std::string_view value) noexcept;

    /**
     * @brief Emit files in ascending key order, later scan entries winning
     * @param keyedFiles (key, file) pairs in scan order
     */
    static std::vector<DicomFile> orderByKeys(const std::vector<KeyedFile>& keyedFiles);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_organizer::core
