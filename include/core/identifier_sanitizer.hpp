#pragma once

#include "engine_types.hpp"

#include <string>
#include <string_view>

namespace dicom_organizer::core {

/// Substitute for path separators in backend-facing identifiers
inline constexpr char kSanitizedSeparator = '_';

/**
 * @brief Make a file name safe to use as a backend transit path
 *
 * Every '/' and '\\' is replaced with '_'. Total and deterministic.
 * "a/b/c.dcm" becomes "a_b_c.dcm".
 */
std::string sanitizeFileName(std::string_view name);

/**
 * @brief Copy of a file carrying the sanitized name
 *
 * The copy shares the original's content buffer; the original is untouched.
 */
DicomFile sanitizeFile(const DicomFile& file);

} // namespace dicom_organizer::core
