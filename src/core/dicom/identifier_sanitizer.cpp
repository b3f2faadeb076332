#include "core/identifier_sanitizer.hpp"

#include <algorithm>

namespace dicom_organizer::core {

std::string sanitizeFileName(std::string_view name)
{
    std::string sanitized(name);
    std::replace_if(sanitized.begin(), sanitized.end(),
                    [](char c) { return c == '/' || c == '\\'; },
                    kSanitizedSeparator);
    return sanitized;
}

DicomFile sanitizeFile(const DicomFile& file)
{
    return DicomFile{sanitizeFileName(file.name), file.content};
}

} // namespace dicom_organizer::core
