#pragma once

#include "rlmkit/api_export.h"
#include <cstddef>
#include <string>

namespace rlmkit::core {

// Number of UTF-8 code points in text (malformed bytes count as one each)
RLMKIT_API size_t CountCharacters(const std::string& text);

// First `limit` code points of text, followed by marker if anything was cut
RLMKIT_API std::string TruncateText(const std::string& text, size_t limit, const std::string& marker);

// True if text is empty or whitespace only
RLMKIT_API bool IsBlank(const std::string& text);

} // namespace rlmkit::core
