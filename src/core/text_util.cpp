#include "rlmkit/core/text_util.h"
#include <cctype>

namespace rlmkit::core {

namespace {

// Continuation bytes look like 10xxxxxx
bool IsContinuationByte(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

} // anonymous namespace

size_t CountCharacters(const std::string& text) {
    size_t count = 0;
    for (unsigned char byte : text) {
        if (!IsContinuationByte(byte)) {
            ++count;
        }
    }
    return count;
}

std::string TruncateText(const std::string& text, size_t limit, const std::string& marker) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (IsContinuationByte(static_cast<unsigned char>(text[i]))) {
            continue;
        }
        if (seen == limit) {
            return text.substr(0, i) + marker;
        }
        ++seen;
    }
    return text;
}

bool IsBlank(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) {
            return false;
        }
    }
    return true;
}

} // namespace rlmkit::core
