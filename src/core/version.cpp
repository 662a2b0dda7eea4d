#include "rlmkit/rlmkit.h"

namespace rlmkit {

std::string GetVersionString() {
    return std::to_string(RLMKIT_VERSION_MAJOR) + "." +
           std::to_string(RLMKIT_VERSION_MINOR) + "." +
           std::to_string(RLMKIT_VERSION_PATCH);
}

} // namespace rlmkit
