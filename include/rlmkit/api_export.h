#pragma once

// This header includes the CMake-generated export header
// and provides the RLMKIT_API macro used on public classes

#include "rlmkit/rlmkit_export.h"

#ifndef RLMKIT_API
    #define RLMKIT_API RLMKIT_EXPORT
#endif
