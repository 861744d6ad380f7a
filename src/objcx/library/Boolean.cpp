#include "objcx/library/Boolean.hpp"

#include "spdlog/spdlog.h"

#include <cstdlib>

namespace objcx { namespace library {

std::optional<bool> decodeBool(int value) {
    if (value == static_cast<int>(YES)) {
        return true;
    }
    if (value == static_cast<int>(NO)) {
        return false;
    }
    return std::nullopt;
}

bool toBool(BOOL value) {
    auto decoded = decodeBool(static_cast<int>(value));
    if (!decoded) {
        SPDLOG_CRITICAL("Objective-C runtime returned BOOL value {}, which is neither YES nor NO.",
                        static_cast<int>(value));
        std::abort();
    }
    return *decoded;
}

} // namespace library
} // namespace objcx
