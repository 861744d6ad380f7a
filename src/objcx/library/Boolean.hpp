#ifndef SRC_OBJCX_LIBRARY_BOOLEAN_HPP_
#define SRC_OBJCX_LIBRARY_BOOLEAN_HPP_

#include <objc/runtime.h>

#include <optional>

namespace objcx { namespace library {

// The runtime returns BOOL, which is wide enough to hold values other than YES and NO. Returns an empty optional for
// any such third value.
std::optional<bool> decodeBool(int value);

// Converts a BOOL returned from the runtime. A value other than YES or NO means the runtime broke its own contract,
// which is fatal.
bool toBool(BOOL value);

inline BOOL fromBool(bool value) { return value ? YES : NO; }

} // namespace library
} // namespace objcx

#endif // SRC_OBJCX_LIBRARY_BOOLEAN_HPP_
