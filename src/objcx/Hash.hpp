#ifndef SRC_OBJCX_HASH_HPP_
#define SRC_OBJCX_HASH_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace objcx {

using Hash = std::uint32_t;

Hash hash(std::string_view key, Hash seed = 0);
Hash hash(const char* key, size_t length, Hash seed = 0);

} // namespace objcx

#endif // SRC_OBJCX_HASH_HPP_
