#ifndef SRC_OBJCX_ENCODING_CACHE_HPP_
#define SRC_OBJCX_ENCODING_CACHE_HPP_

#include "objcx/EncodedString.hpp"
#include "objcx/Hash.hpp"
#include "objcx/TypeDescription.hpp"
#include "objcx/TypeEncoder.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace objcx {

class ErrorReporter;

// Encoding is pure, so the result for any (shape, depth) pair can be computed once and reused. Keys are the canonical
// name of the type, so structurally identical descriptions built separately share a cache entry. Not thread-safe.
class EncodingCache {
public:
    EncodingCache() = delete;
    explicit EncodingCache(std::shared_ptr<ErrorReporter> errorReporter);
    ~EncodingCache() = default;

    // Returns the cached encoding of |type| at |depth|, encoding it on first request. Failed encodings are not cached.
    EncodedString encode(const TypeDescription& type, int32_t depth = 0);

    size_t size() const { return m_encodings.size(); }
    size_t misses() const { return m_misses; }
    void clear() { m_encodings.clear(); }

    TypeEncoder& encoder() { return m_encoder; }

private:
    struct Key {
        std::string shape;
        int32_t depth;

        bool operator==(const Key& k) const { return depth == k.depth && shape == k.shape; }
    };
    struct KeyHash {
        size_t operator()(const Key& k) const { return static_cast<size_t>(hash(k.shape, static_cast<Hash>(k.depth))); }
    };

    TypeEncoder m_encoder;
    std::unordered_map<Key, EncodedString, KeyHash> m_encodings;
    size_t m_misses;
};

} // namespace objcx

#endif // SRC_OBJCX_ENCODING_CACHE_HPP_
