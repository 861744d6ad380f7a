#include "objcx/EncodingCache.hpp"

#include "spdlog/spdlog.h"

#include <utility>

namespace objcx {

EncodingCache::EncodingCache(std::shared_ptr<ErrorReporter> errorReporter):
    m_encoder(std::move(errorReporter)), m_misses(0) {}

EncodedString EncodingCache::encode(const TypeDescription& type, int32_t depth) {
    Key key{type.canonicalName(), depth};
    auto iter = m_encodings.find(key);
    if (iter != m_encodings.end()) {
        return iter->second;
    }

    ++m_misses;
    auto length = m_encoder.encodedSize(type, depth);
    if (length < 0) {
        return EncodedString();
    }
    auto encoding = m_encoder.encodeLiteral(type, depth, length);
    if (!encoding) {
        return encoding;
    }

    SPDLOG_DEBUG("Caching encoding '{}' for {} at depth {}", encoding.view(), key.shape, depth);
    m_encodings.emplace(std::make_pair(std::move(key), encoding));
    return encoding;
}

} // namespace objcx
