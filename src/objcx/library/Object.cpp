#include "objcx/library/Object.hpp"

#include "spdlog/spdlog.h"

#include <cstdint>

namespace objcx { namespace library {

// static
Object Object::constructInstance(Class cls, void* bytes, size_t size) {
    if (!cls || bytes == nullptr) {
        SPDLOG_ERROR("constructInstance requires a class and memory.");
        return Object();
    }
    if (size < cls.instanceSize()) {
        SPDLOG_ERROR("constructInstance of {} needs {} bytes, got {}.", cls.name(), cls.instanceSize(), size);
        return Object();
    }
    if (reinterpret_cast<uintptr_t>(bytes) % alignof(void*) != 0) {
        SPDLOG_ERROR("constructInstance of {} given unaligned memory.", cls.name());
        return Object();
    }
    const auto* byte = static_cast<const uint8_t*>(bytes);
    for (size_t i = 0; i < size; ++i) {
        if (byte[i] != 0) {
            SPDLOG_ERROR("constructInstance of {} given memory that is not zero-filled.", cls.name());
            return Object();
        }
    }
    return Object(objc_constructInstance(cls.raw(), bytes));
}

void* Object::destructInstance() {
    if (isNil()) {
        return nullptr;
    }
    return objc_destructInstance(m_raw);
}

void Object::dispose() {
    if (isNil()) {
        return;
    }
    object_dispose(m_raw);
    m_raw = nullptr;
}

Class Object::getClass() const {
    if (isNil()) {
        return Class();
    }
    return Class(object_getClass(m_raw));
}

} // namespace library
} // namespace objcx
