#include "objcx/library/Method.hpp"

namespace objcx { namespace library {

Selector Method::name() const {
    if (isNil()) {
        return Selector();
    }
    return Selector(method_getName(m_raw));
}

std::string_view Method::typeEncoding() const {
    if (isNil()) {
        return std::string_view();
    }
    const char* types = method_getTypeEncoding(m_raw);
    return types ? std::string_view(types) : std::string_view();
}

IMP Method::implementation() const {
    if (isNil()) {
        return nullptr;
    }
    return method_getImplementation(m_raw);
}

} // namespace library
} // namespace objcx
