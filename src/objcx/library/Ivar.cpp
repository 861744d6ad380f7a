#include "objcx/library/Ivar.hpp"

namespace objcx { namespace library {

std::string_view Ivar::name() const {
    if (isNil()) {
        return std::string_view();
    }
    const char* ivarName = ivar_getName(m_raw);
    return ivarName ? std::string_view(ivarName) : std::string_view();
}

std::string_view Ivar::typeEncoding() const {
    if (isNil()) {
        return std::string_view();
    }
    const char* types = ivar_getTypeEncoding(m_raw);
    return types ? std::string_view(types) : std::string_view();
}

ptrdiff_t Ivar::offset() const {
    if (isNil()) {
        return 0;
    }
    return ivar_getOffset(m_raw);
}

} // namespace library
} // namespace objcx
