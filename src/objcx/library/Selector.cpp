#include "objcx/library/Selector.hpp"

namespace objcx { namespace library {

// static
Selector Selector::registerName(const std::string& name) { return Selector(sel_registerName(name.c_str())); }

std::string_view Selector::name() const {
    if (isNil()) {
        return std::string_view();
    }
    return std::string_view(sel_getName(m_raw));
}

} // namespace library
} // namespace objcx
