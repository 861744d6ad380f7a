#include "objcx/library/Protocol.hpp"

namespace objcx { namespace library {

// static
Protocol Protocol::lookUp(const std::string& name) { return Protocol(objc_getProtocol(name.c_str())); }

std::string_view Protocol::name() const {
    if (isNil()) {
        return std::string_view();
    }
    const char* protocolName = protocol_getName(m_raw);
    return protocolName ? std::string_view(protocolName) : std::string_view();
}

} // namespace library
} // namespace objcx
