#include "objcx/library/Property.hpp"

namespace objcx { namespace library {

std::string_view Property::name() const {
    if (isNil()) {
        return std::string_view();
    }
    return std::string_view(property_getName(m_raw));
}

std::string_view Property::attributes() const {
    if (isNil()) {
        return std::string_view();
    }
    const char* attributeString = property_getAttributes(m_raw);
    return attributeString ? std::string_view(attributeString) : std::string_view();
}

} // namespace library
} // namespace objcx
