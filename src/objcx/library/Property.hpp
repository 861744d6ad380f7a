#ifndef SRC_OBJCX_LIBRARY_PROPERTY_HPP_
#define SRC_OBJCX_LIBRARY_PROPERTY_HPP_

#include "objcx/library/Handle.hpp"

#include <objc/runtime.h>

#include <string>
#include <string_view>

namespace objcx { namespace library {

// One attribute in a declared property's attribute list, such as {"N", ""} for nonatomic or {"V", "_ivar"} for the
// backing instance variable. The type attribute "T" is always supplied from the property's EncodedString.
struct PropertyAttribute {
    std::string name;
    std::string value;
};

class Property : public Handle<Property, objc_property_t> {
public:
    Property(): Handle<Property, objc_property_t>() { }
    explicit Property(objc_property_t property): Handle<Property, objc_property_t>(property) { }
    ~Property() { }

    std::string_view name() const;
    // The runtime's attribute string, for example "Ti,N,V_count".
    std::string_view attributes() const;
};

} // namespace library
} // namespace objcx

#endif // SRC_OBJCX_LIBRARY_PROPERTY_HPP_
