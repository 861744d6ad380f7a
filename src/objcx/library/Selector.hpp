#ifndef SRC_OBJCX_LIBRARY_SELECTOR_HPP_
#define SRC_OBJCX_LIBRARY_SELECTOR_HPP_

#include "objcx/library/Handle.hpp"

#include <objc/runtime.h>

#include <string>
#include <string_view>

namespace objcx { namespace library {

class Selector : public Handle<Selector, SEL> {
public:
    Selector(): Handle<Selector, SEL>() { }
    explicit Selector(SEL selector): Handle<Selector, SEL>(selector) { }
    ~Selector() { }

    // Registers the selector with the runtime if needed, and returns it.
    static Selector registerName(const std::string& name);

    // Empty for a nil selector.
    std::string_view name() const;
};

} // namespace library
} // namespace objcx

namespace std {
template <> struct hash<objcx::library::Selector> {
    size_t operator()(const objcx::library::Selector& s) const { return std::hash<const void*>()(s.raw()); }
};
} // namespace std

#endif // SRC_OBJCX_LIBRARY_SELECTOR_HPP_
