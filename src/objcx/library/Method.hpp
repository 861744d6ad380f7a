#ifndef SRC_OBJCX_LIBRARY_METHOD_HPP_
#define SRC_OBJCX_LIBRARY_METHOD_HPP_

#include "objcx/library/Handle.hpp"
#include "objcx/library/Selector.hpp"

#include <objc/runtime.h>

#include <string_view>

namespace objcx { namespace library {

class Method : public Handle<Method, ::Method> {
public:
    Method(): Handle<Method, ::Method>() { }
    explicit Method(::Method method): Handle<Method, ::Method>(method) { }
    ~Method() { }

    Selector name() const;
    // Empty for a nil method.
    std::string_view typeEncoding() const;
    IMP implementation() const;
};

} // namespace library
} // namespace objcx

#endif // SRC_OBJCX_LIBRARY_METHOD_HPP_
