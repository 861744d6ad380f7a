#ifndef SRC_OBJCX_LIBRARY_IVAR_HPP_
#define SRC_OBJCX_LIBRARY_IVAR_HPP_

#include "objcx/library/Handle.hpp"

#include <objc/runtime.h>

#include <cstddef>
#include <string_view>

namespace objcx { namespace library {

class Ivar : public Handle<Ivar, ::Ivar> {
public:
    Ivar(): Handle<Ivar, ::Ivar>() { }
    explicit Ivar(::Ivar ivar): Handle<Ivar, ::Ivar>(ivar) { }
    ~Ivar() { }

    std::string_view name() const;
    std::string_view typeEncoding() const;
    ptrdiff_t offset() const;
};

} // namespace library
} // namespace objcx

#endif // SRC_OBJCX_LIBRARY_IVAR_HPP_
