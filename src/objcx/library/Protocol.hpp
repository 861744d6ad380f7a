#ifndef SRC_OBJCX_LIBRARY_PROTOCOL_HPP_
#define SRC_OBJCX_LIBRARY_PROTOCOL_HPP_

#include "objcx/library/Handle.hpp"

#include <objc/runtime.h>

#include <string>
#include <string_view>

namespace objcx { namespace library {

class Protocol : public Handle<Protocol, ::Protocol*> {
public:
    Protocol(): Handle<Protocol, ::Protocol*>() { }
    explicit Protocol(::Protocol* protocol): Handle<Protocol, ::Protocol*>(protocol) { }
    ~Protocol() { }

    // Returns nil if no protocol of that name is known to the runtime.
    static Protocol lookUp(const std::string& name);

    std::string_view name() const;
};

} // namespace library
} // namespace objcx

#endif // SRC_OBJCX_LIBRARY_PROTOCOL_HPP_
