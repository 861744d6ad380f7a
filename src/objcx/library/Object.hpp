#ifndef SRC_OBJCX_LIBRARY_OBJECT_HPP_
#define SRC_OBJCX_LIBRARY_OBJECT_HPP_

#include "objcx/Describe.hpp"
#include "objcx/library/Class.hpp"
#include "objcx/library/Handle.hpp"

#include <objc/runtime.h>

#include <cstddef>

namespace objcx {

// Pointers to runtime objects, including id, encode as '@'.
template <> struct IsObjectHandle<objc_object> : std::true_type { };
// Class and SEL encode as '?'.
template <> struct IsOpaqueHandle<objc_class> : std::true_type { };
template <> struct IsOpaqueHandle<objc_selector> : std::true_type { };

namespace library {

class Object : public Handle<Object, id> {
public:
    Object(): Handle<Object, id>() { }
    explicit Object(id object): Handle<Object, id>(object) { }
    ~Object() { }

    // Builds an instance of |cls| in caller-supplied memory. The memory must be pointer-aligned, zero-filled, and at
    // least cls.instanceSize() bytes. Returns nil if any of these fail. The caller keeps ownership of the memory and
    // must call destructInstance() before releasing it.
    static Object constructInstance(Class cls, void* bytes, size_t size);

    // Returns the memory the instance was constructed in, or nullptr for a nil object.
    void* destructInstance();
    // Releases an instance made by Class::createInstance(), and sets this handle to nil.
    void dispose();

    Class getClass() const;
    // Alias for getClass(), named after the runtime's instance variable.
    Class isa() const { return getClass(); }
};

} // namespace library
} // namespace objcx

#endif // SRC_OBJCX_LIBRARY_OBJECT_HPP_
