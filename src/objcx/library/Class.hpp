#ifndef SRC_OBJCX_LIBRARY_CLASS_HPP_
#define SRC_OBJCX_LIBRARY_CLASS_HPP_

#include "objcx/library/Handle.hpp"
#include "objcx/library/Ivar.hpp"
#include "objcx/library/Method.hpp"
#include "objcx/library/Property.hpp"
#include "objcx/library/Selector.hpp"

#include <objc/runtime.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace objcx {

class EncodedString;

namespace library {

class Object;

// Wraps a runtime class pointer. Every accessor tolerates a nil handle and returns the nil answer (empty name, nil
// superclass, false, zero, no properties) without calling into the runtime.
//
// The class pair calls (allocate, register, dispose) are serialized with each other. Classes must be fully built,
// with all methods and properties added, before registerClassPair() is called.
class Class : public Handle<Class, ::Class> {
public:
    Class(): Handle<Class, ::Class>() { }
    explicit Class(::Class cls): Handle<Class, ::Class>(cls) { }
    ~Class() { }

    // Returns nil if the class is not registered.
    static Class lookUp(const std::string& name);
    // Like lookUp() but may invoke the runtime's class handler to load a missing class.
    static Class named(const std::string& name);

    // Returns nil if a class with this name already exists. A nil superclass creates a new root class.
    static Class allocateClassPair(Class superclass, const std::string& name, size_t extraBytes = 0);
    static void registerClassPair(Class cls);
    // The class, its subclasses, and all instances of either must not be in use.
    static void disposeClassPair(Class cls);

    std::string_view name() const;
    Class superclass() const;
    Class metaClass() const;
    bool isMetaClass() const;
    size_t instanceSize() const;

    Property property(const std::string& name) const;
    std::vector<Property> copyPropertyList() const;
    Method instanceMethod(Selector selector) const;
    Ivar instanceVariable(const std::string& name) const;

    // Both of these refuse a nil type encoding, and return false without modifying the class.
    bool addMethod(Selector selector, IMP implementation, const EncodedString& types);
    bool addProperty(const std::string& name, const EncodedString& type,
                     const std::vector<PropertyAttribute>& attributes);

    // Caller owns the returned object and must dispose() it.
    Object createInstance(size_t extraBytes = 0) const;
};

} // namespace library
} // namespace objcx

#endif // SRC_OBJCX_LIBRARY_CLASS_HPP_
