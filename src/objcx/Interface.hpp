#ifndef SRC_OBJCX_INTERFACE_HPP_
#define SRC_OBJCX_INTERFACE_HPP_

#include "objcx/EncodedString.hpp"
#include "objcx/library/Class.hpp"
#include "objcx/library/Property.hpp"

#include <objc/runtime.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace objcx {

class ErrorReporter;

struct MethodDefinition {
    std::string selectorName;
    IMP implementation = nullptr;
    EncodedString types;
};

struct PropertyDefinition {
    std::string name;
    EncodedString type;
    std::vector<library::PropertyAttribute> attributes;
};

// Describes one class to create in the runtime. Encodings are produced ahead of time, usually by a TypeEncoder or
// EncodingCache, so that registration itself never has to encode.
struct InterfaceDefinition {
    std::string className;
    // Empty to create a root class.
    std::string superclassName;
    size_t extraBytes = 0;
    std::vector<MethodDefinition> instanceMethods;
    std::vector<MethodDefinition> classMethods;
    std::vector<PropertyDefinition> properties;

    // Set by initRuntime() once the class is registered, cleared by deinitRuntime().
    library::Class registeredClass;
};

// Superclasses must appear before their subclasses.
using InterfaceList = std::vector<InterfaceDefinition>;

// Creates and registers every class in |interfaces|, in order. On any failure reports to |errorReporter|, disposes of
// every class this call created, and returns false. Registration is serialized across threads.
bool initRuntime(InterfaceList& interfaces, std::shared_ptr<ErrorReporter> errorReporter);

// Disposes of all registered classes in |interfaces|, in reverse order.
void deinitRuntime(InterfaceList& interfaces);

} // namespace objcx

#endif // SRC_OBJCX_INTERFACE_HPP_
