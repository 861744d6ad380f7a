#include "objcx/library/Class.hpp"

#include "objcx/EncodedString.hpp"
#include "objcx/library/Boolean.hpp"
#include "objcx/library/Object.hpp"

#include "spdlog/spdlog.h"

#include <cstdlib>
#include <mutex>

namespace {
std::mutex& classPairMutex() {
    static std::mutex mutex;
    return mutex;
}
} // namespace

namespace objcx { namespace library {

// static
Class Class::lookUp(const std::string& name) { return Class(objc_lookUpClass(name.c_str())); }

// static
Class Class::named(const std::string& name) {
    return Class(reinterpret_cast<::Class>(objc_getClass(name.c_str())));
}

// static
Class Class::allocateClassPair(Class superclass, const std::string& name, size_t extraBytes) {
    std::lock_guard<std::mutex> lock(classPairMutex());
    Class cls(objc_allocateClassPair(superclass.raw(), name.c_str(), extraBytes));
    if (!cls) {
        SPDLOG_WARN("Failed to allocate class pair {}, the name may already be in use.", name);
    }
    return cls;
}

// static
void Class::registerClassPair(Class cls) {
    if (!cls) {
        return;
    }
    std::lock_guard<std::mutex> lock(classPairMutex());
    objc_registerClassPair(cls.raw());
    SPDLOG_DEBUG("Registered class {}.", cls.name());
}

// static
void Class::disposeClassPair(Class cls) {
    if (!cls) {
        return;
    }
    std::lock_guard<std::mutex> lock(classPairMutex());
    SPDLOG_DEBUG("Disposing class {}.", cls.name());
    objc_disposeClassPair(cls.raw());
}

std::string_view Class::name() const {
    if (isNil()) {
        return std::string_view();
    }
    return std::string_view(class_getName(m_raw));
}

Class Class::superclass() const {
    if (isNil()) {
        return Class();
    }
    return Class(class_getSuperclass(m_raw));
}

Class Class::metaClass() const {
    if (isNil()) {
        return Class();
    }
    return Class(object_getClass(reinterpret_cast<id>(m_raw)));
}

bool Class::isMetaClass() const {
    if (isNil()) {
        return false;
    }
    return toBool(class_isMetaClass(m_raw));
}

size_t Class::instanceSize() const {
    if (isNil()) {
        return 0;
    }
    return class_getInstanceSize(m_raw);
}

Property Class::property(const std::string& name) const {
    if (isNil()) {
        return Property();
    }
    return Property(class_getProperty(m_raw, name.c_str()));
}

std::vector<Property> Class::copyPropertyList() const {
    std::vector<Property> properties;
    if (isNil()) {
        return properties;
    }
    unsigned int count = 0;
    objc_property_t* list = class_copyPropertyList(m_raw, &count);
    if (list == nullptr) {
        return properties;
    }
    properties.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
        properties.emplace_back(Property(list[i]));
    }
    std::free(list);
    return properties;
}

Method Class::instanceMethod(Selector selector) const {
    if (isNil() || !selector) {
        return Method();
    }
    return Method(class_getInstanceMethod(m_raw, selector.raw()));
}

Ivar Class::instanceVariable(const std::string& name) const {
    if (isNil()) {
        return Ivar();
    }
    return Ivar(class_getInstanceVariable(m_raw, name.c_str()));
}

bool Class::addMethod(Selector selector, IMP implementation, const EncodedString& types) {
    if (isNil() || !selector || implementation == nullptr) {
        SPDLOG_ERROR("Cannot add method {} to class {}, missing class, selector, or implementation.", selector.name(),
                     name());
        return false;
    }
    if (types.isNil()) {
        SPDLOG_ERROR("Cannot add method {} to class {} without a type encoding.", selector.name(), name());
        return false;
    }
    return toBool(class_addMethod(m_raw, selector.raw(), implementation, types.c_str()));
}

bool Class::addProperty(const std::string& name, const EncodedString& type,
                        const std::vector<PropertyAttribute>& attributes) {
    if (isNil()) {
        SPDLOG_ERROR("Cannot add property {} to nil class.", name);
        return false;
    }
    if (type.isNil()) {
        SPDLOG_ERROR("Cannot add property {} to class {} without a type encoding.", name, this->name());
        return false;
    }
    std::vector<objc_property_attribute_t> runtimeAttributes;
    runtimeAttributes.reserve(attributes.size() + 1);
    runtimeAttributes.emplace_back(objc_property_attribute_t{"T", type.c_str()});
    for (const auto& attribute : attributes) {
        runtimeAttributes.emplace_back(objc_property_attribute_t{attribute.name.c_str(), attribute.value.c_str()});
    }
    return toBool(class_addProperty(m_raw, name.c_str(), runtimeAttributes.data(),
                                    static_cast<unsigned int>(runtimeAttributes.size())));
}

Object Class::createInstance(size_t extraBytes) const {
    if (isNil()) {
        return Object();
    }
    return Object(class_createInstance(m_raw, extraBytes));
}

} // namespace library
} // namespace objcx
