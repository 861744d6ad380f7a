#include "objcx/Interface.hpp"

#include "objcx/ErrorReporter.hpp"
#include "objcx/library/Selector.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <mutex>

namespace {

std::mutex& registrationMutex() {
    static std::mutex mutex;
    return mutex;
}

void disposeRegistered(objcx::InterfaceList& interfaces) {
    for (auto it = interfaces.rbegin(); it != interfaces.rend(); ++it) {
        if (it->registeredClass) {
            objcx::library::Class::disposeClassPair(it->registeredClass);
            it->registeredClass = objcx::library::Class();
        }
    }
}

bool addMethods(objcx::library::Class cls, const std::vector<objcx::MethodDefinition>& methods,
                objcx::ErrorReporter* errorReporter) {
    for (const auto& method : methods) {
        auto selector = objcx::library::Selector::registerName(method.selectorName);
        if (!cls.addMethod(selector, method.implementation, method.types)) {
            errorReporter->addError(objcx::kRuntimeFailure,
                                    fmt::format("Failed to add method {} with types '{}' to class {}.",
                                                method.selectorName, method.types.view(), cls.name()));
            return false;
        }
    }
    return true;
}

} // namespace

namespace objcx {

bool initRuntime(InterfaceList& interfaces, std::shared_ptr<ErrorReporter> errorReporter) {
    std::lock_guard<std::mutex> lock(registrationMutex());

    for (const auto& interface : interfaces) {
        if (interface.registeredClass) {
            errorReporter->addError(kRuntimeFailure,
                                    fmt::format("Interface {} is already registered.", interface.className));
            return false;
        }
    }

    for (auto& interface : interfaces) {
        library::Class superclass;
        if (!interface.superclassName.empty()) {
            superclass = library::Class::lookUp(interface.superclassName);
            if (!superclass) {
                errorReporter->addError(kRuntimeFailure,
                                        fmt::format("Superclass {} of {} not found.", interface.superclassName,
                                                    interface.className));
                disposeRegistered(interfaces);
                return false;
            }
        }

        auto cls = library::Class::allocateClassPair(superclass, interface.className, interface.extraBytes);
        if (!cls) {
            errorReporter->addError(kRuntimeFailure,
                                    fmt::format("Failed to allocate class {}.", interface.className));
            disposeRegistered(interfaces);
            return false;
        }

        bool ok = addMethods(cls, interface.instanceMethods, errorReporter.get())
            && addMethods(cls.metaClass(), interface.classMethods, errorReporter.get());
        for (const auto& property : interface.properties) {
            if (!ok) {
                break;
            }
            if (!cls.addProperty(property.name, property.type, property.attributes)) {
                errorReporter->addError(kRuntimeFailure,
                                        fmt::format("Failed to add property {} to class {}.", property.name,
                                                    interface.className));
                ok = false;
            }
        }
        if (!ok) {
            // Never registered, so still safe to dispose.
            library::Class::disposeClassPair(cls);
            disposeRegistered(interfaces);
            return false;
        }

        library::Class::registerClassPair(cls);
        interface.registeredClass = cls;
    }

    SPDLOG_INFO("Registered {} Objective-C classes.", interfaces.size());
    return true;
}

void deinitRuntime(InterfaceList& interfaces) {
    std::lock_guard<std::mutex> lock(registrationMutex());
    disposeRegistered(interfaces);
}

} // namespace objcx
