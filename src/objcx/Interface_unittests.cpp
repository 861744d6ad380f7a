#include "objcx/Interface.hpp"

#include "objcx/Describe.hpp"
#include "objcx/ErrorReporter.hpp"
#include "objcx/TypeEncoder.hpp"
#include "objcx/library/Object.hpp"
#include "objcx/library/Selector.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <utility>

namespace {
id returnSelf(id self, SEL) { return self; }
int32_t returnCount(id, SEL) { return 42; }

objcx::MethodDefinition makeMethod(const std::string& selectorName, IMP implementation, objcx::EncodedString types) {
    objcx::MethodDefinition method;
    method.selectorName = selectorName;
    method.implementation = implementation;
    method.types = std::move(types);
    return method;
}
} // namespace

namespace objcx {

TEST_CASE("initRuntime") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);
    auto selfTypes = encoder.encodeSignature(describe<id>(), {describe<id>(), describe<SEL>()});
    auto countTypes = encoder.encodeSignature(describe<int32_t>(), {describe<id>(), describe<SEL>()});
    REQUIRE_EQ(selfTypes, "@@?");
    REQUIRE_EQ(countTypes, "i@?");

    SUBCASE("registers classes in order") {
        InterfaceList interfaces(2);
        interfaces[0].className = "ObjcxInterfaceBase";
        interfaces[0].instanceMethods.emplace_back(
            makeMethod("objcxSelf", reinterpret_cast<IMP>(&returnSelf), selfTypes));
        PropertyDefinition property;
        property.name = "count";
        property.type = encoder.encode(describe<int32_t>());
        property.attributes.emplace_back(library::PropertyAttribute{"R", ""});
        interfaces[0].properties.emplace_back(property);

        interfaces[1].className = "ObjcxInterfaceDerived";
        interfaces[1].superclassName = "ObjcxInterfaceBase";
        interfaces[1].classMethods.emplace_back(
            makeMethod("objcxCount", reinterpret_cast<IMP>(&returnCount), countTypes));

        REQUIRE(initRuntime(interfaces, errorReporter));
        CHECK(!errorReporter->hasErrors());

        auto base = interfaces[0].registeredClass;
        auto derived = interfaces[1].registeredClass;
        REQUIRE(base);
        REQUIRE(derived);
        CHECK_EQ(library::Class::lookUp("ObjcxInterfaceBase"), base);
        CHECK_EQ(library::Class::lookUp("ObjcxInterfaceDerived"), derived);
        CHECK_EQ(derived.superclass(), base);

        auto selfMethod = base.instanceMethod(library::Selector::registerName("objcxSelf"));
        REQUIRE(selfMethod);
        CHECK_EQ(std::string(selfMethod.typeEncoding()), "@@?");
        // Inherited.
        CHECK_EQ(derived.instanceMethod(library::Selector::registerName("objcxSelf")), selfMethod);

        auto countMethod = derived.metaClass().instanceMethod(library::Selector::registerName("objcxCount"));
        REQUIRE(countMethod);
        CHECK_EQ(std::string(countMethod.typeEncoding()), "i@?");
        CHECK(derived.instanceMethod(library::Selector::registerName("objcxCount")).isNil());

        REQUIRE(base.property("count"));
        CHECK_EQ(std::string(base.property("count").attributes().substr(0, 2)), "Ti");

        // A second registration of the same list is refused without touching the runtime.
        CHECK(!initRuntime(interfaces, errorReporter));
        CHECK_EQ(errorReporter->countOf(kRuntimeFailure), 1);
        CHECK_EQ(interfaces[0].registeredClass, base);

        deinitRuntime(interfaces);
        CHECK(interfaces[0].registeredClass.isNil());
        CHECK(interfaces[1].registeredClass.isNil());
    }

    SUBCASE("missing superclass rolls back") {
        InterfaceList interfaces(2);
        interfaces[0].className = "ObjcxInterfaceRollbackFirst";
        interfaces[1].className = "ObjcxInterfaceRollbackSecond";
        interfaces[1].superclassName = "ObjcxInterfaceNoSuchSuperclass";

        CHECK(!initRuntime(interfaces, errorReporter));
        CHECK_EQ(errorReporter->countOf(kRuntimeFailure), 1);
        CHECK(interfaces[0].registeredClass.isNil());
        CHECK(interfaces[1].registeredClass.isNil());
    }

    SUBCASE("nil method encoding rolls back") {
        InterfaceList interfaces(2);
        interfaces[0].className = "ObjcxInterfaceNilTypesFirst";
        interfaces[1].className = "ObjcxInterfaceNilTypesSecond";
        interfaces[1].instanceMethods.emplace_back(
            makeMethod("objcxSelf", reinterpret_cast<IMP>(&returnSelf), EncodedString()));

        CHECK(!initRuntime(interfaces, errorReporter));
        CHECK_EQ(errorReporter->countOf(kRuntimeFailure), 1);
        CHECK(interfaces[0].registeredClass.isNil());
        CHECK(interfaces[1].registeredClass.isNil());
    }

    SUBCASE("empty list") {
        InterfaceList interfaces;
        CHECK(initRuntime(interfaces, errorReporter));
        deinitRuntime(interfaces);
        CHECK(!errorReporter->hasErrors());
    }
}

} // namespace objcx
