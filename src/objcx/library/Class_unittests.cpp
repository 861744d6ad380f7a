#include "objcx/library/Class.hpp"

#include "objcx/Describe.hpp"
#include "objcx/EncodedString.hpp"
#include "objcx/ErrorReporter.hpp"
#include "objcx/TypeEncoder.hpp"
#include "objcx/library/Ivar.hpp"
#include "objcx/library/Object.hpp"
#include "objcx/library/Protocol.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <memory>
#include <string>

namespace {
id returnSelf(id self, SEL) { return self; }
} // namespace

namespace objcx { namespace library {

TEST_CASE("Nil Class") {
    Class nilClass;
    CHECK(nilClass.isNil());
    CHECK(!nilClass);
    CHECK(nilClass.name().empty());
    CHECK(nilClass.superclass().isNil());
    CHECK(nilClass.metaClass().isNil());
    CHECK(!nilClass.isMetaClass());
    CHECK(nilClass.instanceSize() == 0);
    CHECK(nilClass.property("count").isNil());
    CHECK(nilClass.copyPropertyList().empty());
    CHECK(nilClass.instanceMethod(Selector::registerName("description")).isNil());
    CHECK(nilClass.instanceVariable("isa").isNil());
    CHECK(nilClass.createInstance().isNil());

    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);
    auto types = encoder.encodeSignature(describe<id>(), {describe<id>(), describe<SEL>()});
    CHECK(!nilClass.addMethod(Selector::registerName("self"), reinterpret_cast<IMP>(&returnSelf), types));
    CHECK(!nilClass.addProperty("count", encoder.encode(describe<int>()), {}));
}

TEST_CASE("Nil handles") {
    CHECK(Selector().name().empty());
    CHECK(Method().name().isNil());
    CHECK(Method().typeEncoding().empty());
    CHECK(Method().implementation() == nullptr);
    CHECK(Property().name().empty());
    CHECK(Property().attributes().empty());
    CHECK(Ivar().name().empty());
    CHECK(Ivar().typeEncoding().empty());
    CHECK_EQ(Ivar().offset(), 0);
    CHECK(Protocol().name().empty());
    CHECK(Object().getClass().isNil());
    CHECK(Object().destructInstance() == nullptr);
}

TEST_CASE("Class lookUp") {
    CHECK(Class::lookUp("ObjcxNoSuchClass").isNil());
    CHECK(Protocol::lookUp("ObjcxNoSuchProtocol").isNil());
}

TEST_CASE("Selector") {
    auto selector = Selector::registerName("objcxTestSelector:");
    REQUIRE(selector);
    CHECK_EQ(std::string(selector.name()), "objcxTestSelector:");
    CHECK_EQ(Selector::registerName("objcxTestSelector:"), selector);
    CHECK_NE(Selector::registerName("objcxOtherSelector"), selector);
}

TEST_CASE("Class pair lifecycle") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    auto cls = Class::allocateClassPair(Class(), "ObjcxClassPairTest", 0);
    REQUIRE(cls);
    CHECK_EQ(std::string(cls.name()), "ObjcxClassPairTest");
    CHECK(cls.superclass().isNil());
    CHECK(!cls.isMetaClass());
    REQUIRE(cls.metaClass());
    CHECK(cls.metaClass().isMetaClass());
    CHECK_EQ(std::string(cls.metaClass().name()), "ObjcxClassPairTest");

    {
        // methods
        auto selector = Selector::registerName("objcxSelf");
        auto types = encoder.encodeSignature(describe<id>(), {describe<id>(), describe<SEL>()});
        REQUIRE_EQ(types, "@@?");
        CHECK(!cls.addMethod(selector, reinterpret_cast<IMP>(&returnSelf), EncodedString()));
        CHECK(cls.instanceMethod(selector).isNil());
        CHECK(cls.addMethod(selector, reinterpret_cast<IMP>(&returnSelf), types));

        auto method = cls.instanceMethod(selector);
        REQUIRE(method);
        CHECK_EQ(method.name(), selector);
        CHECK_EQ(std::string(method.typeEncoding()), "@@?");
        CHECK(method.implementation() == reinterpret_cast<IMP>(&returnSelf));
    }

    {
        // properties
        CHECK(!cls.addProperty("count", EncodedString(), {}));
        auto type = encoder.encode(describe<int32_t>());
        REQUIRE_EQ(type, "i");
        CHECK(cls.addProperty("count", type, {{"N", ""}}));

        auto property = cls.property("count");
        REQUIRE(property);
        CHECK_EQ(std::string(property.name()), "count");
        CHECK_EQ(std::string(property.attributes().substr(0, 2)), "Ti");
        auto properties = cls.copyPropertyList();
        REQUIRE(properties.size() == 1);
        CHECK_EQ(properties[0], property);
        CHECK(cls.property("missing").isNil());
    }

    CHECK(cls.instanceVariable("missing").isNil());

    Class::registerClassPair(cls);
    CHECK_EQ(Class::lookUp("ObjcxClassPairTest"), cls);
    // Name is taken until the pair is disposed.
    CHECK(Class::allocateClassPair(Class(), "ObjcxClassPairTest", 0).isNil());
    CHECK_EQ(Class::named("ObjcxClassPairTest"), cls);

    {
        // createInstance
        auto object = cls.createInstance();
        REQUIRE(object);
        CHECK_EQ(object.getClass(), cls);
        CHECK_EQ(object.isa(), cls);
        object.dispose();
        CHECK(object.isNil());
    }

    {
        // constructInstance
        alignas(void*) uint8_t storage[256] = {};
        REQUIRE(cls.instanceSize() <= sizeof(storage));

        auto object = Object::constructInstance(cls, storage, sizeof(storage));
        REQUIRE(object);
        CHECK_EQ(object.getClass(), cls);
        CHECK_EQ(object.destructInstance(), static_cast<void*>(storage));
    }

    {
        // constructInstance rejects bad storage
        alignas(void*) uint8_t storage[256] = {};
        CHECK(Object::constructInstance(Class(), storage, sizeof(storage)).isNil());
        CHECK(Object::constructInstance(cls, nullptr, sizeof(storage)).isNil());
        if (cls.instanceSize() > 0) {
            CHECK(Object::constructInstance(cls, storage, cls.instanceSize() - 1).isNil());
        }
        CHECK(Object::constructInstance(cls, storage + 1, sizeof(storage) - 1).isNil());
        storage[sizeof(storage) - 1] = 0xff;
        CHECK(Object::constructInstance(cls, storage, sizeof(storage)).isNil());
    }

    Class::disposeClassPair(cls);
    CHECK(errorReporter->errorCount() == 0);
}

TEST_CASE("Subclass pair") {
    auto base = Class::allocateClassPair(Class(), "ObjcxSubclassTestBase", 0);
    REQUIRE(base);
    Class::registerClassPair(base);

    auto derived = Class::allocateClassPair(Class::lookUp("ObjcxSubclassTestBase"), "ObjcxSubclassTestDerived", 0);
    REQUIRE(derived);
    Class::registerClassPair(derived);

    CHECK_EQ(derived.superclass(), base);
    CHECK(derived.superclass().superclass().isNil());
    CHECK(derived.instanceSize() >= base.instanceSize());

    Class::disposeClassPair(derived);
    Class::disposeClassPair(base);
}

} // namespace library
} // namespace objcx
