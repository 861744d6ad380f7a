#include "objcx/Describe.hpp"

#include "objcx/ErrorReporter.hpp"
#include "objcx/TypeEncoder.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <memory>

namespace {

// Stands in for objc_object, the runtime's own specialization lives with the runtime bindings.
struct TestObject {
    void* isa;
};

struct TestSelector;

// Complete, but only ever handled through pointers.
struct TestClass {
    void* isa;
};

struct Point {
    unsigned int a;
};

struct Example {
    TestObject* anObject;
    char* aString;
    int32_t anInt;
};

struct Node {
    Node* next;
    int value;
};

enum class Color : uint8_t { kRed, kGreen };

struct Mixed {
    const char* name;
    Color color;
    double weight;
    bool enabled;
    Point origin;
    void* context;
    TestSelector* selector;
};

} // namespace

namespace objcx {

template <> struct IsObjectHandle<TestObject> : std::true_type { };
template <> struct IsOpaqueHandle<TestClass> : std::true_type { };

template <> struct StructLayout<Point> {
    static TypeDescription describe() { return TypeDescription::makeStruct("Point", {field("a", &Point::a)}); }
};

template <> struct StructLayout<Example> {
    static TypeDescription describe() {
        return TypeDescription::makeStruct("Example", {field("anObject", &Example::anObject),
                                                       field("aString", &Example::aString),
                                                       field("anInt", &Example::anInt)});
    }
};

template <> struct StructLayout<Node> {
    static TypeDescription describe() {
        return TypeDescription::makeStruct("Node", {field("next", &Node::next), field("value", &Node::value)});
    }
};

template <> struct StructLayout<Mixed> {
    static TypeDescription describe() {
        return TypeDescription::makeStruct(
            "Mixed", {field("name", &Mixed::name), field("color", &Mixed::color), field("weight", &Mixed::weight),
                      field("enabled", &Mixed::enabled), field("origin", &Mixed::origin),
                      field("context", &Mixed::context), field("selector", &Mixed::selector)});
    }
};

TEST_CASE("describe primitive types") {
    SUBCASE("integers carry measured width and signedness") {
        CHECK_EQ(describe<int8_t>().kind(), TypeKind::kSignedInteger);
        CHECK_EQ(describe<int8_t>().bits(), 8);
        CHECK_EQ(describe<uint16_t>().kind(), TypeKind::kUnsignedInteger);
        CHECK_EQ(describe<uint16_t>().bits(), 16);
        CHECK_EQ(describe<long>().bits(), static_cast<int32_t>(sizeof(long) * CHAR_BIT));
        CHECK_EQ(describe<const unsigned long long>().kind(), TypeKind::kUnsignedInteger);
    }
    SUBCASE("other leaves") {
        CHECK_EQ(describe<bool>().kind(), TypeKind::kBoolean);
        CHECK_EQ(describe<void>().kind(), TypeKind::kVoid);
        CHECK_EQ(describe<float>().bits(), 32);
        CHECK_EQ(describe<double>().bits(), 64);
    }
    SUBCASE("enums use their underlying type") {
        CHECK_EQ(describe<Color>().kind(), TypeKind::kUnsignedInteger);
        CHECK_EQ(describe<Color>().bits(), 8);
    }
    SUBCASE("pointers") {
        CHECK_EQ(describe<TestObject*>().pointee().kind(), TypeKind::kObject);
        CHECK_EQ(describe<void*>().pointee().kind(), TypeKind::kVoid);
        CHECK_EQ(describe<TestSelector*>().pointee().kind(), TypeKind::kOpaque);
        CHECK_EQ(describe<const int*>().pointee().kind(), TypeKind::kSignedInteger);
    }
}

TEST_CASE("describe and encode") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    SUBCASE("primitives") {
        CHECK_EQ(encoder.encode(describe<int8_t>()), "c");
        CHECK_EQ(encoder.encode(describe<uint8_t>()), "C");
        CHECK_EQ(encoder.encode(describe<long>()), sizeof(long) == sizeof(int) ? "i" : "l");
        CHECK_EQ(encoder.encode(describe<int>()), "i");
        CHECK_EQ(encoder.encode(describe<short>()), "s");
        CHECK_EQ(encoder.encode(describe<unsigned int>()), "I");
        CHECK_EQ(encoder.encode(describe<unsigned short>()), "S");
        CHECK_EQ(encoder.encode(describe<float>()), "f");
        CHECK_EQ(encoder.encode(describe<double>()), "d");
        CHECK_EQ(encoder.encode(describe<bool>()), "B");
        CHECK_EQ(encoder.encode(describe<void>()), "v");
    }
    SUBCASE("pointer special cases") {
        CHECK_EQ(encoder.encode(describe<TestObject*>()), "@");
        CHECK_EQ(encoder.encode(describe<char*>()), "*");
        CHECK_EQ(encoder.encode(describe<const char*>()), "*");
        CHECK_EQ(encoder.encode(describe<unsigned char*>()), "*");
        CHECK_EQ(encoder.encode(describe<void*>()), "?");
        CHECK_EQ(encoder.encode(describe<TestSelector*>()), "?");
        CHECK_EQ(encoder.encode(describe<int*>()), "^i");
        CHECK_EQ(encoder.encode(describe<TestObject**>()), "^@");
    }
    SUBCASE("structs") {
        CHECK_EQ(encoder.encode(describe<Point>()), "{Point=I}");
        CHECK_EQ(encoder.encode(describe<Example>()), "{Example=@*i}");
        CHECK_EQ(encoder.encode(describe<Example*>()), "^{Example=@*i}");
        CHECK_EQ(encoder.encode(describe<Example**>()), "^^{Example}");
    }
    SUBCASE("self-referential struct") {
        CHECK_EQ(encoder.encode(describe<Node>()), "{Node=^{Node}i}");
        CHECK_EQ(encoder.encode(describe<Node*>()), "^{Node=^{Node}i}");
        CHECK_EQ(encoder.encode(describe<Node**>()), "^^{Node}");
    }
    SUBCASE("mixed fields") {
        CHECK_EQ(encoder.encode(describe<Mixed>()), "{Mixed=*CdB{Point=I}??}");
        CHECK_EQ(encoder.encode(describe<Mixed*>()), "^{Mixed=*CdB{Point}??}");
    }
    SUBCASE("extended precision floats") {
        auto encoding = encoder.encode(describe<long double>());
        if (sizeof(long double) == sizeof(double)) {
            CHECK_EQ(encoding, "d");
        } else {
            CHECK(!encoding);
            CHECK_EQ(errorReporter->countOf(ErrorKind::kUnsupportedType), 1);
        }
    }
}

TEST_CASE("describe opaque handles") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    auto type = describe<TestClass*>();
    REQUIRE(type.isPointer());
    CHECK_EQ(type.pointee().kind(), kOpaque);
    CHECK_EQ(encoder.encode(type), "?");
    CHECK_EQ(encoder.encode(TypeDescription::makePointer(type)), "^?");
    CHECK(!errorReporter->hasErrors());
}

} // namespace objcx
