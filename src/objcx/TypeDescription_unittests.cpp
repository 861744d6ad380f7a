#include "objcx/TypeDescription.hpp"

#include "doctest/doctest.h"

namespace objcx {

namespace {
TypeDescription makeList();
TypeDescription makeListPointer() { return TypeDescription::makePointer(&makeList); }
TypeDescription makeList() {
    return TypeDescription::makeStruct("List", {{"next", makeListPointer()}, {"count", TypeDescription::makeSigned(32)}});
}
} // namespace

TEST_CASE("TypeDescription accessors") {
    SUBCASE("integers") {
        auto s = TypeDescription::makeSigned(16);
        CHECK_EQ(s.kind(), TypeKind::kSignedInteger);
        CHECK_EQ(s.bits(), 16);
        CHECK(s.isInteger());
        auto u = TypeDescription::makeUnsigned(64);
        CHECK_EQ(u.kind(), TypeKind::kUnsignedInteger);
        CHECK_EQ(u.bits(), 64);
        CHECK(!u.isPointer());
    }
    SUBCASE("pointers") {
        auto p = TypeDescription::makePointer(TypeDescription::makeFloat(32));
        REQUIRE(p.isPointer());
        CHECK_EQ(p.pointee().kind(), TypeKind::kFloat);
        CHECK_EQ(p.pointee().bits(), 32);
    }
    SUBCASE("deferred pointers") {
        auto p = makeListPointer();
        REQUIRE(p.isPointer());
        CHECK(p.pointee().isStruct());
        CHECK_EQ(p.pointee().name(), "List");
    }
    SUBCASE("structs keep field order") {
        auto s = TypeDescription::makeStruct(
            "Pair", {{"first", TypeDescription::makeSigned(8)}, {"second", TypeDescription::makeBoolean()}});
        REQUIRE(s.isStruct());
        CHECK_EQ(s.name(), "Pair");
        REQUIRE_EQ(s.fields().size(), 2);
        CHECK_EQ(s.fields()[0].name, "first");
        CHECK_EQ(s.fields()[1].name, "second");
        CHECK_EQ(s.fields()[1].type.kind(), TypeKind::kBoolean);
    }
    SUBCASE("non-structs have no fields") {
        CHECK(TypeDescription::makeVoid().fields().empty());
        CHECK(TypeDescription::makeUnion("U").fields().empty());
    }
    SUBCASE("arrays") {
        auto a = TypeDescription::makeArray(TypeDescription::makeSigned(8), 12);
        CHECK_EQ(a.kind(), TypeKind::kArray);
        CHECK_EQ(a.count(), 12);
        CHECK_EQ(a.pointee().bits(), 8);
    }
    SUBCASE("copies share structure") {
        auto s = makeList();
        auto copy = s;
        CHECK_EQ(&copy.fields(), &s.fields());
    }
}

TEST_CASE("TypeDescription canonical names") {
    SUBCASE("leaves") {
        CHECK_EQ(TypeDescription::makeSigned(32).canonicalName(), "int32");
        CHECK_EQ(TypeDescription::makeUnsigned(8).canonicalName(), "uint8");
        CHECK_EQ(TypeDescription::makeFloat(64).canonicalName(), "float64");
        CHECK_EQ(TypeDescription::makeBoolean().canonicalName(), "bool");
        CHECK_EQ(TypeDescription::makeVoid().canonicalName(), "void");
        CHECK_EQ(TypeDescription::makeObject().canonicalName(), "object");
        CHECK_EQ(TypeDescription::makeOpaque().canonicalName(), "opaque");
        CHECK_EQ(TypeDescription::makeOpaque("objc_class").canonicalName(), "opaque objc_class");
    }
    SUBCASE("unsupported shapes") {
        CHECK_EQ(TypeDescription::makeUnion("U").canonicalName(), "union U");
        CHECK_EQ(TypeDescription::makeBitfield(3).canonicalName(), "bitfield:3");
        CHECK_EQ(TypeDescription::makeFunction().canonicalName(), "function");
        CHECK_EQ(TypeDescription::makeArray(TypeDescription::makeSigned(8), 4).canonicalName(), "int8[4]");
    }
    SUBCASE("pointers and structs") {
        auto s = TypeDescription::makeStruct(
            "Pair", {{"first", TypeDescription::makePointer(TypeDescription::makeObject())},
                     {"second", TypeDescription::makePointer(TypeDescription::makeSigned(8))}});
        CHECK_EQ(s.canonicalName(), "struct Pair {first: object*; second: int8*}");
        CHECK_EQ(TypeDescription::makePointer(s).canonicalName(), "struct Pair {first: object*; second: int8*}*");
    }
    SUBCASE("self-referential structs terminate") {
        CHECK_EQ(makeList().canonicalName(), "struct List {next: struct List*; count: int32}");
    }
    SUBCASE("sibling structs are each spelled out") {
        auto inner = TypeDescription::makeStruct("Inner", {{"x", TypeDescription::makeSigned(8)}});
        auto outer = TypeDescription::makeStruct("Outer", {{"a", inner}, {"b", inner}});
        CHECK_EQ(outer.canonicalName(), "struct Outer {a: struct Inner {x: int8}; b: struct Inner {x: int8}}");
    }
    SUBCASE("fingerprints follow the canonical name") {
        auto a = TypeDescription::makeStruct("A", {{"x", TypeDescription::makeSigned(32)}});
        auto b = TypeDescription::makeStruct("A", {{"x", TypeDescription::makeSigned(32)}});
        auto c = TypeDescription::makeStruct("A", {{"x", TypeDescription::makeUnsigned(32)}});
        CHECK_EQ(a.fingerprint(), b.fingerprint());
        CHECK_NE(a.fingerprint(), c.fingerprint());
        CHECK_EQ(a.fingerprint(), hash(a.canonicalName()));
    }
}

} // namespace objcx
