#include "objcx/TypeEncoder.hpp"

#include "objcx/ErrorReporter.hpp"
#include "objcx/TypeDescription.hpp"

#include "doctest/doctest.h"

#include <climits>
#include <memory>
#include <vector>

namespace objcx {

namespace {

TypeDescription makePoint() {
    return TypeDescription::makeStruct("Point", {{"a", TypeDescription::makeUnsigned(sizeof(unsigned int) * CHAR_BIT)}});
}

TypeDescription makeExample() {
    return TypeDescription::makeStruct(
        "Example",
        {{"anObject", TypeDescription::makePointer(TypeDescription::makeObject())},
         {"aString", TypeDescription::makePointer(TypeDescription::makeSigned(8))},
         {"anInt", TypeDescription::makeSigned(32)}});
}

TypeDescription makeNode();
TypeDescription makeNodePointer() { return TypeDescription::makePointer(&makeNode); }
// struct Node { struct Node* next; int value; };
TypeDescription makeNode() {
    return TypeDescription::makeStruct(
        "Node", {{"next", makeNodePointer()}, {"value", TypeDescription::makeSigned(sizeof(int) * CHAR_BIT)}});
}

constexpr int32_t kBits(size_t bytes) { return static_cast<int32_t>(bytes * CHAR_BIT); }

} // namespace

TEST_CASE("TypeEncoder leaf types") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    SUBCASE("signed integers") {
        CHECK_EQ(encoder.encode(TypeDescription::makeSigned(8)), "c");
        CHECK_EQ(encoder.encode(TypeDescription::makeSigned(kBits(sizeof(int)))), "i");
        CHECK_EQ(encoder.encode(TypeDescription::makeSigned(kBits(sizeof(short)))), "s");
        CHECK_EQ(encoder.encode(TypeDescription::makeSigned(kBits(sizeof(long)))), sizeof(long) == sizeof(int) ? "i" : "l");
    }
    SUBCASE("unsigned integers") {
        CHECK_EQ(encoder.encode(TypeDescription::makeUnsigned(8)), "C");
        CHECK_EQ(encoder.encode(TypeDescription::makeUnsigned(kBits(sizeof(unsigned int)))), "I");
        CHECK_EQ(encoder.encode(TypeDescription::makeUnsigned(kBits(sizeof(unsigned short)))), "S");
    }
    SUBCASE("64-bit integers follow the host ABI") {
        // long long is matched after long, so it only gets its own code where long is narrower.
        bool longIs64 = sizeof(long) == sizeof(long long);
        CHECK_EQ(encoder.encode(TypeDescription::makeSigned(64)), longIs64 ? "l" : "q");
        CHECK_EQ(encoder.encode(TypeDescription::makeUnsigned(64)), longIs64 ? "L" : "Q");
    }
    SUBCASE("floats") {
        CHECK_EQ(encoder.encode(TypeDescription::makeFloat(32)), "f");
        CHECK_EQ(encoder.encode(TypeDescription::makeFloat(64)), "d");
    }
    SUBCASE("bool and void") {
        CHECK_EQ(encoder.encode(TypeDescription::makeBoolean()), "B");
        CHECK_EQ(encoder.encode(TypeDescription::makeVoid()), "v");
    }
    SUBCASE("leaves are one character at any depth") {
        for (int32_t depth = 0; depth < 4; ++depth) {
            CHECK_EQ(encoder.encodedSize(TypeDescription::makeSigned(8), depth), 1);
            CHECK_EQ(encoder.encodedSize(TypeDescription::makeFloat(64), depth), 1);
            CHECK_EQ(encoder.encodedSize(TypeDescription::makeBoolean(), depth), 1);
            CHECK_EQ(encoder.encodedSize(TypeDescription::makeVoid(), depth), 1);
        }
    }
    CHECK_EQ(errorReporter->errorCount(), 0);
}

TEST_CASE("TypeEncoder pointers") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    SUBCASE("object pointers are @ at any depth") {
        auto id = TypeDescription::makePointer(TypeDescription::makeObject());
        CHECK_EQ(encoder.encode(id), "@");
        for (int32_t depth = 0; depth < 4; ++depth) {
            CHECK_EQ(encoder.encodedSize(id, depth), 1);
            CHECK_EQ(encoder.encodeLiteral(id, depth, 1), "@");
        }
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(id)), "^@");
    }
    SUBCASE("byte pointers are C strings") {
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(TypeDescription::makeSigned(8))), "*");
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(TypeDescription::makeUnsigned(8))), "*");
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(
                     TypeDescription::makePointer(TypeDescription::makeSigned(8)))), "^*");
    }
    SUBCASE("opaque and void pointers") {
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(TypeDescription::makeVoid())), "?");
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(TypeDescription::makeOpaque("objc_selector"))), "?");
    }
    SUBCASE("other pointers") {
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(TypeDescription::makeSigned(32))), "^i");
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(TypeDescription::makeFloat(64))), "^d");
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(TypeDescription::makeBoolean())), "^B");
        CHECK_EQ(encoder.encodedSize(TypeDescription::makePointer(TypeDescription::makeSigned(16)), 0), 2);
    }
    CHECK_EQ(errorReporter->errorCount(), 0);
}

TEST_CASE("TypeEncoder structs") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    SUBCASE("single field") {
        CHECK_EQ(encoder.encode(makePoint()), "{Point=I}");
        CHECK_EQ(encoder.encodedSize(makePoint(), 0), 9);
    }
    SUBCASE("object, string, and int fields") {
        CHECK_EQ(encoder.encode(makeExample()), "{Example=@*i}");
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(makeExample())), "^{Example=@*i}");
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(TypeDescription::makePointer(makeExample()))),
                 "^^{Example}");
    }
    SUBCASE("empty struct") {
        auto empty = TypeDescription::makeStruct("Empty", {});
        CHECK_EQ(encoder.encode(empty), "{Empty=}");
        CHECK_EQ(encoder.encodedSize(empty, 2), 7);
        CHECK_EQ(encoder.encodeLiteral(empty, 2, 7), "{Empty}");
    }
    SUBCASE("expansion stops after depth one") {
        CHECK_EQ(encoder.encodedSize(makePoint(), 1), 9);
        CHECK_EQ(encoder.encodeLiteral(makePoint(), 1, 9), "{Point=I}");
        CHECK_EQ(encoder.encodedSize(makePoint(), 2), 7);
        CHECK_EQ(encoder.encodeLiteral(makePoint(), 2, 7), "{Point}");
        CHECK_EQ(encoder.encodedSize(makePoint(), 5), 7);
        CHECK_EQ(encoder.encodeLiteral(makePoint(), 5, 7), "{Point}");
    }
    SUBCASE("nested struct fields") {
        auto outer = TypeDescription::makeStruct(
            "Outer", {{"point", makePoint()}, {"example", TypeDescription::makePointer(makeExample())}});
        // Point is a field at depth 1, Example is behind a pointer at depth 2.
        CHECK_EQ(encoder.encode(outer), "{Outer={Point=I}^{Example}}");
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(outer)), "^{Outer={Point}^{Example}}");
    }
    SUBCASE("self-referential struct") {
        CHECK_EQ(encoder.encode(makeNode()), "{Node=^{Node}i}");
        CHECK_EQ(encoder.encode(makeNodePointer()), "^{Node=^{Node}i}");
        CHECK_EQ(encoder.encode(TypeDescription::makePointer(makeNodePointer())), "^^{Node}");
    }
    CHECK_EQ(errorReporter->errorCount(), 0);
}

TEST_CASE("TypeEncoder length always matches size") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    std::vector<TypeDescription> types = {
        TypeDescription::makeSigned(8),
        TypeDescription::makeBoolean(),
        TypeDescription::makePointer(TypeDescription::makeObject()),
        TypeDescription::makePointer(TypeDescription::makeFloat(32)),
        makePoint(),
        makeExample(),
        makeNode(),
        makeNodePointer(),
        TypeDescription::makePointer(TypeDescription::makePointer(makeExample())),
        TypeDescription::makeStruct("Outer", {{"node", makeNode()}, {"example", makeExample()}}),
    };

    for (const auto& type : types) {
        for (int32_t depth = 0; depth < 4; ++depth) {
            auto size = encoder.encodedSize(type, depth);
            REQUIRE_GT(size, 0);
            auto first = encoder.encodeLiteral(type, depth, size);
            REQUIRE(first);
            CHECK_EQ(first.length(), size);
            CHECK_EQ(first.view().size(), static_cast<size_t>(size));
            CHECK_EQ(first.c_str()[size], '\0');

            auto second = encoder.encodeLiteral(type, depth, size);
            CHECK_EQ(first, second);
        }
    }
    CHECK_EQ(errorReporter->errorCount(), 0);
}

TEST_CASE("TypeEncoder unsupported types") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    SUBCASE("union") {
        auto type = TypeDescription::makeUnion("Variant");
        CHECK_EQ(encoder.encodedSize(type, 0), -1);
        CHECK(!encoder.encode(type));
        REQUIRE(errorReporter->hasErrors());
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorKind::kUnsupportedType);
        CHECK_NE(errorReporter->errors()[0].message.find("union Variant"), std::string::npos);
    }
    SUBCASE("bitfield, function, and array") {
        CHECK_EQ(encoder.encodedSize(TypeDescription::makeBitfield(3), 0), -1);
        CHECK_EQ(encoder.encodedSize(TypeDescription::makeFunction(), 0), -1);
        CHECK_EQ(encoder.encodedSize(TypeDescription::makeArray(TypeDescription::makeSigned(8), 4), 0), -1);
        CHECK_EQ(errorReporter->countOf(ErrorKind::kUnsupportedType), 3);
    }
    SUBCASE("function pointer") {
        CHECK(!encoder.encode(TypeDescription::makePointer(TypeDescription::makeFunction())));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kUnsupportedType), 1);
    }
    SUBCASE("widths with no C type") {
        CHECK(!encoder.encode(TypeDescription::makeSigned(128)));
        CHECK(!encoder.encode(TypeDescription::makeUnsigned(24)));
        CHECK(!encoder.encode(TypeDescription::makeFloat(16)));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kUnsupportedType), 3);
    }
    SUBCASE("object and opaque types by value") {
        CHECK(!encoder.encode(TypeDescription::makeObject()));
        CHECK(!encoder.encode(TypeDescription::makeOpaque("objc_selector")));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kUnsupportedType), 2);
    }
    SUBCASE("struct names that would corrupt the encoding") {
        CHECK(!encoder.encode(TypeDescription::makeStruct("", {})));
        CHECK(!encoder.encode(TypeDescription::makeStruct("A=B", {})));
        CHECK(!encoder.encode(TypeDescription::makeStruct("{A}", {})));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kUnsupportedType), 3);
    }
    SUBCASE("unsupported field of an expanded struct") {
        auto type = TypeDescription::makeStruct("Holder", {{"u", TypeDescription::makeUnion("U")}});
        CHECK_EQ(encoder.encodedSize(type, 0), -1);
        CHECK_EQ(encoder.encodedSize(type, 1), -1);
        // The literal encoder rejects the same type even with room to spare, and reports it the same way.
        CHECK(!encoder.encodeLiteral(type, 0, 32));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kUnsupportedType), 3);
        CHECK_EQ(errorReporter->countOf(ErrorKind::kLengthMismatch), 0);
    }
    SUBCASE("fields of abbreviated structs are not examined") {
        auto type = TypeDescription::makeStruct("Holder", {{"u", TypeDescription::makeUnion("U")}});
        CHECK_EQ(encoder.encodedSize(type, 2), 8);
        CHECK_EQ(encoder.encodeLiteral(type, 2, 8), "{Holder}");
        auto pointer = TypeDescription::makePointer(TypeDescription::makePointer(type));
        CHECK_EQ(encoder.encode(pointer), "^^{Holder}");
        CHECK(!errorReporter->hasErrors());
    }
}

TEST_CASE("TypeEncoder length mismatch") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    SUBCASE("too short") {
        CHECK(!encoder.encodeLiteral(makePoint(), 0, 5));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kLengthMismatch), 1);
    }
    SUBCASE("too long") {
        CHECK(!encoder.encodeLiteral(makePoint(), 0, 12));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kLengthMismatch), 1);
    }
    SUBCASE("length for a different depth") {
        auto size = encoder.encodedSize(makePoint(), 2);
        CHECK(!encoder.encodeLiteral(makePoint(), 0, size));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kLengthMismatch), 1);
    }
    SUBCASE("negative") {
        CHECK(!encoder.encodeLiteral(TypeDescription::makeSigned(8), 0, -1));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kLengthMismatch), 1);
    }
}

TEST_CASE("TypeEncoder method signatures") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    TypeEncoder encoder(errorReporter);

    auto id = TypeDescription::makePointer(TypeDescription::makeObject());
    auto sel = TypeDescription::makePointer(TypeDescription::makeOpaque("objc_selector"));

    SUBCASE("no extra arguments") {
        CHECK_EQ(encoder.encodeSignature(TypeDescription::makeVoid(), {id, sel}), "v@?");
    }
    SUBCASE("struct arguments are encoded at the top level") {
        CHECK_EQ(encoder.encodeSignature(id, {id, sel, makePoint(), TypeDescription::makePointer(makeExample())}),
                 "@@?{Point=I}^{Example=@*i}");
    }
    SUBCASE("unsupported argument") {
        CHECK(!encoder.encodeSignature(TypeDescription::makeVoid(), {id, sel, TypeDescription::makeUnion("U")}));
        CHECK_EQ(errorReporter->countOf(ErrorKind::kUnsupportedType), 1);
    }
}

} // namespace objcx
