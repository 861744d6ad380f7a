#include "objcx/EncodingCache.hpp"

#include "objcx/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace objcx {

namespace {
TypeDescription makeRect() {
    auto point = TypeDescription::makeStruct(
        "Point", {{"x", TypeDescription::makeFloat(64)}, {"y", TypeDescription::makeFloat(64)}});
    return TypeDescription::makeStruct("Rect", {{"origin", point}, {"size", point}});
}
} // namespace

TEST_CASE("EncodingCache memoizes") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    EncodingCache cache(errorReporter);

    SUBCASE("repeat requests hit the cache") {
        auto first = cache.encode(makeRect());
        CHECK_EQ(first, "{Rect={Point=dd}{Point=dd}}");
        CHECK_EQ(cache.size(), 1);
        CHECK_EQ(cache.misses(), 1);

        // Built again from scratch, but the same shape.
        auto second = cache.encode(makeRect());
        CHECK_EQ(second, first);
        CHECK_EQ(cache.size(), 1);
        CHECK_EQ(cache.misses(), 1);
    }
    SUBCASE("depth is part of the key") {
        CHECK_EQ(cache.encode(makeRect(), 0), "{Rect={Point=dd}{Point=dd}}");
        CHECK_EQ(cache.encode(makeRect(), 1), "{Rect={Point}{Point}}");
        CHECK_EQ(cache.encode(makeRect(), 2), "{Rect}");
        CHECK_EQ(cache.size(), 3);
        CHECK_EQ(cache.encode(makeRect(), 1), "{Rect={Point}{Point}}");
        CHECK_EQ(cache.misses(), 3);
    }
    SUBCASE("different shapes with the same name are kept apart") {
        auto a = TypeDescription::makeStruct("S", {{"x", TypeDescription::makeSigned(8)}});
        auto b = TypeDescription::makeStruct("S", {{"x", TypeDescription::makeUnsigned(8)}});
        CHECK_EQ(cache.encode(a), "{S=c}");
        CHECK_EQ(cache.encode(b), "{S=C}");
        CHECK_EQ(cache.size(), 2);
    }
    SUBCASE("cached copies are independent") {
        auto first = cache.encode(TypeDescription::makePointer(TypeDescription::makeSigned(32)));
        first = EncodedString();
        CHECK(!first);
        CHECK_EQ(cache.encode(TypeDescription::makePointer(TypeDescription::makeSigned(32))), "^i");
    }
    SUBCASE("failures are reported and not cached") {
        CHECK(!cache.encode(TypeDescription::makeUnion("U")));
        CHECK(!cache.encode(TypeDescription::makeUnion("U")));
        CHECK_EQ(cache.size(), 0);
        CHECK_EQ(errorReporter->countOf(ErrorKind::kUnsupportedType), 2);
    }
    SUBCASE("clear") {
        cache.encode(makeRect());
        cache.clear();
        CHECK_EQ(cache.size(), 0);
        CHECK_EQ(cache.encode(makeRect()), "{Rect={Point=dd}{Point=dd}}");
        CHECK_EQ(cache.misses(), 2);
    }
}

TEST_CASE("EncodedString ownership") {
    SUBCASE("nil") {
        EncodedString s;
        CHECK(s.isNil());
        CHECK(!s);
        CHECK_EQ(s.length(), 0);
        CHECK_EQ(std::string(s.c_str()), "");
        CHECK_NE(s, "");
    }
    SUBCASE("copies are deep") {
        auto s = EncodedString::fromView("{Point=I}");
        auto copy = s;
        CHECK_EQ(copy, s);
        CHECK_NE(copy.c_str(), s.c_str());
        CHECK_EQ(copy.length(), 9);
    }
    SUBCASE("moves leave nil behind") {
        auto s = EncodedString::fromView("^@");
        auto moved = std::move(s);
        CHECK_EQ(moved, "^@");
        CHECK(!s);
    }
    SUBCASE("empty view is nil") {
        CHECK(!EncodedString::fromView(""));
    }
}

} // namespace objcx
