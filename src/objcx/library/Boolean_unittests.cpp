#include "objcx/library/Boolean.hpp"

#include "doctest/doctest.h"

namespace objcx { namespace library {

TEST_CASE("decodeBool") {
    SUBCASE("YES and NO") {
        auto yes = decodeBool(YES);
        REQUIRE(yes.has_value());
        CHECK(*yes);
        auto no = decodeBool(NO);
        REQUIRE(no.has_value());
        CHECK(!*no);
    }
    SUBCASE("third value") {
        CHECK(!decodeBool(2).has_value());
        CHECK(!decodeBool(-1).has_value());
    }
}

TEST_CASE("toBool and fromBool") {
    CHECK(toBool(YES));
    CHECK(!toBool(NO));
    CHECK_EQ(fromBool(true), YES);
    CHECK_EQ(fromBool(false), NO);
    CHECK(toBool(fromBool(true)));
}

} // namespace library
} // namespace objcx
