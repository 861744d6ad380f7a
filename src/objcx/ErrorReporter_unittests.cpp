#include "objcx/ErrorReporter.hpp"

#include "doctest/doctest.h"

namespace objcx {

TEST_CASE("ErrorReporter collection") {
    SUBCASE("starts empty") {
        ErrorReporter er(true);
        CHECK_EQ(er.errorCount(), 0);
        CHECK(!er.hasErrors());
        CHECK(er.errors().empty());
    }
    SUBCASE("keeps errors in order") {
        ErrorReporter er(true);
        er.addError(ErrorKind::kUnsupportedType, "Cannot encode type union U.");
        er.addError(ErrorKind::kRuntimeFailure, "Failed to allocate class pair Widget.");
        REQUIRE_EQ(er.errorCount(), 2);
        CHECK(er.hasErrors());
        CHECK_EQ(er.errors()[0].kind, ErrorKind::kUnsupportedType);
        CHECK_EQ(er.errors()[0].message, "Cannot encode type union U.");
        CHECK_EQ(er.errors()[1].kind, ErrorKind::kRuntimeFailure);
    }
    SUBCASE("counts by kind") {
        ErrorReporter er(true);
        er.addError(ErrorKind::kUnsupportedType, "a");
        er.addError(ErrorKind::kUnsupportedType, "b");
        er.addError(ErrorKind::kLengthMismatch, "c");
        CHECK_EQ(er.countOf(ErrorKind::kUnsupportedType), 2);
        CHECK_EQ(er.countOf(ErrorKind::kLengthMismatch), 1);
        CHECK_EQ(er.countOf(ErrorKind::kInvariantViolation), 0);
    }
    SUBCASE("clear") {
        ErrorReporter er(true);
        er.addError(ErrorKind::kInvariantViolation, "BOOL was 2");
        er.clear();
        CHECK_EQ(er.errorCount(), 0);
    }
}

} // namespace objcx
