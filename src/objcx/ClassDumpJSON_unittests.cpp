#include "objcx/ClassDumpJSON.hpp"

#include "objcx/Describe.hpp"
#include "objcx/EncodingCache.hpp"
#include "objcx/ErrorReporter.hpp"
#include "objcx/library/Class.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace objcx {

TEST_CASE("ClassDumpJSON") {
    SUBCASE("empty dump") {
        ClassDumpJSON dumpJSON;
        dumpJSON.dump(false);
        CHECK_EQ(std::string(dumpJSON.json()), R"({"classes":[],"encodings":{}})");
    }

    SUBCASE("encodings and nil class") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        EncodingCache cache(errorReporter);
        ClassDumpJSON dumpJSON;
        dumpJSON.addClass(library::Class());
        dumpJSON.addEncoding("int", cache.encode(describe<int>()));
        dumpJSON.addEncoding("bitfield", cache.encode(TypeDescription::makeBitfield(3)));
        dumpJSON.dump(false);
        CHECK_EQ(std::string(dumpJSON.json()), R"({"classes":[null],"encodings":{"int":"i","bitfield":null}})");
    }

    SUBCASE("registered class") {
        auto cls = library::Class::allocateClassPair(library::Class(), "ObjcxDumpJSONTest", 0);
        REQUIRE(cls);
        library::Class::registerClassPair(cls);

        ClassDumpJSON dumpJSON;
        dumpJSON.addClass(cls);
        dumpJSON.dump(true);
        auto json = std::string(dumpJSON.json());
        CHECK(json.find(R"("name": "ObjcxDumpJSONTest")") != std::string::npos);
        CHECK(json.find(R"("isMetaClass": true)") != std::string::npos);
        CHECK(json.find(R"("superclasses": [])") != std::string::npos);

        library::Class::disposeClassPair(cls);
    }
}

} // namespace objcx
