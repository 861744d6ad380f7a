// objcx-inspect, prints Objective-C runtime classes and the type encodings of host types
#include "objcx/ClassDumpJSON.hpp"
#include "objcx/Describe.hpp"
#include "objcx/EncodingCache.hpp"
#include "objcx/ErrorReporter.hpp"
#include "objcx/library/Class.hpp"
#include "objcx/library/Object.hpp"

#include "fmt/format.h"
#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

DEFINE_string(className, "", "Name of a registered class to describe.");
DEFINE_bool(encodings, false, "Print the type encoding of every host primitive type.");
DEFINE_bool(json, false, "Print output as JSON.");
DEFINE_bool(pretty, false, "Pretty-print JSON output.");
DEFINE_string(logLevel, "warn", "Log level, one of trace, debug, info, warn, error, critical, off.");

namespace {

std::vector<std::pair<std::string, objcx::TypeDescription>> hostTypes() {
    return {{"char", objcx::describe<char>()},
            {"short", objcx::describe<short>()},
            {"int", objcx::describe<int>()},
            {"long", objcx::describe<long>()},
            {"long long", objcx::describe<long long>()},
            {"unsigned char", objcx::describe<unsigned char>()},
            {"unsigned short", objcx::describe<unsigned short>()},
            {"unsigned int", objcx::describe<unsigned int>()},
            {"unsigned long", objcx::describe<unsigned long>()},
            {"unsigned long long", objcx::describe<unsigned long long>()},
            {"float", objcx::describe<float>()},
            {"double", objcx::describe<double>()},
            {"bool", objcx::describe<bool>()},
            {"void", objcx::describe<void>()},
            {"id", objcx::describe<id>()},
            {"char*", objcx::describe<char*>()},
            {"void*", objcx::describe<void*>()},
            {"SEL", objcx::describe<SEL>()},
            {"Class", objcx::describe<Class>()}};
}

void printClass(objcx::library::Class cls) {
    fmt::print("{}{}, instance size {}\n", cls.name(), cls.isMetaClass() ? " (metaclass)" : "", cls.instanceSize());
    for (auto super = cls.superclass(); super; super = super.superclass()) {
        fmt::print("  : {}\n", super.name());
    }
    fmt::print("  metaclass {}\n", cls.metaClass().name());
    for (const auto& property : cls.copyPropertyList()) {
        fmt::print("  @property {} \"{}\"\n", property.name(), property.attributes());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    spdlog::set_level(spdlog::level::from_str(FLAGS_logLevel));

    if (FLAGS_className.empty() && !FLAGS_encodings) {
        SPDLOG_ERROR("Nothing to do, specify --className or --encodings.");
        return -1;
    }

    auto errorReporter = std::make_shared<objcx::ErrorReporter>();
    objcx::EncodingCache cache(errorReporter);
    objcx::ClassDumpJSON dumpJSON;

    if (!FLAGS_className.empty()) {
        auto cls = objcx::library::Class::lookUp(FLAGS_className);
        if (!cls) {
            SPDLOG_ERROR("Class {} not found.", FLAGS_className);
            return -1;
        }
        if (FLAGS_json) {
            dumpJSON.addClass(cls);
        } else {
            printClass(cls);
        }
    }

    if (FLAGS_encodings) {
        for (const auto& hostType : hostTypes()) {
            auto encoding = cache.encode(hostType.second);
            if (FLAGS_json) {
                dumpJSON.addEncoding(hostType.first, encoding);
            } else {
                fmt::print("{:>20} {}\n", hostType.first, encoding ? encoding.view() : "(unsupported)");
            }
        }
    }

    if (FLAGS_json) {
        dumpJSON.dump(FLAGS_pretty);
        fmt::print("{}\n", dumpJSON.json());
    }

    return errorReporter->hasErrors() ? -1 : 0;
}
