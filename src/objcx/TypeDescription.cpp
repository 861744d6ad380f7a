#include "objcx/TypeDescription.hpp"

#include "fmt/format.h"

#include <cassert>
#include <utility>

namespace objcx {

namespace {
const std::vector<StructField> kNoFields;
} // namespace

TypeDescription::TypeDescription(TypeKind kind, int32_t bits, std::string name):
    m_kind(kind), m_bits(bits), m_name(std::move(name)), m_count(0), m_thunk(nullptr) {}

// static
TypeDescription TypeDescription::makeSigned(int32_t bits) { return TypeDescription(kSignedInteger, bits, ""); }

// static
TypeDescription TypeDescription::makeUnsigned(int32_t bits) { return TypeDescription(kUnsignedInteger, bits, ""); }

// static
TypeDescription TypeDescription::makeFloat(int32_t bits) { return TypeDescription(kFloat, bits, ""); }

// static
TypeDescription TypeDescription::makeBoolean() { return TypeDescription(kBoolean, 0, ""); }

// static
TypeDescription TypeDescription::makeVoid() { return TypeDescription(kVoid, 0, ""); }

// static
TypeDescription TypeDescription::makeObject() { return TypeDescription(kObject, 0, ""); }

// static
TypeDescription TypeDescription::makeOpaque(std::string name) { return TypeDescription(kOpaque, 0, std::move(name)); }

// static
TypeDescription TypeDescription::makePointer(TypeDescription pointee) {
    TypeDescription pointer(kPointer, 0, "");
    pointer.m_pointee = std::make_shared<const TypeDescription>(std::move(pointee));
    return pointer;
}

// static
TypeDescription TypeDescription::makePointer(Thunk pointee) {
    assert(pointee);
    TypeDescription pointer(kPointer, 0, "");
    pointer.m_thunk = pointee;
    return pointer;
}

// static
TypeDescription TypeDescription::makeStruct(std::string name, std::vector<StructField> fields) {
    TypeDescription structType(kStruct, 0, std::move(name));
    structType.m_fields = std::make_shared<const std::vector<StructField>>(std::move(fields));
    return structType;
}

// static
TypeDescription TypeDescription::makeUnion(std::string name) { return TypeDescription(kUnion, 0, std::move(name)); }

// static
TypeDescription TypeDescription::makeBitfield(int32_t bits) { return TypeDescription(kBitfield, bits, ""); }

// static
TypeDescription TypeDescription::makeFunction() { return TypeDescription(kFunction, 0, ""); }

// static
TypeDescription TypeDescription::makeArray(TypeDescription element, int32_t count) {
    TypeDescription array(kArray, 0, "");
    array.m_pointee = std::make_shared<const TypeDescription>(std::move(element));
    array.m_count = count;
    return array;
}

TypeDescription TypeDescription::pointee() const {
    assert(m_kind == kPointer || m_kind == kArray);
    if (m_thunk) {
        return m_thunk();
    }
    assert(m_pointee);
    return *m_pointee;
}

const std::vector<StructField>& TypeDescription::fields() const {
    if (!m_fields) {
        return kNoFields;
    }
    return *m_fields;
}

std::string TypeDescription::canonicalName() const {
    std::string name;
    std::unordered_set<std::string> expandedStructs;
    appendCanonicalName(name, expandedStructs);
    return name;
}

Hash TypeDescription::fingerprint() const { return hash(canonicalName()); }

void TypeDescription::appendCanonicalName(std::string& out, std::unordered_set<std::string>& expandedStructs) const {
    switch (m_kind) {
    case kSignedInteger:
        out += fmt::format("int{}", m_bits);
        return;

    case kUnsignedInteger:
        out += fmt::format("uint{}", m_bits);
        return;

    case kFloat:
        out += fmt::format("float{}", m_bits);
        return;

    case kBoolean:
        out += "bool";
        return;

    case kVoid:
        out += "void";
        return;

    case kObject:
        out += "object";
        return;

    case kOpaque:
        out += m_name.empty() ? "opaque" : fmt::format("opaque {}", m_name);
        return;

    case kPointer:
        pointee().appendCanonicalName(out, expandedStructs);
        out += "*";
        return;

    case kStruct: {
        out += fmt::format("struct {}", m_name);
        // Only spell out the fields of a struct not already being spelled out further up this path.
        if (!expandedStructs.emplace(m_name).second) {
            return;
        }
        out += " {";
        bool first = true;
        for (const auto& field : fields()) {
            if (!first) {
                out += "; ";
            }
            first = false;
            out += field.name;
            out += ": ";
            field.type.appendCanonicalName(out, expandedStructs);
        }
        out += "}";
        expandedStructs.erase(m_name);
        return;
    }

    case kUnion:
        out += fmt::format("union {}", m_name);
        return;

    case kBitfield:
        out += fmt::format("bitfield:{}", m_bits);
        return;

    case kFunction:
        out += "function";
        return;

    case kArray:
        pointee().appendCanonicalName(out, expandedStructs);
        out += fmt::format("[{}]", m_count);
        return;
    }
}

} // namespace objcx
