#ifndef SRC_OBJCX_TYPE_DESCRIPTION_HPP_
#define SRC_OBJCX_TYPE_DESCRIPTION_HPP_

#include "objcx/Hash.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace objcx {

enum TypeKind : std::int32_t {
    kSignedInteger,
    kUnsignedInteger,
    kFloat,
    kBoolean,
    kVoid,
    kPointer,
    kStruct,
    // The pointee of an object handle (objc_object). Only encodable behind a pointer.
    kObject,
    // A type with no visible layout, like objc_selector. Only encodable behind a pointer.
    kOpaque,

    // Shapes the runtime encoding grammar has no representation for.
    kUnion,
    kBitfield,
    kFunction,
    kArray
};

struct StructField;

// An immutable description of a native type's structure, from which the TypeEncoder computes the runtime's type
// encoding string. Descriptions are cheap to copy, as pointees and struct fields are shared between copies.
class TypeDescription {
public:
    // Pointers can defer construction of their pointee until encoding requires it, which is what allows a struct to
    // contain a pointer to itself.
    using Thunk = TypeDescription (*)();

    TypeDescription() = delete;
    TypeDescription(const TypeDescription&) = default;
    TypeDescription(TypeDescription&&) = default;
    TypeDescription& operator=(const TypeDescription&) = default;
    TypeDescription& operator=(TypeDescription&&) = default;
    ~TypeDescription() = default;

    static TypeDescription makeSigned(int32_t bits);
    static TypeDescription makeUnsigned(int32_t bits);
    static TypeDescription makeFloat(int32_t bits);
    static TypeDescription makeBoolean();
    static TypeDescription makeVoid();
    static TypeDescription makeObject();
    static TypeDescription makeOpaque(std::string name = std::string());
    static TypeDescription makePointer(TypeDescription pointee);
    static TypeDescription makePointer(Thunk pointee);
    static TypeDescription makeStruct(std::string name, std::vector<StructField> fields);
    static TypeDescription makeUnion(std::string name);
    static TypeDescription makeBitfield(int32_t bits);
    static TypeDescription makeFunction();
    static TypeDescription makeArray(TypeDescription element, int32_t count);

    TypeKind kind() const { return m_kind; }
    // Width in bits of integer, float, and bitfield types, 0 for all others.
    int32_t bits() const { return m_bits; }
    // Name of struct, union, and opaque types, empty for all others.
    const std::string& name() const { return m_name; }
    // Number of elements for array types.
    int32_t count() const { return m_count; }

    // The pointed-to type of a pointer, or the element type of an array. Must only be called on those kinds.
    TypeDescription pointee() const;
    // Fields in declaration order. Empty for anything other than a struct.
    const std::vector<StructField>& fields() const;

    bool isInteger() const { return m_kind == kSignedInteger || m_kind == kUnsignedInteger; }
    bool isPointer() const { return m_kind == kPointer; }
    bool isStruct() const { return m_kind == kStruct; }

    // A deterministic spelling of the complete shape of this type, suitable for diagnostics and as a cache key. The
    // fields of each struct are spelled out at the first occurrence of that struct along any path, subsequent nested
    // occurrences use the name only, so self-referential types terminate.
    std::string canonicalName() const;
    Hash fingerprint() const;

private:
    TypeDescription(TypeKind kind, int32_t bits, std::string name);

    void appendCanonicalName(std::string& out, std::unordered_set<std::string>& expandedStructs) const;

    TypeKind m_kind;
    int32_t m_bits;
    std::string m_name;
    int32_t m_count;

    std::shared_ptr<const TypeDescription> m_pointee;
    Thunk m_thunk;
    std::shared_ptr<const std::vector<StructField>> m_fields;
};

struct StructField {
    std::string name;
    TypeDescription type;
};

} // namespace objcx

#endif // SRC_OBJCX_TYPE_DESCRIPTION_HPP_
