#ifndef SRC_OBJCX_DESCRIBE_HPP_
#define SRC_OBJCX_DESCRIBE_HPP_

#include "objcx/TypeDescription.hpp"

#include <climits>
#include <string>
#include <type_traits>
#include <utility>

// describe<T>() builds the TypeDescription of a C++ type at compile time, so callers can encode native types without
// assembling descriptions by hand. Types with no runtime encoding (unions, arrays, functions) fail to compile.
//
// Structs must be described with a StructLayout specialization, listing fields in declaration order:
//
//     template <> struct objcx::StructLayout<Point> {
//         static TypeDescription describe() {
//             return TypeDescription::makeStruct("Point", { field("x", &Point::x), field("y", &Point::y) });
//         }
//     };
namespace objcx {

// Specialize to true for the struct type behind an object handle, pointers to which encode as '@'.
template <typename T> struct IsObjectHandle : std::false_type { };

// Specialize to true for types only ever handled through pointers, which then encode as '?' even when the type is
// complete.
template <typename T> struct IsOpaqueHandle : std::false_type { };

template <typename T> struct StructLayout;

namespace internal {

// Note that the answer is fixed at first instantiation, so a type must not be completed after its pointers are
// described.
template <typename T, typename = void> struct IsComplete : std::false_type { };
template <typename T> struct IsComplete<T, std::void_t<decltype(sizeof(T))>> : std::true_type { };

template <typename T, typename = void> struct HasStructLayout : std::false_type { };
template <typename T>
struct HasStructLayout<T, std::void_t<decltype(StructLayout<T>::describe())>> : std::true_type { };

template <typename T> constexpr int32_t bitsOf() { return static_cast<int32_t>(sizeof(T) * CHAR_BIT); }

} // namespace internal

template <typename T> TypeDescription describe();

template <typename P> TypeDescription describePointerTo() {
    using U = std::remove_cv_t<P>;
    static_assert(!std::is_function_v<U>, "function pointers have no runtime type encoding");

    if constexpr (IsObjectHandle<U>::value) {
        return TypeDescription::makePointer(TypeDescription::makeObject());
    } else if constexpr (std::is_void_v<U>) {
        return TypeDescription::makePointer(TypeDescription::makeVoid());
    } else if constexpr (IsOpaqueHandle<U>::value || !internal::IsComplete<U>::value) {
        return TypeDescription::makePointer(TypeDescription::makeOpaque());
    } else {
        // Deferred, as the pointee may be the struct currently being described.
        return TypeDescription::makePointer(&describe<U>);
    }
}

template <typename T> TypeDescription describe() {
    using U = std::remove_cv_t<T>;
    static_assert(!std::is_union_v<U>, "unions have no runtime type encoding");
    static_assert(!std::is_array_v<U>, "arrays have no runtime type encoding");
    static_assert(!std::is_function_v<U>, "functions have no runtime type encoding");
    static_assert(!std::is_reference_v<U>, "describe the referenced type or a pointer instead");

    if constexpr (std::is_same_v<U, bool>) {
        return TypeDescription::makeBoolean();
    } else if constexpr (std::is_void_v<U>) {
        return TypeDescription::makeVoid();
    } else if constexpr (std::is_enum_v<U>) {
        return describe<std::underlying_type_t<U>>();
    } else if constexpr (std::is_integral_v<U>) {
        if constexpr (std::is_signed_v<U>) {
            return TypeDescription::makeSigned(internal::bitsOf<U>());
        } else {
            return TypeDescription::makeUnsigned(internal::bitsOf<U>());
        }
    } else if constexpr (std::is_floating_point_v<U>) {
        return TypeDescription::makeFloat(internal::bitsOf<U>());
    } else if constexpr (std::is_pointer_v<U>) {
        return describePointerTo<std::remove_pointer_t<U>>();
    } else if constexpr (!internal::IsComplete<U>::value) {
        return TypeDescription::makeOpaque();
    } else {
        static_assert(internal::HasStructLayout<U>::value, "specialize objcx::StructLayout to describe this type");
        return StructLayout<U>::describe();
    }
}

// Describes the member |name| of struct S from a pointer to that member, for use in StructLayout specializations.
template <typename S, typename M> StructField field(std::string name, M S::*) {
    return StructField{std::move(name), describe<M>()};
}

} // namespace objcx

#endif // SRC_OBJCX_DESCRIBE_HPP_
