#include "objcx/TypeEncoder.hpp"

#include "objcx/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cassert>
#include <climits>
#include <cstring>
#include <utility>

namespace objcx {

namespace {

// Widths of the C integer types on the host, which vary by ABI. The encoding of an integer is chosen by measured width,
// in this order, so on LP64 hosts a 64-bit signed integer encodes as 'l' and on LLP64 hosts as 'q'.
constexpr int32_t kCharBits = static_cast<int32_t>(sizeof(signed char) * CHAR_BIT);
constexpr int32_t kIntBits = static_cast<int32_t>(sizeof(int) * CHAR_BIT);
constexpr int32_t kShortBits = static_cast<int32_t>(sizeof(short) * CHAR_BIT);
constexpr int32_t kLongBits = static_cast<int32_t>(sizeof(long) * CHAR_BIT);
constexpr int32_t kLongLongBits = static_cast<int32_t>(sizeof(long long) * CHAR_BIT);
constexpr int32_t kFloatBits = static_cast<int32_t>(sizeof(float) * CHAR_BIT);
constexpr int32_t kDoubleBits = static_cast<int32_t>(sizeof(double) * CHAR_BIT);

// Returns the encoding character of an integer, float, boolean, or void type, or '\0' if there isn't one.
char leafCode(const TypeDescription& type) {
    const auto bits = type.bits();
    switch (type.kind()) {
    case kSignedInteger:
        if (bits == kCharBits) { return 'c'; }
        if (bits == kIntBits) { return 'i'; }
        if (bits == kShortBits) { return 's'; }
        if (bits == kLongBits) { return 'l'; }
        if (bits == kLongLongBits) { return 'q'; }
        return '\0';

    case kUnsignedInteger:
        if (bits == kCharBits) { return 'C'; }
        if (bits == kIntBits) { return 'I'; }
        if (bits == kShortBits) { return 'S'; }
        if (bits == kLongBits) { return 'L'; }
        if (bits == kLongLongBits) { return 'Q'; }
        return '\0';

    case kFloat:
        if (bits == kFloatBits) { return 'f'; }
        if (bits == kDoubleBits) { return 'd'; }
        return '\0';

    case kBoolean:
        return 'B';

    case kVoid:
        return 'v';

    default:
        return '\0';
    }
}

// Pointers to objects, to C strings, and to opaque types all encode as a single character, without encoding what they
// point to. Returns '\0' for all other pointers.
char pointerCode(const TypeDescription& pointee) {
    switch (pointee.kind()) {
    case kObject:
        return '@';

    // char* (string) is special.
    case kSignedInteger:
    case kUnsignedInteger:
        return pointee.bits() == kCharBits ? '*' : '\0';

    case kOpaque:
    case kVoid:
        return '?';

    default:
        return '\0';
    }
}

bool isLeaf(TypeKind kind) {
    return kind == kSignedInteger || kind == kUnsignedInteger || kind == kFloat || kind == kBoolean || kind == kVoid;
}

// Struct names are copied verbatim into the encoding, so they must not contain any characters meaningful to the
// encoding grammar.
bool isValidStructName(std::string_view name) {
    return !name.empty() && name.find_first_of("{}=^") == std::string_view::npos;
}

} // namespace

TypeEncoder::TypeEncoder(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(std::move(errorReporter)) {
    assert(m_errorReporter);
}

TypeEncoder::~TypeEncoder() {}

int32_t TypeEncoder::encodedSize(const TypeDescription& type, int32_t depth) {
    assert(depth >= 0);

    if (isLeaf(type.kind())) {
        if (leafCode(type) == '\0') {
            reportUnsupported(type, fmt::format("unsupported {}-bit width", type.bits()));
            return -1;
        }
        return 1;
    }

    switch (type.kind()) {
    case kPointer: {
        auto pointee = type.pointee();
        if (pointerCode(pointee) != '\0') {
            return 1;
        }
        auto pointeeSize = encodedSize(pointee, depth + 1);
        if (pointeeSize < 0) {
            return -1;
        }
        return 1 + pointeeSize;
    }

    case kStruct: {
        if (!isValidStructName(type.name())) {
            reportUnsupported(type, "struct name is empty or contains encoding characters");
            return -1;
        }
        // {Name}
        auto size = static_cast<int32_t>(type.name().size()) + 2;
        if (depth <= kMaxExpandedDepth) {
            // {Name=<fields>}
            size += 1;
            for (const auto& field : type.fields()) {
                auto fieldSize = encodedSize(field.type, depth + 1);
                if (fieldSize < 0) {
                    return -1;
                }
                size += fieldSize;
            }
        }
        return size;
    }

    case kObject:
    case kOpaque:
        reportUnsupported(type, "only encodable through a pointer");
        return -1;

    default:
        reportUnsupported(type, "no encoding defined");
        return -1;
    }
}

EncodedString TypeEncoder::encodeLiteral(const TypeDescription& type, int32_t depth, int32_t length) {
    if (length < 0) {
        m_errorReporter->addError(ErrorKind::kLengthMismatch,
                                  fmt::format("Negative length {} requested for encoding of {}.", length,
                                              type.canonicalName()));
        return EncodedString();
    }

    EncodedString result(length);
    Buffer buffer{result.data(), result.data() + length, length};
    if (!emit(type, depth, buffer) || !finish(buffer, type)) {
        return EncodedString();
    }
    return result;
}

EncodedString TypeEncoder::encode(const TypeDescription& type) {
    auto length = encodedSize(type, 0);
    if (length < 0) {
        return EncodedString();
    }
    return encodeLiteral(type, 0, length);
}

EncodedString TypeEncoder::encodeSignature(const TypeDescription& returnType,
                                           const std::vector<TypeDescription>& argumentTypes) {
    auto length = encodedSize(returnType, 0);
    if (length < 0) {
        return EncodedString();
    }
    for (const auto& argumentType : argumentTypes) {
        auto argumentSize = encodedSize(argumentType, 0);
        if (argumentSize < 0) {
            return EncodedString();
        }
        length += argumentSize;
    }

    EncodedString result(length);
    Buffer buffer{result.data(), result.data() + length, length};
    if (!emit(returnType, 0, buffer)) {
        return EncodedString();
    }
    for (const auto& argumentType : argumentTypes) {
        if (!emit(argumentType, 0, buffer)) {
            return EncodedString();
        }
    }
    if (!finish(buffer, returnType)) {
        return EncodedString();
    }
    return result;
}

bool TypeEncoder::emit(const TypeDescription& type, int32_t depth, Buffer& buffer) {
    if (isLeaf(type.kind())) {
        auto code = leafCode(type);
        if (code == '\0') {
            reportUnsupported(type, fmt::format("unsupported {}-bit width", type.bits()));
            return false;
        }
        return put(std::string_view(&code, 1), type, buffer);
    }

    switch (type.kind()) {
    case kPointer: {
        auto pointee = type.pointee();
        auto code = pointerCode(pointee);
        if (code != '\0') {
            return put(std::string_view(&code, 1), type, buffer);
        }
        if (!put("^", type, buffer)) {
            return false;
        }
        return emit(pointee, depth + 1, buffer);
    }

    case kStruct: {
        if (!isValidStructName(type.name())) {
            reportUnsupported(type, "struct name is empty or contains encoding characters");
            return false;
        }
        if (!put("{", type, buffer) || !put(type.name(), type, buffer)) {
            return false;
        }
        if (depth <= kMaxExpandedDepth) {
            if (!put("=", type, buffer)) {
                return false;
            }
            for (const auto& field : type.fields()) {
                if (!emit(field.type, depth + 1, buffer)) {
                    return false;
                }
            }
        }
        return put("}", type, buffer);
    }

    case kObject:
    case kOpaque:
        reportUnsupported(type, "only encodable through a pointer");
        return false;

    default:
        reportUnsupported(type, "no encoding defined");
        return false;
    }
}

bool TypeEncoder::put(std::string_view chars, const TypeDescription& type, Buffer& buffer) {
    if (static_cast<size_t>(buffer.end - buffer.cursor) < chars.size()) {
        m_errorReporter->addError(ErrorKind::kLengthMismatch,
                                  fmt::format("Encoding of {} overflows the expected length of {} characters.",
                                              type.canonicalName(), buffer.length));
        return false;
    }
    std::memcpy(buffer.cursor, chars.data(), chars.size());
    buffer.cursor += chars.size();
    return true;
}

bool TypeEncoder::finish(const Buffer& buffer, const TypeDescription& type) {
    if (buffer.cursor != buffer.end) {
        m_errorReporter->addError(ErrorKind::kLengthMismatch,
                                  fmt::format("Encoding of {} is {} characters short of the expected length of {}.",
                                              type.canonicalName(), buffer.end - buffer.cursor, buffer.length));
        return false;
    }
    return true;
}

void TypeEncoder::reportUnsupported(const TypeDescription& type, std::string_view reason) {
    m_errorReporter->addError(ErrorKind::kUnsupportedType,
                              fmt::format("Cannot encode type {}: {}.", type.canonicalName(), reason));
}

} // namespace objcx
