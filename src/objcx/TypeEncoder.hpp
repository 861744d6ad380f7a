#ifndef SRC_OBJCX_TYPE_ENCODER_HPP_
#define SRC_OBJCX_TYPE_ENCODER_HPP_

#include "objcx/EncodedString.hpp"
#include "objcx/TypeDescription.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace objcx {

class ErrorReporter;

// Computes Objective-C runtime type encodings, see:
// https://developer.apple.com/library/archive/documentation/Cocoa/Conceptual/ObjCRuntimeGuide/Articles/ocrtTypeEncodings.html
//
// Encoding is done in two passes over the TypeDescription. encodedSize() computes the exact length of the encoding,
// then encodeLiteral() fills a buffer of exactly that length. Both passes walk the same branches, so they agree on which
// types are accepted as well as on length. Depth counts the pointers and struct fields between the type being encoded
// and the top-level type, structs deeper than kMaxExpandedDepth are abbreviated to {Name}.
class TypeEncoder {
public:
    TypeEncoder() = delete;
    explicit TypeEncoder(std::shared_ptr<ErrorReporter> errorReporter);
    ~TypeEncoder();

    static constexpr int32_t kMaxExpandedDepth = 1;

    // Returns the length of the encoding of |type| at |depth|, not counting the null terminator, or -1 if |type|
    // contains a shape that has no encoding. |depth| must be non-negative.
    int32_t encodedSize(const TypeDescription& type, int32_t depth);

    // Encodes |type| at |depth| into a string of exactly |length| characters, which must be the value encodedSize()
    // returned for the same arguments. Returns a nil string if the type is unsupported or if the encoding does not fill
    // exactly |length| characters.
    EncodedString encodeLiteral(const TypeDescription& type, int32_t depth, int32_t length);

    // Both passes at depth 0.
    EncodedString encode(const TypeDescription& type);

    // The method type string accepted by class_addMethod(), the concatenated encodings of the return type followed by
    // each argument type. Note that the runtime's method arguments start with the receiver and selector, which callers
    // must include in |argumentTypes|.
    EncodedString encodeSignature(const TypeDescription& returnType, const std::vector<TypeDescription>& argumentTypes);

    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

private:
    struct Buffer {
        char* cursor;
        const char* end;
        int32_t length;
    };

    bool emit(const TypeDescription& type, int32_t depth, Buffer& buffer);
    bool put(std::string_view chars, const TypeDescription& type, Buffer& buffer);
    bool finish(const Buffer& buffer, const TypeDescription& type);
    void reportUnsupported(const TypeDescription& type, std::string_view reason);

    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace objcx

#endif // SRC_OBJCX_TYPE_ENCODER_HPP_
