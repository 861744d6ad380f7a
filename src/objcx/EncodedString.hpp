#ifndef SRC_OBJCX_ENCODED_STRING_HPP_
#define SRC_OBJCX_ENCODED_STRING_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace objcx {

// A null-terminated runtime type encoding, such as "{Example=@*i}". Every copy owns its own characters. A
// default-constructed EncodedString is nil, which is how the encoder signals a failed encoding, as no valid encoding
// is empty.
class EncodedString {
public:
    EncodedString();
    EncodedString(const EncodedString& s);
    EncodedString(EncodedString&& s) noexcept;
    EncodedString& operator=(const EncodedString& s);
    EncodedString& operator=(EncodedString&& s) noexcept;
    ~EncodedString() = default;

    // Copies |encoding| into a new EncodedString. Only the TypeEncoder should produce encodings, this exists for
    // strings already produced by the runtime, like method type encodings.
    static EncodedString fromView(std::string_view encoding);

    // Returns "" for a nil string, never nullptr, so the result is always safe to hand to the runtime.
    const char* c_str() const { return m_chars ? m_chars.get() : ""; }
    std::string_view view() const { return std::string_view(c_str(), static_cast<size_t>(m_length)); }
    std::string str() const { return std::string(view()); }
    // Length without the null terminator.
    int32_t length() const { return m_length; }

    inline bool isNil() const { return m_chars == nullptr; }
    explicit inline operator bool() const { return !isNil(); }

    inline bool operator==(const EncodedString& s) const { return isNil() == s.isNil() && view() == s.view(); }
    inline bool operator!=(const EncodedString& s) const { return !(*this == s); }
    inline bool operator==(std::string_view v) const { return !isNil() && view() == v; }
    inline bool operator!=(std::string_view v) const { return !(*this == v); }

private:
    friend class TypeEncoder;

    // Allocates room for |length| characters plus the terminator, which is written immediately. Characters are filled
    // in by the TypeEncoder.
    explicit EncodedString(int32_t length);
    char* data() { return m_chars.get(); }

    int32_t m_length;
    std::unique_ptr<char[]> m_chars;
};

} // namespace objcx

#endif // SRC_OBJCX_ENCODED_STRING_HPP_
