#include "objcx/EncodedString.hpp"

#include <cstring>
#include <utility>

namespace objcx {

EncodedString::EncodedString(): m_length(0) {}

EncodedString::EncodedString(int32_t length): m_length(length), m_chars(std::make_unique<char[]>(length + 1)) {
    m_chars[length] = '\0';
}

EncodedString::EncodedString(const EncodedString& s): m_length(s.m_length) {
    if (s.m_chars) {
        m_chars = std::make_unique<char[]>(m_length + 1);
        std::memcpy(m_chars.get(), s.m_chars.get(), m_length + 1);
    }
}

EncodedString::EncodedString(EncodedString&& s) noexcept: m_length(s.m_length), m_chars(std::move(s.m_chars)) {
    s.m_length = 0;
}

EncodedString& EncodedString::operator=(const EncodedString& s) {
    if (this != &s) {
        EncodedString copy(s);
        *this = std::move(copy);
    }
    return *this;
}

EncodedString& EncodedString::operator=(EncodedString&& s) noexcept {
    m_length = s.m_length;
    m_chars = std::move(s.m_chars);
    s.m_length = 0;
    return *this;
}

// static
EncodedString EncodedString::fromView(std::string_view encoding) {
    if (encoding.empty()) {
        return EncodedString();
    }
    EncodedString s(static_cast<int32_t>(encoding.size()));
    std::memcpy(s.data(), encoding.data(), encoding.size());
    return s;
}

} // namespace objcx
