#ifndef SRC_OBJCX_LIBRARY_HANDLE_HPP_
#define SRC_OBJCX_LIBRARY_HANDLE_HPP_

#include <functional>

namespace objcx { namespace library {

// Handle wraps a raw pointer into the Objective-C runtime. It uses the Curious Recurring Template Pattern, or CRTP, so
// that each derived handle only compares equal to handles of the same type. Handles never own what they point at, the
// runtime manages classes, selectors, methods, and properties for the life of the process. A default-constructed
// handle is nil, and every derived handle must behave sensibly when nil.
template <typename T, typename R> class Handle {
public:
    Handle(): m_raw(nullptr) { }
    explicit Handle(R raw): m_raw(raw) { }
    Handle(const Handle& h): m_raw(h.m_raw) { }
    Handle& operator=(const Handle& h) {
        m_raw = h.m_raw;
        return *this;
    }
    ~Handle() { }

    inline R raw() const { return m_raw; }
    inline bool isNil() const { return m_raw == nullptr; }
    explicit inline operator bool() const { return m_raw != nullptr; }

    inline bool operator==(const T& h) const { return m_raw == h.m_raw; }
    inline bool operator!=(const T& h) const { return m_raw != h.m_raw; }

protected:
    R m_raw;
};

} // namespace library
} // namespace objcx

#endif // SRC_OBJCX_LIBRARY_HANDLE_HPP_
