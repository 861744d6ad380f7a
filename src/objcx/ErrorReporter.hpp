#ifndef SRC_OBJCX_ERROR_REPORTER_HPP_
#define SRC_OBJCX_ERROR_REPORTER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace objcx {

enum ErrorKind : std::int32_t {
    // A type shape with no defined encoding, such as a union, bitfield, or function.
    kUnsupportedType = 1,
    // The literal encoder and the size calculator disagreed on the length of an encoding.
    kLengthMismatch = 2,
    // The native runtime returned a value outside of its documented range.
    kInvariantViolation = 3,
    // A native runtime call failed, such as a class pair allocation returning Nil.
    kRuntimeFailure = 4
};

struct Error {
    ErrorKind kind;
    std::string message;
};

// Collects errors from encoding and registration. Every error is also logged, unless constructed with |suppress| set
// to true, which unit tests use to keep expected failures out of the log.
class ErrorReporter {
public:
    explicit ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(ErrorKind kind, const std::string& message);

    size_t errorCount() const { return m_errors.size(); }
    bool hasErrors() const { return !m_errors.empty(); }
    const std::vector<Error>& errors() const { return m_errors; }

    // Returns the number of errors of |kind| reported so far.
    size_t countOf(ErrorKind kind) const;

    void clear() { m_errors.clear(); }

private:
    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace objcx

#endif // SRC_OBJCX_ERROR_REPORTER_HPP_
