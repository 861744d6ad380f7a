#include "objcx/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace objcx {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(ErrorKind kind, const std::string& message) {
    if (!m_suppress) {
        if (kind == ErrorKind::kInvariantViolation || kind == ErrorKind::kLengthMismatch) {
            spdlog::critical(message);
        } else {
            spdlog::error(message);
        }
    }
    m_errors.emplace_back(Error{kind, message});
}

size_t ErrorReporter::countOf(ErrorKind kind) const {
    return static_cast<size_t>(
        std::count_if(m_errors.begin(), m_errors.end(), [kind](const Error& e) { return e.kind == kind; }));
}

} // namespace objcx
