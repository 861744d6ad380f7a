#ifndef SRC_OBJCX_CLASS_DUMP_JSON_HPP_
#define SRC_OBJCX_CLASS_DUMP_JSON_HPP_

#include "objcx/EncodedString.hpp"
#include "objcx/library/Class.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace objcx {

// Builds a JSON document describing runtime classes and type encodings. Output is available through the json()
// accessor after dump() is called, which avoids copying the buffer.
class ClassDumpJSON {
public:
    ClassDumpJSON();
    ~ClassDumpJSON();

    // Adds |cls| and its superclass chain, metaclass, instance size, and properties under "classes".
    void addClass(library::Class cls);
    // Adds |typeName| under "encodings". A nil |encoding| is recorded as null.
    void addEncoding(const std::string& typeName, const EncodedString& encoding);

    void dump(bool prettyPrint);

    std::string_view json() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace objcx

#endif // SRC_OBJCX_CLASS_DUMP_JSON_HPP_
