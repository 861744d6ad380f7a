#include "objcx/ClassDumpJSON.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

namespace objcx {

class ClassDumpJSON::Impl {
public:
    Impl() {
        m_doc.SetObject();
        auto& alloc = m_doc.GetAllocator();
        m_doc.AddMember("classes", rapidjson::Value(rapidjson::kArrayType), alloc);
        m_doc.AddMember("encodings", rapidjson::Value(rapidjson::kObjectType), alloc);
    }
    ~Impl() = default;

    void addClass(library::Class cls) {
        auto& alloc = m_doc.GetAllocator();
        rapidjson::Value value;
        encodeClass(cls, value);

        if (cls) {
            rapidjson::Value superclasses(rapidjson::kArrayType);
            for (auto super = cls.superclass(); super; super = super.superclass()) {
                superclasses.PushBack(makeString(super.name()), alloc);
            }
            value.AddMember("superclasses", superclasses, alloc);

            rapidjson::Value metaClass;
            encodeClass(cls.metaClass(), metaClass);
            value.AddMember("metaClass", metaClass, alloc);
        }

        m_doc["classes"].PushBack(value, alloc);
    }

    void addEncoding(const std::string& typeName, const EncodedString& encoding) {
        auto& alloc = m_doc.GetAllocator();
        rapidjson::Value value;
        if (encoding) {
            value = makeString(encoding.view());
        }
        auto name = makeString(typeName);
        m_doc["encodings"].AddMember(name, value, alloc);
    }

    void dump(bool prettyPrint) {
        m_buffer.Clear();
        bool result = false;
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        }
        if (!result) {
            SPDLOG_ERROR("Failed to serialize class dump to JSON.");
        }
    }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }

private:
    rapidjson::Document m_doc;
    rapidjson::StringBuffer m_buffer;

    rapidjson::Value makeString(std::string_view s) {
        rapidjson::Value value;
        value.SetString(s.data(), static_cast<rapidjson::SizeType>(s.size()), m_doc.GetAllocator());
        return value;
    }

    void encodeClass(library::Class cls, rapidjson::Value& value) {
        if (!cls) {
            value.SetNull();
            return;
        }
        auto& alloc = m_doc.GetAllocator();
        value.SetObject();
        value.AddMember("name", makeString(cls.name()), alloc);
        value.AddMember("isMetaClass", cls.isMetaClass(), alloc);
        value.AddMember("instanceSize", static_cast<uint64_t>(cls.instanceSize()), alloc);

        rapidjson::Value properties(rapidjson::kArrayType);
        for (const auto& property : cls.copyPropertyList()) {
            rapidjson::Value entry(rapidjson::kObjectType);
            entry.AddMember("name", makeString(property.name()), alloc);
            entry.AddMember("attributes", makeString(property.attributes()), alloc);
            properties.PushBack(entry, alloc);
        }
        value.AddMember("properties", properties, alloc);
    }
};

ClassDumpJSON::ClassDumpJSON(): m_impl(std::make_unique<Impl>()) { }

ClassDumpJSON::~ClassDumpJSON() { }

void ClassDumpJSON::addClass(library::Class cls) { m_impl->addClass(cls); }

void ClassDumpJSON::addEncoding(const std::string& typeName, const EncodedString& encoding) {
    m_impl->addEncoding(typeName, encoding);
}

void ClassDumpJSON::dump(bool prettyPrint) { m_impl->dump(prettyPrint); }

std::string_view ClassDumpJSON::json() const { return m_impl->json(); }

} // namespace objcx
