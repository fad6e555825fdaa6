#pragma once

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <memory>
#include <string>

namespace study_planner {

using JsonDocument = rapidjson::Document;
using JsonValue = rapidjson::Value;
using JsonAllocator = rapidjson::MemoryPoolAllocator<>;

// Builds one RapidJSON document for fast schedule output.
class JsonBuilder {
public:
    JsonBuilder() : doc_(std::make_unique<JsonDocument>()) {
        doc_->SetObject();
    }

    JsonDocument* document() { return doc_.get(); }
    JsonAllocator& allocator() { return doc_->GetAllocator(); }

    JsonValue string_value(const std::string& text) {
        JsonValue value;
        value.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.length()), allocator());
        return value;
    }

    void add_member(JsonValue& object, const std::string& key, JsonValue value) {
        object.AddMember(string_value(key), value, allocator());
    }

    void add_string(JsonValue& object, const std::string& key, const std::string& text) {
        add_member(object, key, string_value(text));
    }

    void add_number(JsonValue& object, const std::string& key, double number) {
        add_member(object, key, JsonValue(number));
    }

    void add_int(JsonValue& object, const std::string& key, int number) {
        add_member(object, key, JsonValue(number));
    }

    std::string serialize(bool pretty = false) const {
        rapidjson::StringBuffer buffer;

        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            doc_->Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            doc_->Accept(writer);
        }

        return std::string(buffer.GetString(), buffer.GetSize());
    }

private:
    std::unique_ptr<JsonDocument> doc_;
};

} // namespace study_planner
