#include "../include/schema.hpp"
#include "../include/util.hpp"
#include <algorithm>

using json = nlohmann::json;

static bool type_matches(const json& v, const std::string& type) {
    if (type == "object") return v.is_object();
    if (type == "array") return v.is_array();
    if (type == "string") return v.is_string();
    if (type == "integer") return v.is_number_integer();
    if (type == "number") return v.is_number();
    if (type == "boolean") return v.is_boolean();
    if (type == "null") return v.is_null();
    return true;
}

std::vector<std::string> schema_errors(const json& value, const json& schema, const std::string& path) {
    std::vector<std::string> errors;
    if (!schema.is_object()) return errors;

    if (schema.contains("type")) {
        const auto& t = schema["type"];
        bool ok = false;
        if (t.is_string()) ok = type_matches(value, t.get<std::string>());
        else if (t.is_array()) ok = std::any_of(t.begin(), t.end(), [&](const json& x){ return x.is_string() && type_matches(value, x.get<std::string>()); });
        if (!ok) {
            errors.push_back(path + ": expected " + t.dump() + ", got " + value.type_name());
            return errors;
        }
    }
    if (schema.contains("enum") && schema["enum"].is_array()) {
        const auto& options = schema["enum"];
        if (std::find(options.begin(), options.end(), value) == options.end()) {
            errors.push_back(path + ": " + value.dump() + " is not one of " + options.dump());
        }
    }
    if (value.is_object()) {
        if (schema.contains("required")) {
            for (const auto& r : schema["required"]) {
                if (r.is_string() && !value.contains(r.get<std::string>())) {
                    errors.push_back(path + ": missing required field '" + r.get<std::string>() + "'");
                }
            }
        }
        const json props = schema.value("properties", json::object());
        for (auto it = value.begin(); it != value.end(); ++it) {
            auto p = props.find(it.key());
            if (p != props.end()) {
                auto sub = schema_errors(it.value(), *p, path + "." + it.key());
                errors.insert(errors.end(), sub.begin(), sub.end());
            } else if (schema.contains("additionalProperties") && schema["additionalProperties"] == false) {
                errors.push_back(path + ": unexpected field '" + it.key() + "'");
            }
        }
    }
    if (value.is_array() && schema.contains("items")) {
        for (size_t i = 0; i < value.size(); ++i) {
            auto sub = schema_errors(value[i], schema["items"], path + "[" + std::to_string(i) + "]");
            errors.insert(errors.end(), sub.begin(), sub.end());
        }
    }
    return errors;
}

json parse_model_json(const std::string& raw) {
    std::string text = trim(raw);
    if (text.rfind("```", 0) == 0) {
        auto nl = text.find('\n');
        auto close = text.rfind("```");
        if (nl != std::string::npos && close != std::string::npos && close > nl) {
            text = trim(text.substr(nl + 1, close - nl - 1));
        }
    }
    auto j = json::parse(text, nullptr, false);
    if (!j.is_discarded()) return j;

    auto open = text.find('{');
    auto close = text.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        j = json::parse(text.substr(open, close - open + 1), nullptr, false);
        if (!j.is_discarded()) return j;
    }
    throw SchemaViolation("output is not valid JSON");
}
