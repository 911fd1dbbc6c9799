#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

// Output did not match the requested shape. Recovered by the completion
// retry loop; never escapes it.
struct SchemaViolation : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A named JSON Schema handed to the model and checked against its output.
struct ResponseSchema {
    std::string name;
    nlohmann::json schema;
};

// Checks the subset of JSON Schema used for structured output: type,
// properties, required, items, enum, additionalProperties=false.
// Returns one message per violation, each prefixed with its JSON path.
std::vector<std::string> schema_errors(const nlohmann::json& value, const nlohmann::json& schema,
                                       const std::string& path = "$");

// Parses a model reply as JSON, tolerating ```json fences and leading prose.
// Throws SchemaViolation when no JSON object can be read.
nlohmann::json parse_model_json(const std::string& raw);
