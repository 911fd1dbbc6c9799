#pragma once
#include <stdexcept>
#include <string>
#include <utility>

struct RagError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed record or delete selector. Raised before anything is written.
struct ValidationError : RagError {
    using RagError::RagError;
};

// Existing table is incompatible with the configured one.
struct SchemaError : RagError {
    using RagError::RagError;
};

struct IndexAlreadyExists : RagError {
    using RagError::RagError;
};

// Transport, auth or response-shape failure from an embedding or chat provider.
struct ProviderError : RagError {
    using RagError::RagError;
};

// Completion output never matched the requested schema.
struct SchemaValidationError : RagError {
    SchemaValidationError(const std::string& msg, int attempts, std::string last_output)
        : RagError(msg), attempts(attempts), last_output(std::move(last_output)) {}
    int attempts{0};
    std::string last_output;
};

struct InvalidArgument : RagError {
    using RagError::RagError;
};

struct UnsupportedProvider : RagError {
    using RagError::RagError;
};

struct DeadlineExceeded : RagError {
    using RagError::RagError;
};

// SQLite failure that is not the caller's fault.
struct StoreError : RagError {
    using RagError::RagError;
};
