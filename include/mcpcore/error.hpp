#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpcore {

namespace error {
    constexpr int ParseError        = -32700;
    constexpr int InvalidRequest    = -32600;
    constexpr int MethodNotFound    = -32601;
    constexpr int InvalidParams     = -32602;
    constexpr int InternalError     = -32603;
    constexpr int RequestCancelled  = -32800;

    // Unknown tool or prompt names share the "not found" code with unknown methods.
    constexpr int NotFound          = MethodNotFound;

    // Process-level codes used in the startup error envelope.
    constexpr int MissingDependency = -1;
    constexpr int ServerFailure     = -2;
} // namespace error

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A frame whose payload could not be decoded into a message.
/// `code` is ParseError for invalid JSON and InvalidRequest for valid JSON
/// that is not a JSON-RPC 2.0 message.
class McpParseError : public McpError {
public:
    int code;
    explicit McpParseError(const std::string& msg, int code = error::ParseError)
        : McpError(msg), code(code) {}
};

/// Raised by handlers that want a specific JSON-RPC error in the response.
class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// Message boundaries in the byte stream are corrupt. Fatal to the session.
class FramingError : public McpTransportError {
public:
    using McpTransportError::McpTransportError;
};

/// Missing dependency or failed initialization. Fatal to the process.
class StartupError : public McpError {
public:
    int code;
    explicit StartupError(const std::string& msg, int code = error::MissingDependency)
        : McpError(msg), code(code) {}
};

class NotFoundError : public McpError {
public:
    std::string name;
    NotFoundError(const std::string& kind, const std::string& name)
        : McpError(kind + " not found: " + name), name(name) {}
};

class ValidationError : public McpError {
public:
    std::vector<std::string> problems;
    explicit ValidationError(std::vector<std::string> problems);
};

/// Domain failure raised from inside a tool or prompt handler.
class HandlerError : public McpError {
public:
    using McpError::McpError;
};

class CancelledError : public McpError {
public:
    CancelledError() : McpError("Request cancelled") {}
    using McpError::McpError;
};

class DuplicateNameError : public McpError {
public:
    std::string name;
    DuplicateNameError(const std::string& kind, const std::string& name)
        : McpError(kind + " already registered: " + name), name(name) {}
};

class SchemaError : public McpError {
public:
    using McpError::McpError;
};

class RegistrySealedError : public McpError {
public:
    RegistrySealedError() : McpError("Registry is sealed; register capabilities before serving") {}
};

} // namespace mcpcore
