#pragma once

#include <string>
#include <string_view>

enum class RpcErrorKind {
    Connection,      // Dial failed after the retry budget
    Io,              // Write/read failed mid-call, connection torn down
    Protocol,        // Bad frame or undecodable payload
    Application,     // Backend answered with a non-empty "error"
    Timeout,         // Write/read deadline elapsed
    InvalidArgument, // Rejected before any I/O
    Cancelled,       // Stop requested before the call started
};

struct RpcError {
    RpcErrorKind kind;
    std::string message;

    static RpcError connection(std::string msg) { return {RpcErrorKind::Connection, std::move(msg)}; }
    static RpcError io(std::string msg) { return {RpcErrorKind::Io, std::move(msg)}; }
    static RpcError protocol(std::string msg) { return {RpcErrorKind::Protocol, std::move(msg)}; }
    static RpcError application(std::string msg) { return {RpcErrorKind::Application, std::move(msg)}; }
    static RpcError timeout(std::string msg) { return {RpcErrorKind::Timeout, std::move(msg)}; }
    static RpcError invalid_argument(std::string msg) { return {RpcErrorKind::InvalidArgument, std::move(msg)}; }
    static RpcError cancelled() { return {RpcErrorKind::Cancelled, "call cancelled"}; }
};

inline std::string_view to_string(RpcErrorKind kind) {
    switch (kind) {
        case RpcErrorKind::Connection: return "connection";
        case RpcErrorKind::Io: return "io";
        case RpcErrorKind::Protocol: return "protocol";
        case RpcErrorKind::Application: return "application";
        case RpcErrorKind::Timeout: return "timeout";
        case RpcErrorKind::InvalidArgument: return "invalid_argument";
        case RpcErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}
