#pragma once
#include <stdexcept>
#include <string>

namespace toolrelay
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// A request did not receive its reply before the deadline
struct RequestTimeoutError : public TransportError
{
    using TransportError::TransportError;
};

/// The peer answered a request with a JSON-RPC error object
struct RpcError : public TransportError
{
    RpcError(int code, const std::string& message) : TransportError(message), code(code) {}

    int code;
};

// Session setup

struct UnsupportedScriptKind : public Error
{
    using Error::Error;
};

struct ProcessLaunchError : public Error
{
    using Error::Error;
};

struct HandshakeError : public Error
{
    using Error::Error;
};

struct SessionClosed : public Error
{
    using Error::Error;
};

// Query processing

struct ToolListingError : public Error
{
    using Error::Error;
};

struct ModelError : public Error
{
    using Error::Error;
};

} // namespace toolrelay
