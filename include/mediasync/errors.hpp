#pragma once

#include <stdexcept>
#include <string>

namespace mediasync {

// Base class for all mediasync exceptions
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Requested file, entry or provider does not exist
class NotFoundError : public Error {
public:
    using Error::Error;
};

// Optional capability that this backend does not provide (e.g. upload on a read-only backend)
class NotSupportedError : public Error {
public:
    using Error::Error;
};

// Backend kind is declared but has no implementation yet
class NotImplementedError : public Error {
public:
    using Error::Error;
};

// Path resolved outside the sandboxed root
class AccessDeniedError : public Error {
public:
    using Error::Error;
};

// Cooperative cancellation observed via std::stop_token
class OperationCancelled : public Error {
public:
    OperationCancelled() : Error("Operation was cancelled") {}
    using Error::Error;
};

}  // namespace mediasync
