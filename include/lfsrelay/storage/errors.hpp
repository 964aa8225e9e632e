#pragma once

#include <stdexcept>
#include <string>

namespace lfsrelay::storage {

// Base class for every failure raised by a storage operation.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// URL prefix not handled by any backend (or by the backend it was given to).
class UnsupportedProtocolError : public StorageError {
public:
    explicit UnsupportedProtocolError(const std::string& backend)
        : StorageError(backend + ": unsupported protocol") {}
};

// Backend recognized but its configuration is disabled or incomplete.
class ConfigurationError : public StorageError {
public:
    using StorageError::StorageError;
};

// URL has the right prefix but cannot be parsed (e.g. no bucket/host).
class InvalidAddressError : public StorageError {
public:
    explicit InvalidAddressError(const std::string& backend)
        : StorageError(backend + ": invalid URL") {}
    InvalidAddressError(const std::string& backend, const std::string& url)
        : StorageError(backend + ": invalid URL \"" + url + "\"") {}
};

// Stat found zero, or more than one, entry where exactly one was expected.
class NotFoundError : public StorageError {
public:
    using StorageError::StorageError;
};

// Transport or protocol failure reported by the remote end. The only
// error class the retry decorator treats as transient.
class BackendError : public StorageError {
public:
    using StorageError::StorageError;
};

// The governing Context was cancelled or its deadline passed.
class CancellationError : public StorageError {
public:
    using StorageError::StorageError;
};

}  // namespace lfsrelay::storage
