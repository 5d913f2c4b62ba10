#ifndef OBJSTORE_STORE_ERROR_HPP
#define OBJSTORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace objstore::store {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// Storage directory missing or unusable at startup
class ConfigurationError : public StoreError {
public:
    explicit ConfigurationError(const std::string& message)
        : StoreError("Configuration error: " + message) {}
};

// Corrupt or truncated record found while parsing a bucket file
class FormatError : public StoreError {
public:
    explicit FormatError(const std::string& message)
        : StoreError("Format error: " + message)
        , detail_(message) {}

    // Message without the category prefix
    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

// Open, read, write, rename or remove failure during an operation
class IOError : public StoreError {
public:
    explicit IOError(const std::string& message)
        : StoreError("I/O error: " + message) {}
};

class InvalidIdentifierError : public StoreError {
public:
    explicit InvalidIdentifierError(const std::string& message)
        : StoreError("Invalid identifier: " + message) {}
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_ERROR_HPP
