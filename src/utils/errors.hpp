#pragma once

#include <stdexcept>
#include <string>

namespace courier {

// Base for every failure that can happen while delivering one message.
// Retryable() decides whether the retry executor spends another attempt on it.
class DeliveryError : public std::runtime_error {
public:
    DeliveryError(const std::string& message, bool retryable)
        : std::runtime_error(message)
        , retryable_(retryable) {}

    bool Retryable() const { return retryable_; }

private:
    bool retryable_ = false;
};

class TransientError : public DeliveryError {
public:
    explicit TransientError(const std::string& message)
        : DeliveryError(message, true) {}
};

class PermanentError : public DeliveryError {
public:
    explicit PermanentError(const std::string& message)
        : DeliveryError(message, false) {}
};

class ValidationError : public PermanentError {
public:
    explicit ValidationError(const std::string& message)
        : PermanentError(message) {}
};

class ResolutionNotFoundError : public PermanentError {
public:
    explicit ResolutionNotFoundError(const std::string& message)
        : PermanentError(message) {}
};

class StoreUnavailableError : public std::runtime_error {
public:
    explicit StoreUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

class EventLogError : public std::runtime_error {
public:
    explicit EventLogError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace courier
