/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Provides consistent exception types for the backend and the token tool
 *
 * @date 2026-03-24
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all PTET exceptions
 */
class PtetException : public std::runtime_error {
public:
    explicit PtetException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Database operation failed
 */
class DatabaseException : public PtetException {
public:
    explicit DatabaseException(const std::string& message)
        : PtetException("Database error: " + message) {}
};

/**
 * @brief Configuration error (command line, environment)
 */
class ConfigException : public PtetException {
public:
    explicit ConfigException(const std::string& message)
        : PtetException("Configuration error: " + message) {}
};

/**
 * @brief Key store or key cache operation failed
 *
 * The message is kept verbatim ("Key already exists", "Public key file not found")
 * because the token tool prints it to the operator.
 */
class KeyStoreException : public PtetException {
public:
    explicit KeyStoreException(const std::string& message)
        : PtetException(message) {}
};

/**
 * @brief JWT production or verification failed
 */
class TokenException : public PtetException {
public:
    explicit TokenException(const std::string& message)
        : PtetException(message) {}
};

// --- Domain errors raised by repositories and models ---

/**
 * @brief Entity does not exist, is deleted, or belongs to another user
 */
class NotFoundException : public PtetException {
public:
    NotFoundException()
        : PtetException("Not found") {}
    explicit NotFoundException(const std::string& message)
        : PtetException(message) {}
};

/**
 * @brief Request payload could not be interpreted
 */
class DeserializationException : public PtetException {
public:
    explicit DeserializationException(const std::string& message)
        : PtetException(message) {}
};

/**
 * @brief Inconsistent stored state detected while building a response
 */
class InternalException : public PtetException {
public:
    explicit InternalException(const std::string& message)
        : PtetException(message) {}
};

} // namespace common
