#pragma once
// Errors.hpp – Exception taxonomy shared by loaders, generators and aggregation.

#include <stdexcept>
#include <string>

namespace tba3 {

// Base class for every error raised by this library.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown at load time when configuration or booklet metadata violates a
// schema rule (duplicate ids, broken range tables, bad probabilities …).
// Fatal to startup.
class ConfigValidationError : public Error {
public:
    using Error::Error;
};

// Thrown per request for an unknown group / school / state / booklet id.
class NotFoundError : public Error {
public:
    using Error::Error;
};

// Thrown before any computation when an input cannot be used
// (empty booklet, malformed student table, population < 1).
class ComputationPrecondition : public Error {
public:
    using Error::Error;
};

// Thrown when a raw score falls outside every competence-level range.
// Only reachable for tables that bypassed catalog validation.
class IntegrityError : public Error {
public:
    using Error::Error;
};

} // namespace tba3
