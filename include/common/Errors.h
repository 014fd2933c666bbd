#pragma once

#include <stdexcept>
#include <string>

namespace stratopt {

class StratOptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed parameter declarations; raised before any trial runs.
class InvalidSpaceError : public StratOptError {
public:
    using StratOptError::StratOptError;
};

// Thrown by evaluators. Never escapes the trial adapter.
class EvaluationError : public StratOptError {
public:
    using StratOptError::StratOptError;
};

// A search finished without a single successful trial.
class NoViableResultError : public StratOptError {
public:
    using StratOptError::StratOptError;
};

class NotFoundError : public StratOptError {
public:
    using StratOptError::StratOptError;
};

class InvalidArgumentError : public StratOptError {
public:
    using StratOptError::StratOptError;
};

class StorageError : public StratOptError {
public:
    using StratOptError::StratOptError;
};

} // namespace stratopt
