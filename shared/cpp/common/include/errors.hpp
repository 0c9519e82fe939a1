#pragma once
#include <stdexcept>
#include <string>

class CompressError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad input at submit or configuration time.
class ValidationError : public CompressError {
public:
    using CompressError::CompressError;
};

class NotFoundError : public CompressError {
public:
    using CompressError::CompressError;
};

// Operation not legal in the current state.
class InvalidStateError : public CompressError {
public:
    using CompressError::CompressError;
};

// Illegal edge in the job state machine.
class InvalidTransition : public InvalidStateError {
public:
    using InvalidStateError::InvalidStateError;
};

class AlreadyInitializedError : public CompressError {
public:
    using CompressError::CompressError;
};

class EngineError : public CompressError {
public:
    using CompressError::CompressError;
};
