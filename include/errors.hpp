#pragma once

#include <stdexcept>
#include <string>

namespace dp {

// Precondition violations raised by the round manager. None are retried internally.
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RoundNotFoundError : public EngineError {
public:
    using EngineError::EngineError;
};

class BidNotFoundError : public EngineError {
public:
    using EngineError::EngineError;
};

class RoundAlreadyActiveError : public EngineError {
public:
    using EngineError::EngineError;
};

class InvalidRoundStateError : public EngineError {
public:
    using EngineError::EngineError;
};

class BelowMinimumStakeError : public EngineError {
public:
    using EngineError::EngineError;
};

class InvalidDiceValueError : public EngineError {
public:
    using EngineError::EngineError;
};

class InsufficientBalanceError : public EngineError {
public:
    using EngineError::EngineError;
};

class UnauthorizedError : public EngineError {
public:
    using EngineError::EngineError;
};

// The payment gateway rejected a batch; the enclosing operation left no trace.
class PaymentFailedError : public EngineError {
public:
    using EngineError::EngineError;
};

class InvalidConfigurationError : public EngineError {
public:
    using EngineError::EngineError;
};

} // namespace dp
