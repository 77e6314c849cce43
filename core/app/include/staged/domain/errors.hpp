#pragma once

#include <stdexcept>
#include <string>

namespace staged {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception hierarchy shared by every component of the engine.
//
// @details
// All engine failures derive from EngineError so the orchestrator can catch
// the whole family at an instrument boundary while still switching on the
// concrete type where the handling differs:
//
//   CorruptState         persisted document failed structural validation
//                        and no valid backup could replace it.
//   PersistenceError     the write path failed; prior durable state stands.
//   CapacityExceeded     every stage slot of a ledger already holds an open
//                        stage.
//   InsufficientQuantity a partial close asked for more than remains.
//   UnknownStage         no open stage with the requested number.
//   Unavailable          a collaborator could not produce a price/signal.
//   OrderTimeout         order placement exceeded its bound.
//   OrderRejected        the broker refused the order.
//   ConfigError          configuration failed validation.
//
// Ledger invariant errors (CapacityExceeded, InsufficientQuantity,
// UnknownStage) are isolated to one instrument for one cycle. Collaborator
// errors mean "no decision this cycle". Only CorruptState at startup stops
// the process.
// -----------------------------------------------------------------------------
class EngineError : public std::runtime_error {
 public:
  explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

class CorruptState : public EngineError {
 public:
  using EngineError::EngineError;
};

class PersistenceError : public EngineError {
 public:
  using EngineError::EngineError;
};

class CapacityExceeded : public EngineError {
 public:
  using EngineError::EngineError;
};

class InsufficientQuantity : public EngineError {
 public:
  using EngineError::EngineError;
};

class UnknownStage : public EngineError {
 public:
  using EngineError::EngineError;
};

class Unavailable : public EngineError {
 public:
  using EngineError::EngineError;
};

class OrderTimeout : public EngineError {
 public:
  using EngineError::EngineError;
};

class OrderRejected : public EngineError {
 public:
  using EngineError::EngineError;
};

class ConfigError : public EngineError {
 public:
  using EngineError::EngineError;
};

}  // namespace staged
