#pragma once

#include <cstdint>
#include <string>

namespace staged {
namespace domain {

enum class ExitAction {
  Hold,
  PartialSell,
  StopLoss,
  FullSell,
};

// -----------------------------------------------------------------------------
// ExitDecision — output of the exit/risk engine for one instrument
// -----------------------------------------------------------------------------
// stage_number and quantity are meaningful only when action != Hold.
// -----------------------------------------------------------------------------
struct ExitDecision {
  ExitAction action{ExitAction::Hold};
  int stage_number{0};
  std::int64_t quantity{0};
  std::string reason;
};

const char* exitActionToString(ExitAction action);

}  // namespace domain
}  // namespace staged
