#pragma once

#include <cstdint>
#include <string>

namespace staged {

/// Point-in-time valuation of one instrument. How it is computed is outside
/// the engine; it is trusted as given.
struct FairValueSignal {
  double fair_value{0.0};
  double confidence{1.0};  // [0, 1]
  std::int64_t timestamp_ms{0};
};

class IValuationSource {
 public:
  virtual ~IValuationSource() = default;

  /// @throws Unavailable when no signal exists for `code`.
  virtual FairValueSignal fairValueSignal(const std::string& code) = 0;
};

}  // namespace staged
