#include "staged/store/ledger_codec.hpp"
#include "staged/domain/errors.hpp"
#include "staged/ledger/position_ledger.hpp"

#include <cmath>
#include <string>

namespace staged {
namespace store {

namespace {

using nlohmann::json;

template <typename T>
T required(const json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key)) {
    throw CorruptState(std::string("missing key '") + key + "'");
  }
  return obj.at(key).get<T>();
}

void checkSchema(const json& doc) {
  if (!doc.is_object()) {
    throw CorruptState("document is not a JSON object");
  }
  const int version = required<int>(doc, "schema");
  if (version != kDocumentSchemaVersion) {
    throw CorruptState("unsupported schema version " +
                       std::to_string(version));
  }
}

json sellToJson(const domain::SellRecord& r) {
  return json{{"timestamp_ms", r.timestamp_ms},
              {"quantity", r.quantity},
              {"price", r.price},
              {"realized_pnl", r.realized_pnl},
              {"reason", r.reason}};
}

domain::SellRecord sellFromJson(const json& j) {
  domain::SellRecord r;
  r.timestamp_ms = required<std::int64_t>(j, "timestamp_ms");
  r.quantity = required<std::int64_t>(j, "quantity");
  r.price = required<double>(j, "price");
  r.realized_pnl = required<double>(j, "realized_pnl");
  r.reason = required<std::string>(j, "reason");
  return r;
}

json stageToJson(const domain::StageEntry& s) {
  json history = json::array();
  for (const auto& r : s.sell_history) {
    history.push_back(sellToJson(r));
  }
  return json{{"stage_number", s.stage_number},
              {"entry_price", s.entry_price},
              {"entry_quantity", s.entry_quantity},
              {"remaining_quantity", s.remaining_quantity},
              {"entry_timestamp_ms", s.entry_timestamp_ms},
              {"is_open", s.is_open},
              {"sell_history", std::move(history)},
              {"last_close_timestamp_ms", s.last_close_timestamp_ms},
              {"last_close_price", s.last_close_price},
              {"last_close_reason", s.last_close_reason}};
}

domain::StageEntry stageFromJson(const json& j) {
  domain::StageEntry s;
  s.stage_number = required<int>(j, "stage_number");
  s.entry_price = required<double>(j, "entry_price");
  s.entry_quantity = required<std::int64_t>(j, "entry_quantity");
  s.remaining_quantity = required<std::int64_t>(j, "remaining_quantity");
  s.entry_timestamp_ms = required<std::int64_t>(j, "entry_timestamp_ms");
  s.is_open = required<bool>(j, "is_open");
  const json& history = j.at("sell_history");
  if (!history.is_array()) {
    throw CorruptState("sell_history is not an array");
  }
  for (const auto& r : history) {
    s.sell_history.push_back(sellFromJson(r));
  }
  s.last_close_timestamp_ms = required<std::int64_t>(j, "last_close_timestamp_ms");
  s.last_close_price = required<double>(j, "last_close_price");
  s.last_close_reason = required<std::string>(j, "last_close_reason");
  return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// InstrumentLedger
// -----------------------------------------------------------------------------
json ledgerToJson(const domain::InstrumentLedger& ledger) {
  json stages = json::array();
  for (const auto& s : ledger.stages) {
    stages.push_back(stageToJson(s));
  }

  // Keys are stage numbers as strings; JSON objects have string keys only.
  json drops = json::object();
  for (const auto& [stage, requirement] : ledger.drop_requirements) {
    drops[std::to_string(stage)] = requirement;
  }

  return json{{"schema", kDocumentSchemaVersion},
              {"instrument",
               {{"code", ledger.instrument.code},
                {"name", ledger.instrument.name},
                {"sector", ledger.instrument.sector}}},
              {"realized_pnl", ledger.realized_pnl},
              {"stages", std::move(stages)},
              {"drop_requirements", std::move(drops)}};
}

domain::InstrumentLedger ledgerFromJson(const json& doc) {
  domain::InstrumentLedger ledger;
  try {
    checkSchema(doc);

    const json& instrument = doc.at("instrument");
    ledger.instrument.code = required<std::string>(instrument, "code");
    ledger.instrument.name = required<std::string>(instrument, "name");
    ledger.instrument.sector = required<std::string>(instrument, "sector");
    ledger.realized_pnl = required<double>(doc, "realized_pnl");

    const json& stages = doc.at("stages");
    if (!stages.is_array()) {
      throw CorruptState("stages is not an array");
    }
    for (const auto& s : stages) {
      ledger.stages.push_back(stageFromJson(s));
    }

    if (doc.contains("drop_requirements")) {
      for (const auto& [key, value] : doc.at("drop_requirements").items()) {
        ledger.drop_requirements[std::stoi(key)] = value.get<double>();
      }
    }
  } catch (const CorruptState&) {
    throw;
  } catch (const json::exception& e) {
    throw CorruptState(std::string("malformed ledger document: ") + e.what());
  } catch (const std::logic_error& e) {
    // std::stoi on a non-numeric drop_requirements key.
    throw CorruptState(std::string("malformed ledger document: ") + e.what());
  }

  validateLedger(ledger);
  return ledger;
}

void validateLedger(const domain::InstrumentLedger& ledger) {
  if (auto violation = ledger::checkInvariants(ledger)) {
    throw CorruptState(
        (ledger.instrument.code.empty() ? std::string("<no code>")
                                        : ledger.instrument.code) +
        ": " + *violation);
  }
}

// -----------------------------------------------------------------------------
// BudgetState
// -----------------------------------------------------------------------------
json budgetStateToJson(const domain::BudgetState& state) {
  json window = json::array();
  for (const auto& sample : state.performance_window) {
    window.push_back(
        {{"timestamp_ms", sample.timestamp_ms}, {"equity", sample.equity}});
  }
  return json{{"schema", kDocumentSchemaVersion},
              {"initial_budget", state.initial_budget},
              {"effective_budget", state.effective_budget},
              {"cumulative_realized_pnl", state.cumulative_realized_pnl},
              {"performance_window", std::move(window)}};
}

domain::BudgetState budgetStateFromJson(const json& doc) {
  domain::BudgetState state;
  try {
    checkSchema(doc);
    state.initial_budget = required<double>(doc, "initial_budget");
    state.effective_budget = required<double>(doc, "effective_budget");
    state.cumulative_realized_pnl =
        required<double>(doc, "cumulative_realized_pnl");

    const json& window = doc.at("performance_window");
    if (!window.is_array()) {
      throw CorruptState("performance_window is not an array");
    }
    std::int64_t previous = 0;
    for (const auto& j : window) {
      domain::EquitySample sample;
      sample.timestamp_ms = required<std::int64_t>(j, "timestamp_ms");
      sample.equity = required<double>(j, "equity");
      if (sample.timestamp_ms < previous) {
        throw CorruptState("performance_window is not ordered by time");
      }
      previous = sample.timestamp_ms;
      state.performance_window.push_back(sample);
    }
  } catch (const CorruptState&) {
    throw;
  } catch (const json::exception& e) {
    throw CorruptState(std::string("malformed budget document: ") + e.what());
  }

  if (!std::isfinite(state.initial_budget) ||
      !std::isfinite(state.effective_budget) || state.initial_budget < 0.0 ||
      state.effective_budget < 0.0) {
    throw CorruptState("budget document holds an invalid budget");
  }
  return state;
}

}  // namespace store
}  // namespace staged
