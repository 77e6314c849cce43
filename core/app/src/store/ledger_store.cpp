#include "staged/store/ledger_store.hpp"
#include "staged/domain/errors.hpp"
#include "staged/ledger/position_ledger.hpp"
#include "staged/store/ledger_codec.hpp"
#include "staged/time/time_utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace staged {
namespace store {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kCurrentFile = "CURRENT";
constexpr const char* kManifestFile = "MANIFEST.json";
constexpr const char* kBudgetFile = "budget_state.json";
constexpr const char* kGenerationPrefix = "gen-";
constexpr const char* kStagingPrefix = "staging-";

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

// Removal failures are logged; cleanup never fails a save.
void removeLogged(const fs::path& path, const char* why) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    std::cerr << "[LedgerStore] WARNING: could not remove " << path << ": "
              << ec.message() << "\n";
  } else {
    std::cout << "[LedgerStore] pruned " << path.filename().string() << " ("
              << why << ")\n";
  }
}

// fsync a file or directory so a rename that follows is ordered after the
// data reaches the disk.
void syncPath(const fs::path& path) {
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw PersistenceError("cannot open for fsync: " + path.string());
  }
  const int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) {
    throw PersistenceError("fsync failed: " + path.string());
  }
}

void writeFile(const fs::path& path, const std::string& content) {
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      throw PersistenceError("cannot open for writing: " + path.string());
    }
    out << content;
    out.flush();
    if (!out.good()) {
      throw PersistenceError("write failed: " + path.string());
    }
  }
  syncPath(path);
}

std::string readFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) {
    throw PersistenceError("cannot open for reading: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

}  // namespace

LedgerStore::LedgerStore(config::StoreConfig config, const ITimeProvider& clock)
    : config_(std::move(config)), clock_(clock), root_(config_.root) {}

// -----------------------------------------------------------------------------
// Generation naming
// -----------------------------------------------------------------------------
std::optional<LedgerStore::GenerationId> LedgerStore::parseGenerationName(
    const std::string& name) {
  if (!startsWith(name, kGenerationPrefix)) {
    return std::nullopt;
  }
  const std::string rest = name.substr(std::string(kGenerationPrefix).size());
  const auto dash = rest.find('-');
  if (dash == std::string::npos || dash == 0 || dash + 1 == rest.size()) {
    return std::nullopt;
  }
  const std::string ts = rest.substr(0, dash);
  const std::string seq = rest.substr(dash + 1);
  auto digits = [](const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
  };
  if (!digits(ts) || !digits(seq)) {
    return std::nullopt;
  }
  try {
    return GenerationId{std::stoll(ts), std::stoll(seq)};
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::string LedgerStore::generationName(const GenerationId& id) {
  return kGenerationPrefix + std::to_string(id.timestamp_ms) + "-" +
         std::to_string(id.seq);
}

bool LedgerStore::olderThan(const GenerationId& a, const GenerationId& b) {
  if (a.timestamp_ms != b.timestamp_ms) {
    return a.timestamp_ms < b.timestamp_ms;
  }
  return a.seq < b.seq;
}

std::vector<std::string> LedgerStore::listGenerations() const {
  std::vector<std::pair<GenerationId, std::string>> found;
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    return {};
  }
  for (const auto& entry : fs::directory_iterator(root_, ec)) {
    if (!entry.is_directory(ec)) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    if (auto id = parseGenerationName(name)) {
      found.emplace_back(*id, name);
    }
  }
  std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
    return olderThan(a.first, b.first);
  });

  std::vector<std::string> names;
  names.reserve(found.size());
  for (auto& f : found) {
    names.push_back(std::move(f.second));
  }
  return names;
}

std::optional<std::string> LedgerStore::currentGeneration() const {
  const fs::path pointer = root_ / kCurrentFile;
  std::error_code ec;
  if (!fs::is_regular_file(pointer, ec)) {
    return std::nullopt;
  }
  std::string name = readFile(pointer);
  name.erase(std::remove_if(name.begin(), name.end(),
                            [](char c) { return c == '\n' || c == '\r' || c == ' '; }),
             name.end());
  if (!parseGenerationName(name)) {
    throw CorruptState("CURRENT does not name a generation: '" + name + "'");
  }
  return name;
}

LedgerStore::GenerationId LedgerStore::nextGenerationId() const {
  GenerationId id{clock_.now_ms(), 0};
  const auto generations = listGenerations();
  if (!generations.empty()) {
    const auto newest = parseGenerationName(generations.back());
    if (newest && !olderThan(*newest, id)) {
      id = GenerationId{newest->timestamp_ms, newest->seq + 1};
    }
  }
  std::error_code ec;
  while (fs::exists(root_ / generationName(id), ec) ||
         fs::exists(root_ / (kStagingPrefix + generationName(id)), ec)) {
    ++id.seq;
  }
  return id;
}

std::optional<std::vector<std::string>> LedgerStore::readManifest(
    const std::string& generation) const {
  const fs::path path = root_ / generation / kManifestFile;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  try {
    const json doc = json::parse(readFile(path));
    return doc.at("documents").get<std::vector<std::string>>();
  } catch (const std::exception& e) {
    std::cerr << "[LedgerStore] WARNING: unreadable manifest in " << generation
              << ": " << e.what() << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// load
// -----------------------------------------------------------------------------
std::optional<domain::InstrumentLedger> LedgerStore::readLedger(
    const fs::path& doc, const std::string& code) const {
  try {
    domain::InstrumentLedger ledger = ledgerFromJson(json::parse(readFile(doc)));
    if (ledger.instrument.code != code) {
      std::cerr << "[LedgerStore] WARNING: " << doc << " holds code '"
                << ledger.instrument.code << "', expected '" << code << "'\n";
      return std::nullopt;
    }
    return ledger;
  } catch (const std::exception& e) {
    std::cerr << "[LedgerStore] WARNING: invalid document " << doc << ": "
              << e.what() << "\n";
    return std::nullopt;
  }
}

domain::InstrumentLedger LedgerStore::recoverFromBackups(
    const std::string& code, const std::string& current_generation) const {
  const auto current_id = parseGenerationName(current_generation);
  auto generations = listGenerations();
  std::reverse(generations.begin(), generations.end());

  for (const auto& generation : generations) {
    const auto id = parseGenerationName(generation);
    if (!id || !current_id || !olderThan(*id, *current_id)) {
      continue;
    }
    const fs::path doc = root_ / generation / (code + ".json");
    std::error_code ec;
    if (!fs::is_regular_file(doc, ec)) {
      continue;
    }
    if (auto ledger = readLedger(doc, code)) {
      std::cerr << "[LedgerStore] RECOVERED " << code << " from backup "
                << generation << "\n";
      return *ledger;
    }
  }
  throw CorruptState(code + ": persisted ledger is invalid and no valid "
                            "backup exists");
}

domain::LedgerMap LedgerStore::load(
    const std::vector<domain::Instrument>& instruments) {
  domain::LedgerMap result;
  for (const auto& instrument : instruments) {
    result[instrument.code] = ledger::emptyLedger(instrument);
  }

  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    std::cout << "[LedgerStore] no store at " << root_
              << "; starting with empty ledgers\n";
    return result;
  }

  const auto current = currentGeneration();
  if (!current) {
    if (!listGenerations().empty()) {
      std::cerr << "[LedgerStore] WARNING: generations present but no "
                << kCurrentFile << "; starting with empty ledgers\n";
    }
    return result;
  }

  // The base generation is the one CURRENT names, unless it is incomplete;
  // then the newest older complete generation stands in for it.
  std::string base = *current;
  auto manifest = readManifest(base);
  if (!manifest) {
    std::cerr << "[LedgerStore] WARNING: current generation " << base
              << " is incomplete; falling back to the previous generation\n";
    const auto current_id = parseGenerationName(*current);
    auto generations = listGenerations();
    std::reverse(generations.begin(), generations.end());
    bool found = false;
    for (const auto& generation : generations) {
      const auto id = parseGenerationName(generation);
      if (id && olderThan(*id, *current_id)) {
        if (auto m = readManifest(generation)) {
          base = generation;
          manifest = std::move(m);
          found = true;
          break;
        }
      }
    }
    if (!found) {
      throw CorruptState("current generation " + *current +
                         " is incomplete and no complete backup exists");
    }
  }

  for (const auto& instrument : instruments) {
    const std::string& code = instrument.code;
    const fs::path doc = root_ / base / (code + ".json");
    const bool listed =
        std::find(manifest->begin(), manifest->end(), code) != manifest->end();

    domain::InstrumentLedger ledger;
    if (!fs::is_regular_file(doc, ec)) {
      if (!listed) {
        continue;  // never persisted: keep the empty ledger
      }
      std::cerr << "[LedgerStore] WARNING: " << code << " listed in " << base
                << " but its document is missing\n";
      ledger = recoverFromBackups(code, base);
    } else if (auto decoded = readLedger(doc, code)) {
      ledger = std::move(*decoded);
    } else {
      ledger = recoverFromBackups(code, base);
    }

    ledger.instrument.name = instrument.name;
    ledger.instrument.sector = instrument.sector;
    result[code] = std::move(ledger);
  }

  std::cout << "[LedgerStore] loaded " << result.size() << " ledger(s) from "
            << base << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// save
// -----------------------------------------------------------------------------
void LedgerStore::writeGeneration(
    const fs::path& staging, const std::string& generation,
    const domain::LedgerMap& ledgers,
    const std::optional<std::string>& current) const {
  std::vector<std::string> codes;

  for (const auto& [code, ledger] : ledgers) {
    writeFile(staging / (code + ".json"), ledgerToJson(ledger).dump(2));
    codes.push_back(code);
  }

  // Carry forward documents of instruments not in this save.
  if (current && fs::is_directory(root_ / *current)) {
    for (const auto& entry : fs::directory_iterator(root_ / *current)) {
      const fs::path& path = entry.path();
      if (!entry.is_regular_file() || path.extension() != ".json" ||
          path.filename() == kManifestFile) {
        continue;
      }
      const std::string code = path.stem().string();
      if (ledgers.count(code) != 0) {
        continue;
      }
      fs::copy_file(path, staging / path.filename());
      syncPath(staging / path.filename());
      codes.push_back(code);
    }
  }

  // Verify by re-reading what actually landed on disk.
  for (const auto& [code, ledger] : ledgers) {
    const auto reread =
        ledgerFromJson(json::parse(readFile(staging / (code + ".json"))));
    if (reread != ledger) {
      throw PersistenceError(code + ": staged document does not match the "
                                    "in-memory ledger");
    }
  }

  std::sort(codes.begin(), codes.end());
  const json manifest{{"schema", kDocumentSchemaVersion},
                      {"generation", generation},
                      {"created_ms", clock_.now_ms()},
                      {"documents", codes}};
  writeFile(staging / kManifestFile, manifest.dump(2));
  syncPath(staging);
}

void LedgerStore::swapCurrent(const std::string& generation) {
  const fs::path tmp = root_ / (std::string(kCurrentFile) + ".tmp");
  writeFile(tmp, generation + "\n");
  fs::rename(tmp, root_ / kCurrentFile);

  // The rename is the commit point; a failed directory sync after it must
  // not be reported as a failed save.
  try {
    syncPath(root_);
  } catch (const PersistenceError& e) {
    std::cerr << "[LedgerStore] WARNING: " << e.what() << "\n";
  }
}

void LedgerStore::save(const domain::LedgerMap& ledgers) {
  for (const auto& [code, ledger] : ledgers) {
    if (code != ledger.instrument.code) {
      throw PersistenceError("ledger keyed '" + code + "' holds code '" +
                             ledger.instrument.code + "'");
    }
    if (auto violation = ledger::checkInvariants(ledger)) {
      throw PersistenceError(code + ": refusing to persist invalid ledger: " +
                             *violation);
    }
  }

  std::optional<std::string> current;
  std::string generation;
  fs::path staging;
  fs::path final_dir;
  bool renamed = false;

  try {
    fs::create_directories(root_);
    current = currentGeneration();
    if (current) {
      // Crashed saves only; retention waits until the new generation is
      // durable so a failed save never costs a backup.
      discardUncommitted(*current);
    }
    generation = generationName(nextGenerationId());
    staging = root_ / (kStagingPrefix + generation);
    final_dir = root_ / generation;

    fs::create_directory(staging);
    writeGeneration(staging, generation, ledgers, current);
    fs::rename(staging, final_dir);
    renamed = true;
    syncPath(root_);
    swapCurrent(generation);
  } catch (const std::exception& e) {
    std::error_code ec;
    if (!staging.empty()) {
      fs::remove_all(staging, ec);
    }
    if (renamed) {
      fs::remove_all(final_dir, ec);
    }
    throw PersistenceError(std::string("save failed: ") + e.what());
  }

  prune(generation);
}

// -----------------------------------------------------------------------------
// discardUncommitted / prune
// -----------------------------------------------------------------------------
void LedgerStore::discardUncommitted(const std::string& current) {
  const auto current_id = parseGenerationName(current);
  try {
    for (const auto& entry : fs::directory_iterator(root_)) {
      const std::string name = entry.path().filename().string();
      if (startsWith(name, kStagingPrefix)) {
        removeLogged(entry.path(), "orphan staging");
      } else if (auto id = parseGenerationName(name)) {
        if (name != current && olderThan(*current_id, *id)) {
          removeLogged(entry.path(), "never committed");
        }
      }
    }
  } catch (const fs::filesystem_error& e) {
    std::cerr << "[LedgerStore] WARNING: cleanup stopped: " << e.what()
              << "\n";
  }
}

void LedgerStore::prune(const std::string& current) {
  discardUncommitted(current);

  const auto current_id = parseGenerationName(current);
  const std::int64_t now = clock_.now_ms();
  const std::int64_t max_age = hours_to_ms(config_.retention_hours);

  try {
    auto generations = listGenerations();
    std::reverse(generations.begin(), generations.end());
    int kept = 1;  // the current generation
    for (const auto& generation : generations) {
      const auto id = parseGenerationName(generation);
      if (!olderThan(*id, *current_id)) {
        continue;
      }
      if (kept >= config_.retention_count) {
        removeLogged(root_ / generation, "beyond retention count");
      } else if (now - id->timestamp_ms > max_age) {
        removeLogged(root_ / generation, "older than retention age");
      } else {
        ++kept;
      }
    }
  } catch (const fs::filesystem_error& e) {
    std::cerr << "[LedgerStore] WARNING: pruning stopped: " << e.what()
              << "\n";
  }
}

// -----------------------------------------------------------------------------
// Budget state
// -----------------------------------------------------------------------------
std::optional<domain::BudgetState> LedgerStore::loadBudgetState() {
  const fs::path path = root_ / kBudgetFile;
  const fs::path backup = root_ / (std::string(kBudgetFile) + ".bak");
  std::error_code ec;

  const bool has_main = fs::is_regular_file(path, ec);
  const bool has_backup = fs::is_regular_file(backup, ec);
  if (!has_main && !has_backup) {
    return std::nullopt;
  }

  if (has_main) {
    try {
      return budgetStateFromJson(json::parse(readFile(path)));
    } catch (const std::exception& e) {
      std::cerr << "[LedgerStore] WARNING: invalid budget document: "
                << e.what() << "\n";
    }
  }
  if (has_backup) {
    try {
      auto state = budgetStateFromJson(json::parse(readFile(backup)));
      std::cerr << "[LedgerStore] RECOVERED budget state from backup\n";
      return state;
    } catch (const std::exception& e) {
      std::cerr << "[LedgerStore] WARNING: invalid budget backup: "
                << e.what() << "\n";
    }
  }
  throw CorruptState("budget state is invalid and no valid backup exists");
}

void LedgerStore::saveBudgetState(const domain::BudgetState& state) {
  const fs::path path = root_ / kBudgetFile;
  const fs::path backup = root_ / (std::string(kBudgetFile) + ".bak");
  const fs::path tmp = root_ / (std::string(kBudgetFile) + ".tmp");
  const json doc = budgetStateToJson(state);

  try {
    fs::create_directories(root_);
    writeFile(tmp, doc.dump(2));
    if (budgetStateToJson(budgetStateFromJson(json::parse(readFile(tmp)))) !=
        doc) {
      throw PersistenceError("staged budget document does not match");
    }

    // Keep the previous copy as backup, but only if it still decodes.
    if (fs::is_regular_file(path)) {
      try {
        budgetStateFromJson(json::parse(readFile(path)));
        fs::copy_file(path, backup, fs::copy_options::overwrite_existing);
      } catch (const CorruptState& e) {
        std::cerr << "[LedgerStore] WARNING: not backing up invalid budget "
                     "document: "
                  << e.what() << "\n";
      } catch (const json::exception& e) {
        std::cerr << "[LedgerStore] WARNING: not backing up invalid budget "
                     "document: "
                  << e.what() << "\n";
      }
    }

    fs::rename(tmp, path);
  } catch (const std::exception& e) {
    std::error_code ec;
    fs::remove(tmp, ec);
    throw PersistenceError(std::string("budget save failed: ") + e.what());
  }

  try {
    syncPath(root_);
  } catch (const PersistenceError& e) {
    std::cerr << "[LedgerStore] WARNING: " << e.what() << "\n";
  }
}

}  // namespace store
}  // namespace staged
