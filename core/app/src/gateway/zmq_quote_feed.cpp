#include "staged/gateway/zmq_quote_feed.hpp"
#include "staged/domain/errors.hpp"
#include "staged/time/time_utils.hpp"

#include <iostream>
#include <stdexcept>

namespace staged {

ZmqQuoteFeed::ZmqQuoteFeed(std::string endpoint, const ITimeProvider& clock,
                           int max_age_seconds)
    : endpoint_(std::move(endpoint)),
      clock_(clock),
      max_age_ms_(static_cast<std::int64_t>(max_age_seconds) * kMsPerSecond) {}

ZmqQuoteFeed::~ZmqQuoteFeed() { stop(); }

// -----------------------------------------------------------------------------
// start(): SUB socket with receive timeout, then the receive thread
// -----------------------------------------------------------------------------
void ZmqQuoteFeed::start() {
  if (running_.load()) {
    return;
  }
  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);

  // Empty filter: accept every message. The receive timeout bounds how long
  // the loop can go without re-checking running_.
  socket_->set(zmq::sockopt::subscribe, "");
  socket_->set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[ZmqQuoteFeed] subscribed to " << endpoint_ << "\n";
}

void ZmqQuoteFeed::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  socket_.reset();
  context_.reset();
}

void ZmqQuoteFeed::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_->recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // timeout; re-check running_
    }

    std::string payload = msg.to_string();
    try {
      applyMessage(nlohmann::json::parse(payload));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[ZmqQuoteFeed] malformed message: " << e.what()
                << " payload: " << payload << "\n";
    } catch (const std::invalid_argument& e) {
      std::cerr << "[ZmqQuoteFeed] rejected message: " << e.what()
                << " payload: " << payload << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// applyMessage(): decode fully, then update the cache under the lock
// -----------------------------------------------------------------------------
void ZmqQuoteFeed::applyMessage(const nlohmann::json& msg) {
  const std::string type = msg.at("type").get<std::string>();

  if (type == "quote") {
    const std::string code = msg.at("code").get<std::string>();
    Quote quote;
    quote.price = msg.at("price").get<double>();
    quote.timestamp_ms = msg.at("timestamp_ms").get<std::int64_t>();
    if (msg.contains("owned_quantity")) {
      quote.owned_quantity = msg.at("owned_quantity").get<std::int64_t>();
    }
    if (!(quote.price > 0.0)) {
      throw std::invalid_argument("quote price must be positive");
    }

    std::lock_guard lock(mutex_);
    auto& slot = quotes_[code];
    // A quote without holdings keeps the last reported holdings.
    if (!quote.owned_quantity) {
      quote.owned_quantity = slot.owned_quantity;
    }
    slot = quote;
  } else if (type == "valuation") {
    const std::string code = msg.at("code").get<std::string>();
    FairValueSignal signal;
    signal.fair_value = msg.at("fair_value").get<double>();
    signal.confidence = msg.value("confidence", 1.0);
    signal.timestamp_ms = msg.at("timestamp_ms").get<std::int64_t>();
    if (!(signal.fair_value > 0.0)) {
      throw std::invalid_argument("fair_value must be positive");
    }

    std::lock_guard lock(mutex_);
    valuations_[code] = signal;
  } else if (type == "market") {
    domain::MarketConditionSnapshot snapshot;
    snapshot.trend = domain::trendFromString(msg.at("trend").get<std::string>());
    snapshot.index_change = msg.at("index_change").get<double>();
    snapshot.volatility = msg.value("volatility", 0.0);
    snapshot.as_of_ms = msg.at("timestamp_ms").get<std::int64_t>();

    std::lock_guard lock(mutex_);
    market_ = snapshot;
  } else if (type == "session") {
    const bool open = msg.at("open").get<bool>();

    std::lock_guard lock(mutex_);
    session_open_ = open;
  } else {
    throw std::invalid_argument("unknown message type '" + type + "'");
  }
}

bool ZmqQuoteFeed::isFresh(std::int64_t timestamp_ms) const {
  return clock_.now_ms() - timestamp_ms <= max_age_ms_;
}

double ZmqQuoteFeed::currentPrice(const std::string& code) {
  std::lock_guard lock(mutex_);
  auto it = quotes_.find(code);
  if (it == quotes_.end()) {
    throw Unavailable(code + ": no quote received");
  }
  if (!isFresh(it->second.timestamp_ms)) {
    throw Unavailable(code + ": quote is stale");
  }
  return it->second.price;
}

std::int64_t ZmqQuoteFeed::ownedQuantity(const std::string& code) {
  std::lock_guard lock(mutex_);
  auto it = quotes_.find(code);
  if (it == quotes_.end() || !it->second.owned_quantity) {
    throw Unavailable(code + ": holdings not reported");
  }
  return *it->second.owned_quantity;
}

bool ZmqQuoteFeed::isMarketOpen() {
  std::lock_guard lock(mutex_);
  if (session_open_) {
    return *session_open_;
  }
  for (const auto& [code, quote] : quotes_) {
    if (isFresh(quote.timestamp_ms)) {
      return true;
    }
  }
  return false;
}

FairValueSignal ZmqQuoteFeed::fairValueSignal(const std::string& code) {
  std::lock_guard lock(mutex_);
  auto it = valuations_.find(code);
  if (it == valuations_.end()) {
    throw Unavailable(code + ": no valuation received");
  }
  return it->second;
}

domain::MarketConditionSnapshot ZmqQuoteFeed::marketCondition() {
  std::lock_guard lock(mutex_);
  if (!market_) {
    throw Unavailable("no market condition received");
  }
  if (!isFresh(market_->as_of_ms)) {
    throw Unavailable("market condition is stale");
  }
  return *market_;
}

}  // namespace staged
