#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "ai/prompt_builder.h"
#include "ai/trade_plan_contract.h"
#include "app/worker_app.h"
#include "core/clock.h"
#include "core/config.h"
#include "core/decimal.h"
#include "core/json_utils.h"
#include "core/log.h"
#include "core/retry_policy.h"
#include "core/text.h"
#include "exchange/binance_futures_adapter.h"
#include "exchange/bybit_linear_adapter.h"
#include "exchange/exchange_factory.h"
#include "exchange/gate_futures_adapter.h"
#include "execution/worker_pool.h"
#include "lock/distributed_mutex.h"
#include "lock/memory_lock_store.h"
#include "lock/redis_lock_store.h"
#include "model/anthropic_adapter.h"
#include "model/google_adapter.h"
#include "model/model_router.h"
#include "model/openai_adapter.h"
#include "model/rate_limiter.h"
#include "oms/reconciler.h"
#include "query/replay_view.h"
#include "risk/risk_manager.h"
#include "security/secrets_cipher.h"
#include "storage/memory_trade_store.h"
#include "storage/record_codec.h"
#include "storage/wal_trade_store.h"
#include "trader/trade_executor.h"
#include "trader/trader_cycle.h"

namespace {

// 该测试文件覆盖 worker 关键链路：
// - 幂等键、风控闸门、模型重试与限流；
// - 交易所/模型适配器的请求构造与回报解析；
// - 决策周期、执行、对账、回放查询与 WAL 回放。
constexpr std::int64_t kBaseTimeMs = 1700000000000;  // 2023-11-14T22:13:20Z
constexpr char kMasterKey[] = "0123456789abcdef0123456789abcdef";

class ManualClock final : public trade_pilot::Clock {
 public:
  explicit ManualClock(std::int64_t now_ms) : now_ms_(now_ms) {}

  std::int64_t NowMs() const override { return now_ms_.load(); }
  void Advance(std::int64_t delta_ms) { now_ms_ += delta_ms; }

 private:
  std::atomic<std::int64_t> now_ms_;
};

/// 不真正休眠，只记录等待时长。
class RecordingSleeper final : public trade_pilot::Sleeper {
 public:
  void SleepMs(std::int64_t duration_ms) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    sleeps_.push_back(duration_ms);
  }

  std::vector<std::int64_t> sleeps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sleeps_;
  }

 private:
  mutable std::mutex mutex_;
  mutable std::vector<std::int64_t> sleeps_;
};

class ScopedEnvVar {
 public:
  ScopedEnvVar(std::string key, std::string value) : key_(std::move(key)) {
    const char* existing = std::getenv(key_.c_str());
    if (existing != nullptr) {
      had_old_value_ = true;
      old_value_ = existing;
    }
    setenv(key_.c_str(), value.c_str(), 1);
  }

  ~ScopedEnvVar() {
    if (had_old_value_) {
      setenv(key_.c_str(), old_value_.c_str(), 1);
      return;
    }
    unsetenv(key_.c_str());
  }

 private:
  std::string key_;
  bool had_old_value_{false};
  std::string old_value_;
};

trade_pilot::HttpResponse HttpOk(const std::string& body) {
  return trade_pilot::HttpResponse{
      .status_code = 200,
      .body = body,
      .error = "",
      .timed_out = false,
  };
}

trade_pilot::HttpResponse HttpStatus(int status_code, const std::string& body) {
  return trade_pilot::HttpResponse{
      .status_code = status_code,
      .body = body,
      .error = "",
      .timed_out = false,
  };
}

/**
 * @brief 脚本化 HTTP 路由表
 *
 * 按添加顺序匹配 method + url 子串；`times` 用完的路由不再匹配，
 * 用来表达“先失败一次再成功”。多个 transport 实例可共享同一张表。
 */
class HttpScript {
 public:
  void AddRoute(const std::string& method,
                const std::string& url_contains,
                trade_pilot::HttpResponse response,
                int times = -1) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.push_back(Route{method, url_contains, std::move(response), times});
  }

  trade_pilot::HttpResponse Handle(const std::string& method,
                                   const std::string& url,
                                   const trade_pilot::HttpHeaders& headers,
                                   const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    last_method_ = method;
    last_url_ = url;
    last_headers_ = headers;
    last_body_ = body;
    for (auto& route : routes_) {
      if (route.remaining == 0) {
        continue;
      }
      if (route.method == method &&
          url.find(route.url_contains) != std::string::npos) {
        if (route.remaining > 0) {
          --route.remaining;
        }
        return route.response;
      }
    }
    trade_pilot::HttpResponse miss;
    miss.status_code = 404;
    miss.error = "mock route not found";
    return miss;
  }

  int calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  std::string last_method() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_method_;
  }
  std::string last_url() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_url_;
  }
  std::string last_body() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_body_;
  }
  std::string LastHeader(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : last_headers_) {
      if (key == name) {
        return value;
      }
    }
    return "";
  }

 private:
  struct Route {
    std::string method;
    std::string url_contains;
    trade_pilot::HttpResponse response;
    int remaining{-1};
  };

  mutable std::mutex mutex_;
  std::vector<Route> routes_;
  int calls_{0};
  std::string last_method_;
  std::string last_url_;
  trade_pilot::HttpHeaders last_headers_;
  std::string last_body_;
};

class ScriptedHttpTransport final : public trade_pilot::HttpTransport {
 public:
  explicit ScriptedHttpTransport(std::shared_ptr<HttpScript> script)
      : script_(std::move(script)) {}

  trade_pilot::HttpResponse Send(const std::string& method,
                                 const std::string& url,
                                 const trade_pilot::HttpHeaders& headers,
                                 const std::string& body) const override {
    return script_->Handle(method, url, headers, body);
  }

 private:
  std::shared_ptr<HttpScript> script_;
};

/// 按脚本依次返回响应的模型适配器（脚本耗尽后重复最后一条）。
class ScriptedModelAdapter final : public trade_pilot::ModelAdapter {
 public:
  ScriptedModelAdapter(std::vector<trade_pilot::ModelResponse> script,
                       const trade_pilot::Sleeper* sleeper)
      : ModelAdapter(trade_pilot::RetryPolicy(
            3, trade_pilot::RetryPolicy::ModelBackoffMs, sleeper)),
        script_(std::move(script)) {}

  std::string Provider() const override { return "scripted"; }

  trade_pilot::ModelResponse Generate(const std::string& system_prompt,
                                      const std::string& user_prompt,
                                      const trade_pilot::JsonValue* json_schema) override {
    (void)system_prompt;
    (void)user_prompt;
    (void)json_schema;
    const std::size_t index =
        std::min(static_cast<std::size_t>(calls_), script_.size() - 1);
    ++calls_;
    return script_[index];
  }

  int calls() const { return calls_; }

 private:
  std::vector<trade_pilot::ModelResponse> script_;
  int calls_{0};
};

trade_pilot::ModelResponse ModelOk(const std::string& content) {
  trade_pilot::ModelResponse response;
  response.success = true;
  response.content = content;
  response.usage = trade_pilot::ModelUsage{.input_tokens = 120, .output_tokens = 30};
  return response;
}

/// 决策周期使用的模型路由替身：不走网络，直接返回预设响应。
class ScriptedModelRouter final : public trade_pilot::ModelRouter {
 public:
  ScriptedModelRouter() : ModelRouter(trade_pilot::ModelRouterOptions{}) {}

  void SetResponse(trade_pilot::ModelResponse response) {
    response_ = std::move(response);
  }

  /// 排队的回复先于默认回复返回，按入队顺序逐个消费。
  void QueueResponse(trade_pilot::ModelResponse response) {
    queued_.push_back(std::move(response));
  }

  /// 每次调用计数后执行，参数为累计调用次数。
  void SetOnCall(std::function<void(int)> on_call) { on_call_ = std::move(on_call); }

  trade_pilot::ModelResponse Generate(const trade_pilot::ModelEndpoint& endpoint,
                                      const std::string& system_prompt,
                                      const std::string& user_prompt,
                                      const trade_pilot::JsonValue* json_schema,
                                      const std::string& trader_id) override {
    (void)json_schema;
    (void)trader_id;
    ++calls_;
    last_endpoint_ = endpoint;
    last_system_prompt_ = system_prompt;
    last_user_prompt_ = user_prompt;
    if (on_call_) {
      on_call_(calls_);
    }
    if (!queued_.empty()) {
      trade_pilot::ModelResponse next = std::move(queued_.front());
      queued_.pop_front();
      return next;
    }
    return response_;
  }

  int calls() const { return calls_; }
  const trade_pilot::ModelEndpoint& last_endpoint() const { return last_endpoint_; }
  const std::string& last_system_prompt() const { return last_system_prompt_; }
  const std::string& last_user_prompt() const { return last_user_prompt_; }

 private:
  trade_pilot::ModelResponse response_;
  std::deque<trade_pilot::ModelResponse> queued_;
  std::function<void(int)> on_call_;
  std::string last_system_prompt_;
  int calls_{0};
  trade_pilot::ModelEndpoint last_endpoint_;
  std::string last_user_prompt_;
};

trade_pilot::OrderResult OrderOk(const std::string& order_id,
                                 trade_pilot::OrderStatus status,
                                 const std::string& exchange_status) {
  trade_pilot::OrderResult result;
  result.success = true;
  result.order_id = order_id;
  result.status = status;
  result.exchange_status = exchange_status;
  return result;
}

/// 交易所替身的可变状态；适配器每轮重建，状态由测试持有。
struct ExchangeScript {
  trade_pilot::Decimal ticker{"50000"};
  bool ticker_ok{true};
  trade_pilot::SymbolInfo symbol_info;
  trade_pilot::Decimal balance{"10000"};
  std::vector<trade_pilot::PositionInfo> positions;
  trade_pilot::OrderResult entry_result;
  trade_pilot::OrderResult tp_result;
  trade_pilot::OrderResult sl_result;
  std::string tp_exception;  ///< 非空时 PlaceTakeProfit 抛出该信息。
  std::map<std::string, trade_pilot::OrderResult> orders;  ///< GetOrder 回报。
  int market_orders{0};
  int protective_orders{0};
  int get_order_calls{0};
  std::vector<int> leverage_calls;
};

class ScriptedExchangeAdapter final : public trade_pilot::ExchangeAdapter {
 public:
  explicit ScriptedExchangeAdapter(ExchangeScript* script) : script_(script) {}

  std::string Name() const override { return "scripted"; }

  bool GetSymbolInfo(const std::string& symbol,
                     trade_pilot::SymbolInfo* out_info,
                     std::string* out_error) override {
    (void)out_error;
    *out_info = script_->symbol_info;
    out_info->symbol = symbol;
    return true;
  }
  bool GetBalance(const std::string& asset,
                  trade_pilot::Decimal* out_balance,
                  std::string* out_error) override {
    (void)asset;
    (void)out_error;
    *out_balance = script_->balance;
    return true;
  }
  bool GetPositions(std::vector<trade_pilot::PositionInfo>* out_positions,
                    std::string* out_error) override {
    (void)out_error;
    *out_positions = script_->positions;
    return true;
  }
  bool GetPosition(const std::string& symbol,
                   std::optional<trade_pilot::PositionInfo>* out_position,
                   std::string* out_error) override {
    (void)out_error;
    out_position->reset();
    for (const auto& position : script_->positions) {
      if (position.symbol == symbol) {
        *out_position = position;
      }
    }
    return true;
  }
  bool GetOpenOrders(const std::string& symbol,
                     std::vector<trade_pilot::OrderResult>* out_orders,
                     std::string* out_error) override {
    (void)symbol;
    (void)out_error;
    out_orders->clear();
    return true;
  }
  bool GetTicker(const std::string& symbol,
                 trade_pilot::Decimal* out_price,
                 std::string* out_error) override {
    if (!script_->ticker_ok) {
      *out_error = "ticker unavailable: " + symbol;
      return false;
    }
    *out_price = script_->ticker;
    return true;
  }
  bool SetLeverage(const std::string& symbol, int leverage) override {
    (void)symbol;
    script_->leverage_calls.push_back(leverage);
    return true;
  }
  trade_pilot::OrderResult PlaceMarketOrder(const std::string& symbol,
                                            trade_pilot::OrderSide side,
                                            const trade_pilot::Decimal& quantity,
                                            const std::string& client_order_id) override {
    (void)symbol;
    (void)side;
    (void)quantity;
    ++script_->market_orders;
    trade_pilot::OrderResult result = script_->entry_result;
    result.client_order_id = client_order_id;
    return result;
  }
  trade_pilot::OrderResult PlaceTakeProfit(const std::string& symbol,
                                           trade_pilot::OrderSide side,
                                           const trade_pilot::Decimal& quantity,
                                           const trade_pilot::Decimal& stop_price,
                                           const std::string& client_order_id) override {
    (void)symbol;
    (void)side;
    (void)quantity;
    (void)stop_price;
    ++script_->protective_orders;
    if (!script_->tp_exception.empty()) {
      throw std::runtime_error(script_->tp_exception);
    }
    trade_pilot::OrderResult result = script_->tp_result;
    result.client_order_id = client_order_id;
    return result;
  }
  trade_pilot::OrderResult PlaceStopLoss(const std::string& symbol,
                                         trade_pilot::OrderSide side,
                                         const trade_pilot::Decimal& quantity,
                                         const trade_pilot::Decimal& stop_price,
                                         const std::string& client_order_id) override {
    (void)symbol;
    (void)side;
    (void)quantity;
    (void)stop_price;
    ++script_->protective_orders;
    trade_pilot::OrderResult result = script_->sl_result;
    result.client_order_id = client_order_id;
    return result;
  }
  trade_pilot::OrderResult CancelOrder(const trade_pilot::OrderRef& ref) override {
    return OrderOk(ref.order_id, trade_pilot::OrderStatus::kCanceled, "CANCELED");
  }
  trade_pilot::OrderResult GetOrder(const trade_pilot::OrderRef& ref) override {
    ++script_->get_order_calls;
    const auto it = script_->orders.find(ref.order_id);
    if (it == script_->orders.end()) {
      return trade_pilot::FailedOrderResult("NOT_FOUND", "order not found: " + ref.order_id);
    }
    return it->second;
  }

 private:
  ExchangeScript* script_{nullptr};
};

trade_pilot::ExchangeAdapterFactory ScriptedFactory(ExchangeScript* script) {
  return [script](const trade_pilot::ExchangeAccountRecord& account,
                  const trade_pilot::ExchangeCredentials& credentials,
                  std::string* out_error) -> std::unique_ptr<trade_pilot::ExchangeAdapter> {
    (void)account;
    if (credentials.api_key != "ak-live" || credentials.api_secret != "sk-live") {
      *out_error = "unexpected credentials";
      return nullptr;
    }
    return std::make_unique<ScriptedExchangeAdapter>(script);
  };
}

std::string OpenPlanJson(int leverage) {
  return std::string(R"({"action":"open","symbol":"BTCUSDT","side":"long",)") +
         R"("entry":{"type":"market","price":null},)" +
         R"("position_size":{"mode":"qty","value":0.01},)" +
         R"("leverage":)" + std::to_string(leverage) + "," +
         R"("tp":{"mode":"percent","value":2},"sl":{"mode":"percent","value":1},)" +
         R"("confidence":0.8,"reason_summary":"trend breakout",)" +
         R"("evidence":{"signals":[{"name":"ema_cross"}],"indicators":{"rsi":61},)" +
         R"("key_levels":{"support":49000}}})";
}

trade_pilot::JsonValue MakeOhlcv(int points) {
  trade_pilot::JsonValue ohlcv = trade_pilot::MakeJsonObject();
  for (const char* key : {"open", "high", "low", "close", "volume"}) {
    trade_pilot::JsonValue series = trade_pilot::MakeJsonArray();
    for (int i = 0; i < points; ++i) {
      trade_pilot::JsonPush(&series, trade_pilot::MakeJsonInt(50000 - points + 1 + i));
    }
    trade_pilot::JsonSet(&ohlcv, key, std::move(series));
  }
  return ohlcv;
}

/**
 * @brief 写入一个 trader 所需的全部配置实体
 *
 * 账户 acct-1（binance）、模型配置 model-1、策略 strat-1、
 * trader T1、快照 snap-1（12 根 K 线，最后收盘 50000）与信号 S1。
 */
bool SeedTraderWorld(trade_pilot::TradeStore* store,
                     const trade_pilot::SecretsCipher& cipher,
                     trade_pilot::TraderMode mode,
                     const std::string& exchange_account_id,
                     std::string* out_error) {
  trade_pilot::ExchangeAccountRecord account;
  account.id = "acct-1";
  account.exchange = "binance";
  account.label = "main";
  if (!cipher.Encrypt("ak-live", &account.api_key_encrypted, out_error) ||
      !cipher.Encrypt("sk-live", &account.api_secret_encrypted, out_error) ||
      !store->UpsertExchangeAccount(&account, out_error)) {
    return false;
  }

  trade_pilot::ModelConfigRecord model;
  model.id = "model-1";
  model.provider = "openai";
  model.model_name = "gpt-4o-mini";
  if (!cipher.Encrypt("sk-model", &model.api_key_encrypted, out_error) ||
      !store->UpsertModelConfig(&model, out_error)) {
    return false;
  }

  trade_pilot::StrategyRecord strategy;
  strategy.id = "strat-1";
  strategy.name = "breakout";
  strategy.enabled = true;
  strategy.symbols = {"BTCUSDT"};
  if (!trade_pilot::ParseJson(R"({"max_leverage":10})", &strategy.risk_json,
                              out_error) ||
      !store->UpsertStrategy(&strategy, out_error)) {
    return false;
  }

  trade_pilot::TraderRecord trader;
  trader.id = "T1";
  trader.name = "btc-breakout";
  trader.exchange_account_id = exchange_account_id;
  trader.model_config_id = "model-1";
  trader.strategy_id = "strat-1";
  trader.enabled = true;
  trader.mode = mode;
  if (!store->UpsertTrader(&trader, out_error)) {
    return false;
  }

  trade_pilot::MarketSnapshotRecord snapshot;
  snapshot.id = "snap-1";
  snapshot.exchange = "binance";
  snapshot.symbol = "BTCUSDT";
  snapshot.timeframe = "1h";
  snapshot.timestamp_ms = kBaseTimeMs;
  snapshot.ohlcv = MakeOhlcv(12);
  if (!store->InsertMarketSnapshot(&snapshot, out_error)) {
    return false;
  }

  trade_pilot::SignalRecord signal;
  signal.id = "S1";
  signal.strategy_id = "strat-1";
  signal.symbol = "BTCUSDT";
  signal.timeframe = "1h";
  signal.side = trade_pilot::PositionSide::kLong;
  signal.snapshot_id = "snap-1";
  signal.reason_summary = "ema cross up";
  return store->InsertSignal(&signal, out_error);
}

trade_pilot::TradePlanOutput OpenPlan(int leverage, const std::string& notional) {
  trade_pilot::TradePlanOutput plan;
  plan.action = trade_pilot::TradeAction::kOpen;
  plan.symbol = "BTCUSDT";
  plan.side = trade_pilot::PositionSide::kLong;
  plan.entry = trade_pilot::EntrySpec{};
  plan.position_size = trade_pilot::PositionSize{
      .mode = trade_pilot::SizeMode::kNotional,
      .value = trade_pilot::Decimal(notional),
  };
  plan.leverage = leverage;
  plan.confidence = 0.7;
  plan.reason_summary = "breakout";
  return plan;
}

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

bool HasReasonContaining(const std::vector<std::string>& reasons,
                         const std::string& needle) {
  return std::any_of(reasons.begin(), reasons.end(), [&](const std::string& reason) {
    return Contains(reason, needle);
  });
}

std::filesystem::path FreshTempDir(const std::string& name) {
  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() / ("trade_pilot_test_" + name);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

/// 指定用途的执行记录写入失败，其余写入照常。
class FailingExecutionStore final : public trade_pilot::MemoryTradeStore {
 public:
  FailingExecutionStore(const trade_pilot::Clock* clock,
                        trade_pilot::ExecutionOrderType failing_type)
      : MemoryTradeStore(clock), failing_type_(failing_type) {}

  bool InsertExecution(trade_pilot::ExecutionRecord* record,
                       std::string* out_error) override {
    if (record->order_type == failing_type_) {
      *out_error = "disk full";
      return false;
    }
    return MemoryTradeStore::InsertExecution(record, out_error);
  }

 private:
  trade_pilot::ExecutionOrderType failing_type_;
};

}  // namespace

int main() {
  trade_pilot::SetMinLogLevel(trade_pilot::LogLevel::kError);

  {
    // 同一 trader/signal 在同一分钟内得到同一个幂等键，跨分钟则不同。
    std::string first;
    std::string second;
    std::string next_minute;
    std::string error;
    if (!trade_pilot::GenerateClientOrderId("T1", "S1", kBaseTimeMs, &first, &error) ||
        !trade_pilot::GenerateClientOrderId("T1", "S1", kBaseTimeMs + 10000, &second,
                                            &error) ||
        !trade_pilot::GenerateClientOrderId("T1", "S1", kBaseTimeMs + 60000,
                                            &next_minute, &error)) {
      std::cerr << "幂等键生成失败: " << error << "\n";
      return 1;
    }
    if (first != second) {
      std::cerr << "预期同一分钟内幂等键相同\n";
      return 1;
    }
    if (first == next_minute) {
      std::cerr << "预期跨分钟幂等键不同\n";
      return 1;
    }
    if (first.size() != 17 || first[0] != 'T') {
      std::cerr << "幂等键格式非法: " << first << "\n";
      return 1;
    }
    std::string other_signal;
    if (!trade_pilot::GenerateClientOrderId("T1", "S2", kBaseTimeMs, &other_signal,
                                            &error) ||
        other_signal == first) {
      std::cerr << "预期不同信号得到不同幂等键\n";
      return 1;
    }
  }

  {
    // 数量向零截断，价格四舍五入。
    if (trade_pilot::RoundQuantity(trade_pilot::Decimal("0.12345"), 3) !=
        trade_pilot::Decimal("0.123")) {
      std::cerr << "预期 RoundQuantity(0.12345, 3) == 0.123\n";
      return 1;
    }
    if (trade_pilot::RoundQuantity(trade_pilot::Decimal("0.9999"), 2) !=
        trade_pilot::Decimal("0.99")) {
      std::cerr << "预期数量向零截断\n";
      return 1;
    }
    if (trade_pilot::RoundPrice(trade_pilot::Decimal("51000.125"), 2) !=
        trade_pilot::Decimal("51000.13")) {
      std::cerr << "预期价格四舍五入到 51000.13\n";
      return 1;
    }
    if (trade_pilot::FormatDecimal(trade_pilot::Decimal("1.5"), 3) != "1.500") {
      std::cerr << "预期 FormatDecimal 补足小数位\n";
      return 1;
    }
  }

  {
    // 杠杆超限直接拦截，不输出归一化计划。
    ManualClock clock(kBaseTimeMs);
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::RiskProfile profile;
    profile.max_leverage = 10;
    trade_pilot::AccountState account;
    account.available_balance = trade_pilot::Decimal("10000");
    const trade_pilot::RiskReport report = risk.Check(
        OpenPlan(20, "100"), profile, account, trade_pilot::Decimal("50000"));
    if (report.allowed || report.normalized_plan.has_value()) {
      std::cerr << "预期杠杆超限被拦截且无归一化计划\n";
      return 1;
    }
    if (!HasReasonContaining(report.reasons, "Leverage 20 exceeds max 10")) {
      std::cerr << "预期拦截原因包含杠杆超限\n";
      return 1;
    }
  }

  {
    // skip 无条件放行，与账户状态无关。
    ManualClock clock(kBaseTimeMs);
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::TradePlanOutput skip;
    skip.action = trade_pilot::TradeAction::kSkip;
    skip.confidence = 0.2;
    skip.reason_summary = "no edge";
    trade_pilot::RiskProfile profile;
    profile.max_concurrent_positions = 1;
    trade_pilot::AccountState account;
    account.open_positions = 7;
    account.current_daily_pnl = trade_pilot::Decimal("-99999");
    const trade_pilot::RiskReport report =
        risk.Check(skip, profile, account, std::nullopt);
    if (!report.allowed || report.reasons.size() != 1 ||
        report.reasons[0] != "Action is skip") {
      std::cerr << "预期 skip 动作无条件放行\n";
      return 1;
    }
  }

  {
    // 多项违例全部收集，不短路。
    ManualClock clock(kBaseTimeMs);
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::RiskProfile profile;
    profile.max_leverage = 10;
    profile.max_concurrent_positions = 2;
    profile.daily_loss_cap = trade_pilot::Decimal("100");
    trade_pilot::AccountState account;
    account.available_balance = trade_pilot::Decimal("10000");
    account.open_positions = 2;
    account.current_daily_pnl = trade_pilot::Decimal("-150");
    account.recent_trades.push_back(trade_pilot::RecentTrade{
        .symbol = "BTCUSDT",
        .side = trade_pilot::PositionSide::kLong,
        .created_at_ms = kBaseTimeMs - 60000,
    });
    const trade_pilot::RiskReport report = risk.Check(
        OpenPlan(20, "100"), profile, account, trade_pilot::Decimal("50000"));
    if (report.allowed) {
      std::cerr << "预期多项违例时被拦截\n";
      return 1;
    }
    if (!HasReasonContaining(report.reasons, "Leverage 20 exceeds max 10") ||
        !HasReasonContaining(report.reasons, "Max concurrent positions (2) reached") ||
        !HasReasonContaining(report.reasons, "Daily loss cap") ||
        !HasReasonContaining(report.reasons, "Cooldown active for BTCUSDT long")) {
      std::cerr << "预期收集全部违例原因，实际 " << report.reasons.size() << " 条\n";
      return 1;
    }
  }

  {
    // 放行时输出归一化计划：杠杆不超过上限，TP/SL 由百分比换算为绝对价。
    ManualClock clock(kBaseTimeMs);
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::TradePlanOutput plan = OpenPlan(5, "1000");
    plan.tp = trade_pilot::PriceTarget{
        .mode = trade_pilot::PriceTargetMode::kPercent,
        .value = trade_pilot::Decimal("2"),
    };
    plan.sl = trade_pilot::PriceTarget{
        .mode = trade_pilot::PriceTargetMode::kPercent,
        .value = trade_pilot::Decimal("1"),
    };
    trade_pilot::RiskProfile profile;
    trade_pilot::AccountState account;
    account.available_balance = trade_pilot::Decimal("10000");
    const trade_pilot::RiskReport report =
        risk.Check(plan, profile, account, trade_pilot::Decimal("50000"));
    if (!report.allowed || !report.normalized_plan.has_value()) {
      std::cerr << "预期合规计划放行\n";
      return 1;
    }
    const trade_pilot::NormalizedPlan& normalized = *report.normalized_plan;
    if (normalized.quantity != trade_pilot::Decimal("0.02") ||
        normalized.leverage != 5 ||
        normalized.tp_price != trade_pilot::Decimal("51000") ||
        normalized.sl_price != trade_pilot::Decimal("49500")) {
      std::cerr << "归一化计划不符合预期: qty="
                << trade_pilot::DecimalToString(normalized.quantity) << "\n";
      return 1;
    }

    // 无当前价时名义金额仓位无法换算数量。
    const trade_pilot::RiskReport unpriced =
        risk.Check(plan, profile, account, std::nullopt);
    if (unpriced.allowed ||
        !HasReasonContaining(unpriced.reasons, "Could not calculate valid quantity")) {
      std::cerr << "预期无价时名义金额仓位被拦截\n";
      return 1;
    }
  }

  {
    // 校验器三个阶段的错误前缀。
    const trade_pilot::ValidationResult bad_json =
        trade_pilot::ValidateTradePlan("not a json");
    if (bad_json.valid || bad_json.errors.empty() ||
        bad_json.errors[0].rfind("Invalid JSON: ", 0) != 0) {
      std::cerr << "预期非法 JSON 返回 Invalid JSON 错误\n";
      return 1;
    }
    const trade_pilot::ValidationResult bad_action = trade_pilot::ValidateTradePlan(
        R"({"action":"buy","confidence":0.5,"reason_summary":"x"})");
    if (bad_action.valid || bad_action.errors.empty() ||
        bad_action.errors[0].rfind("Schema error: ", 0) != 0) {
      std::cerr << "预期非法 action 返回 Schema error\n";
      return 1;
    }
    const trade_pilot::ValidationResult extra_field = trade_pilot::ValidateTradePlan(
        R"({"action":"skip","confidence":0.5,"reason_summary":"x","note":"y"})");
    if (extra_field.valid) {
      std::cerr << "预期多余字段被 schema 拒绝\n";
      return 1;
    }
    const trade_pilot::ValidationResult too_much_leverage =
        trade_pilot::ValidateTradePlan(OpenPlanJson(200));
    if (too_much_leverage.valid) {
      std::cerr << "预期 leverage 超出 125 被拒绝\n";
      return 1;
    }
    const trade_pilot::ValidationResult missing_symbol = trade_pilot::ValidateTradePlan(
        R"({"action":"open","confidence":0.5,"reason_summary":"x"})");
    if (missing_symbol.valid ||
        !HasReasonContaining(missing_symbol.errors,
                             "Validation error: symbol is required when action is 'open'")) {
      std::cerr << "预期 open 缺少 symbol 返回 Validation error\n";
      return 1;
    }
    const trade_pilot::ValidationResult fenced = trade_pilot::ValidateTradePlan(
        "```json\n" + OpenPlanJson(5) + "\n```");
    if (!fenced.valid || !fenced.plan.has_value() ||
        fenced.plan->leverage != 5 || fenced.plan->symbol != "BTCUSDT" ||
        !fenced.plan->tp.has_value() ||
        fenced.plan->tp->mode != trade_pilot::PriceTargetMode::kPercent) {
      std::cerr << "预期代码块包裹的合法计划通过校验\n";
      return 1;
    }
    const trade_pilot::JsonValue summary =
        trade_pilot::TradePlanSummaryToJson(*fenced.plan);
    if (trade_pilot::JsonAsString(trade_pilot::JsonObjectField(&summary, "action")) !=
        std::optional<std::string>("open")) {
      std::cerr << "预期计划摘要包含 action\n";
      return 1;
    }
  }

  {
    // 提示词嵌入四块输入，JSON 按 2 空格缩进。
    trade_pilot::JsonValue signal = trade_pilot::MakeJsonObject();
    trade_pilot::JsonSet(&signal, "symbol", trade_pilot::MakeJsonString("ETHUSDT"));
    const trade_pilot::AiPrompt prompt = trade_pilot::BuildAiPrompt(
        signal, trade_pilot::MakeJsonObject(), trade_pilot::MakeJsonObject(),
        trade_pilot::MakeJsonObject());
    if (!Contains(prompt.user_prompt, "SIGNAL:") ||
        !Contains(prompt.user_prompt, "\n  \"symbol\": \"ETHUSDT\"") ||
        !Contains(prompt.user_prompt, "ACCOUNT STATE:") ||
        !Contains(prompt.system_prompt, "OUTPUT SCHEMA")) {
      std::cerr << "提示词内容不符合预期\n";
      return 1;
    }
  }

  {
    // AUTH 不重试：只调用一次。
    RecordingSleeper sleeper;
    ScriptedModelAdapter adapter(
        {trade_pilot::ModelFailure(trade_pilot::ModelErrorType::kAuth, "bad key")},
        &sleeper);
    const trade_pilot::ModelResponse response =
        adapter.GenerateWithRetry("system", "user", nullptr);
    if (response.success || adapter.calls() != 1 ||
        response.error_type != trade_pilot::ModelErrorType::kAuth) {
      std::cerr << "预期 AUTH 错误只调用一次，实际调用 " << adapter.calls() << " 次\n";
      return 1;
    }
    if (!sleeper.sleeps().empty()) {
      std::cerr << "预期 AUTH 错误不退避\n";
      return 1;
    }
  }

  {
    // RATE_LIMIT 两次后成功：共三次调用，退避 1s 与 2.1s。
    RecordingSleeper sleeper;
    ScriptedModelAdapter adapter(
        {trade_pilot::ModelFailure(trade_pilot::ModelErrorType::kRateLimit, "slow down"),
         trade_pilot::ModelFailure(trade_pilot::ModelErrorType::kRateLimit, "slow down"),
         ModelOk(R"({"action":"skip"})")},
        &sleeper);
    const trade_pilot::ModelResponse response =
        adapter.GenerateWithRetry("system", "user", nullptr);
    if (!response.success || adapter.calls() != 3) {
      std::cerr << "预期第三次调用成功，实际调用 " << adapter.calls() << " 次\n";
      return 1;
    }
    const std::vector<std::int64_t> sleeps = sleeper.sleeps();
    if (sleeps.size() != 2 || sleeps[0] != 1000 || sleeps[1] != 2100) {
      std::cerr << "模型退避时长不符合预期\n";
      return 1;
    }
  }

  {
    // QUOTA 同样不重试；耗尽重试后返回最后一次失败。
    RecordingSleeper sleeper;
    ScriptedModelAdapter quota(
        {trade_pilot::ModelFailure(trade_pilot::ModelErrorType::kQuota, "quota")},
        &sleeper);
    if (quota.GenerateWithRetry("s", "u", nullptr).success || quota.calls() != 1) {
      std::cerr << "预期 QUOTA 错误只调用一次\n";
      return 1;
    }
    ScriptedModelAdapter timeouts(
        {trade_pilot::ModelFailure(trade_pilot::ModelErrorType::kTimeout, "timeout")},
        &sleeper);
    const trade_pilot::ModelResponse last =
        timeouts.GenerateWithRetry("s", "u", nullptr);
    if (last.success || timeouts.calls() != 3 ||
        last.error_type != trade_pilot::ModelErrorType::kTimeout) {
      std::cerr << "预期超时重试耗尽后返回 TIMEOUT\n";
      return 1;
    }
  }

  {
    // 错误分类与正文截断。
    if (trade_pilot::ClassifyModelError(401, "") != trade_pilot::ModelErrorType::kAuth ||
        trade_pilot::ClassifyModelError(429, "Quota exceeded") !=
            trade_pilot::ModelErrorType::kQuota ||
        trade_pilot::ClassifyModelError(429, "too many requests") !=
            trade_pilot::ModelErrorType::kRateLimit ||
        trade_pilot::ClassifyModelError(500, "upstream TIMEOUT") !=
            trade_pilot::ModelErrorType::kTimeout ||
        trade_pilot::ClassifyModelError(500, "boom") !=
            trade_pilot::ModelErrorType::kUnknown) {
      std::cerr << "模型错误分类不符合预期\n";
      return 1;
    }
    const trade_pilot::ModelResponse failure = trade_pilot::ModelFailure(
        trade_pilot::ModelErrorType::kUnknown, std::string(500, 'x'));
    if (failure.error_message.size() != trade_pilot::kModelErrorMessageMax) {
      std::cerr << "预期错误正文截断到 200 字节\n";
      return 1;
    }
  }

  {
    // 滑动窗口：窗口内最多 N 次，窗口滑过后恢复。
    ManualClock clock(kBaseTimeMs);
    trade_pilot::SlidingWindowRateLimiter limiter(2, 60000, &clock);
    for (int i = 0; i < 2; ++i) {
      if (!limiter.TryAcquire("T1")) {
        std::cerr << "预期前两次请求放行\n";
        return 1;
      }
      clock.Advance(1000);
    }
    if (limiter.TryAcquire("T1") || limiter.Count("T1") != 2) {
      std::cerr << "预期第三次请求被限流且不计数\n";
      return 1;
    }
    if (!limiter.TryAcquire("T2")) {
      std::cerr << "预期限流按 trader 隔离\n";
      return 1;
    }
    clock.Advance(58500);
    if (!limiter.TryAcquire("T1") || limiter.Count("T1") != 2) {
      std::cerr << "预期窗口滑过后恢复，本次请求计入窗口\n";
      return 1;
    }
  }

  {
    // 并发抢占同一 trader 的配额：放行总数不超过上限。
    ManualClock clock(kBaseTimeMs);
    trade_pilot::SlidingWindowRateLimiter limiter(5, 60000, &clock);
    std::atomic<int> granted{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < 8; ++t) {
      callers.emplace_back([&limiter, &granted] {
        for (int i = 0; i < 10; ++i) {
          if (limiter.TryAcquire("T1")) {
            ++granted;
          }
        }
      });
    }
    for (std::thread& caller : callers) {
      caller.join();
    }
    if (granted.load() != 5 || limiter.Count("T1") != 5) {
      std::cerr << "预期并发下只放行 5 次，实际 " << granted.load() << "\n";
      return 1;
    }
  }

  {
    // 模型路由：限流命中时不发起网络请求；未知供应商返回 UNKNOWN。
    ManualClock clock(kBaseTimeMs);
    RecordingSleeper sleeper;
    auto script = std::make_shared<HttpScript>();
    script->AddRoute(
        "POST", "/chat/completions",
        HttpOk(R"({"choices":[{"message":{"content":"{\"action\":\"skip\"}"}}],)"
               R"("usage":{"prompt_tokens":12,"completion_tokens":8}})"));
    trade_pilot::ModelRouter router(trade_pilot::ModelRouterOptions{
        .max_attempts = 3,
        .rate_limit_per_minute = 2,
        .timeout_ms = 1000,
        .clock = &clock,
        .sleeper = &sleeper,
        .transport_factory =
            [script](long timeout_ms) -> std::unique_ptr<trade_pilot::HttpTransport> {
          (void)timeout_ms;
          return std::make_unique<ScriptedHttpTransport>(script);
        },
    });
    const trade_pilot::ModelEndpoint endpoint{
        .provider = "OpenAI",
        .api_key = "sk-test",
        .model = "gpt-4o-mini",
        .base_url = "",
    };
    for (int i = 0; i < 2; ++i) {
      const trade_pilot::ModelResponse response =
          router.Generate(endpoint, "system", "user", nullptr, "T1");
      if (!response.success || response.content != R"({"action":"skip"})" ||
          !response.usage.has_value() || response.usage->input_tokens != 12 ||
          response.usage->output_tokens != 8) {
        std::cerr << "预期路由调用成功并返回用量\n";
        return 1;
      }
    }
    const trade_pilot::ModelResponse limited =
        router.Generate(endpoint, "system", "user", nullptr, "T1");
    if (limited.success ||
        limited.error_type != trade_pilot::ModelErrorType::kRateLimit ||
        script->calls() != 2) {
      std::cerr << "预期第三次调用被限流且不发请求，实际请求 " << script->calls()
                << " 次\n";
      return 1;
    }
    const trade_pilot::ModelResponse unknown = router.Generate(
        trade_pilot::ModelEndpoint{.provider = "mistral", .api_key = "k", .model = "m", .base_url = ""},
        "system", "user", nullptr, "T2");
    if (unknown.success || unknown.error_type != trade_pilot::ModelErrorType::kUnknown ||
        !Contains(unknown.error_message, "Unknown provider: mistral")) {
      std::cerr << "预期未知供应商返回 UNKNOWN\n";
      return 1;
    }
    if (!trade_pilot::IsSupportedProvider("Anthropic") ||
        trade_pilot::IsSupportedProvider("mistral")) {
      std::cerr << "供应商识别不符合预期\n";
      return 1;
    }
  }

  {
    // OpenAI：带 schema 时使用 json_schema，鉴权头为 Bearer。
    auto script = std::make_shared<HttpScript>();
    script->AddRoute(
        "POST", "/chat/completions",
        HttpOk(R"({"choices":[{"message":{"content":"{\"action\":\"skip\"}"}}],)"
               R"("usage":{"prompt_tokens":3,"completion_tokens":4}})"));
    trade_pilot::OpenAiAdapter adapter("sk-test", "gpt-4o-mini", "",
                                       std::make_unique<ScriptedHttpTransport>(script),
                                       trade_pilot::RetryPolicy::NoRetry());
    const trade_pilot::ModelResponse response =
        adapter.Generate("system", "user", &trade_pilot::TradePlanJsonSchema());
    if (!response.success || response.content != R"({"action":"skip"})") {
      std::cerr << "预期 OpenAI 响应解析成功\n";
      return 1;
    }
    if (script->last_url() != "https://api.openai.com/v1/chat/completions" ||
        script->LastHeader("Authorization") != "Bearer sk-test" ||
        !Contains(script->last_body(), "\"json_schema\"")) {
      std::cerr << "OpenAI 请求构造不符合预期: " << script->last_url() << "\n";
      return 1;
    }
  }

  {
    // Anthropic：x-api-key 头，content[0].text 为输出。
    auto script = std::make_shared<HttpScript>();
    script->AddRoute(
        "POST", "/messages",
        HttpOk(R"({"content":[{"type":"text","text":"{\"action\":\"skip\"}"}],)"
               R"("usage":{"input_tokens":5,"output_tokens":7}})"));
    trade_pilot::AnthropicAdapter adapter("ak-test", "claude-test", "https://proxy.local/v1/",
                                          std::make_unique<ScriptedHttpTransport>(script),
                                          trade_pilot::RetryPolicy::NoRetry());
    const trade_pilot::ModelResponse response =
        adapter.Generate("system", "user", nullptr);
    if (!response.success || !response.usage.has_value() ||
        response.usage->input_tokens + response.usage->output_tokens != 12) {
      std::cerr << "预期 Anthropic 响应解析成功\n";
      return 1;
    }
    if (script->last_url() != "https://proxy.local/v1/messages" ||
        script->LastHeader("x-api-key") != "ak-test") {
      std::cerr << "Anthropic 请求构造不符合预期: " << script->last_url() << "\n";
      return 1;
    }
  }

  {
    // Google：key 放在 query 上，candidates[0].content.parts[0].text 为输出。
    auto script = std::make_shared<HttpScript>();
    script->AddRoute(
        "POST", ":generateContent",
        HttpOk(R"({"candidates":[{"content":{"parts":[{"text":"{\"action\":\"skip\"}"}]}}],)"
               R"("usageMetadata":{"promptTokenCount":3,"candidatesTokenCount":4}})"));
    trade_pilot::GoogleAdapter adapter("g-key", "gemini-test", "",
                                       std::make_unique<ScriptedHttpTransport>(script),
                                       trade_pilot::RetryPolicy::NoRetry());
    const trade_pilot::ModelResponse response =
        adapter.Generate("system", "user", nullptr);
    if (!response.success || response.content != R"({"action":"skip"})") {
      std::cerr << "预期 Google 响应解析成功\n";
      return 1;
    }
    if (!Contains(script->last_url(), "/models/gemini-test:generateContent?key=g-key")) {
      std::cerr << "Google 请求 URL 不符合预期: " << script->last_url() << "\n";
      return 1;
    }
  }

  {
    // HTTP 层错误映射：401/429/超时/非 JSON 正文。
    auto script = std::make_shared<HttpScript>();
    script->AddRoute("POST", "/chat/completions", HttpStatus(401, "invalid api key"), 1);
    script->AddRoute("POST", "/chat/completions",
                     HttpStatus(429, R"({"error":"insufficient_quota"})"), 1);
    trade_pilot::HttpResponse timeout;
    timeout.error = "operation timed out";
    timeout.timed_out = true;
    script->AddRoute("POST", "/chat/completions", timeout, 1);
    script->AddRoute("POST", "/chat/completions", HttpOk("<html>oops</html>"), 1);
    trade_pilot::OpenAiAdapter adapter("sk-test", "gpt-4o-mini", "",
                                       std::make_unique<ScriptedHttpTransport>(script),
                                       trade_pilot::RetryPolicy::NoRetry());
    const std::vector<trade_pilot::ModelErrorType> expected = {
        trade_pilot::ModelErrorType::kAuth,
        trade_pilot::ModelErrorType::kQuota,
        trade_pilot::ModelErrorType::kTimeout,
        trade_pilot::ModelErrorType::kInvalidOutput,
    };
    for (const trade_pilot::ModelErrorType type : expected) {
      const trade_pilot::ModelResponse response =
          adapter.Generate("system", "user", nullptr);
      if (response.success || response.error_type != type) {
        std::cerr << "预期错误类型 " << trade_pilot::ToString(type) << "\n";
        return 1;
      }
    }
  }

  {
    // Binance：只读 GET 遇 5xx 重试，下单 POST 从不重试。
    auto script = std::make_shared<HttpScript>();
    script->AddRoute("GET", "/fapi/v1/ticker/price", HttpStatus(503, "busy"), 1);
    script->AddRoute("GET", "/fapi/v1/ticker/price",
                     HttpOk(R"({"symbol":"BTCUSDT","price":"50000.10"})"));
    script->AddRoute(
        "GET", "/fapi/v1/exchangeInfo",
        HttpOk(R"({"symbols":[{"symbol":"BTCUSDT","pricePrecision":2,"quantityPrecision":3,)"
               R"("filters":[{"filterType":"LOT_SIZE","minQty":"0.001","maxQty":"1000"},)"
               R"({"filterType":"MIN_NOTIONAL","notional":"100"}]}]})"));
    script->AddRoute("POST", "/fapi/v1/order", HttpStatus(503, "busy"), 1);
    script->AddRoute(
        "POST", "/fapi/v1/order",
        HttpOk(R"({"orderId":987654321,"clientOrderId":"Tabc","status":"FILLED",)"
               R"("executedQty":"0.012","avgPrice":"50001.5"})"));
    script->AddRoute(
        "GET", "/fapi/v1/order",
        HttpOk(R"({"orderId":987654321,"clientOrderId":"Tabc","status":"CANCELED",)"
               R"("executedQty":"0","avgPrice":"0"})"));
    script->AddRoute("GET", "/fapi/v2/balance",
                     HttpOk(R"([{"asset":"BNB","availableBalance":"1"},)"
                            R"({"asset":"USDT","availableBalance":"1234.5"}])"));
    script->AddRoute(
        "GET", "/fapi/v2/positionRisk",
        HttpOk(R"([{"symbol":"BTCUSDT","positionAmt":"-0.5","entryPrice":"50000",)"
               R"("unRealizedProfit":"12","leverage":"5","marginType":"cross"},)"
               R"({"symbol":"ETHUSDT","positionAmt":"0","entryPrice":"0"}])"));

    RecordingSleeper sleeper;
    trade_pilot::ExchangeAdapterOptions options;
    options.sleeper = &sleeper;
    trade_pilot::BinanceFuturesAdapter adapter(
        trade_pilot::ExchangeCredentials{.api_key = "ak", .api_secret = "sk"}, options,
        std::make_unique<ScriptedHttpTransport>(script));

    trade_pilot::Decimal price;
    std::string error;
    if (!adapter.GetTicker("BTCUSDT", &price, &error) ||
        price != trade_pilot::Decimal("50000.10") || script->calls() != 2) {
      std::cerr << "预期 ticker 重试一次后成功: " << error << "\n";
      return 1;
    }
    if (sleeper.sleeps().size() != 1 || sleeper.sleeps()[0] != 200) {
      std::cerr << "预期只读重试退避 200ms\n";
      return 1;
    }

    trade_pilot::SymbolInfo info;
    if (!adapter.GetSymbolInfo("BTCUSDT", &info, &error) || info.qty_precision != 3 ||
        info.min_notional != trade_pilot::Decimal("100")) {
      std::cerr << "预期解析 exchangeInfo 精度与最小名义金额\n";
      return 1;
    }
    const int calls_after_info = script->calls();
    if (!adapter.GetSymbolInfo("BTCUSDT", &info, &error) ||
        script->calls() != calls_after_info) {
      std::cerr << "预期 symbol 精度命中缓存\n";
      return 1;
    }

    const trade_pilot::OrderResult failed = adapter.PlaceMarketOrder(
        "BTCUSDT", trade_pilot::OrderSide::kBuy, trade_pilot::Decimal("0.0129"), "Tabc");
    if (failed.success || failed.error_code != "503" ||
        script->calls() != calls_after_info + 1) {
      std::cerr << "预期下单 503 不重试且返回失败结果\n";
      return 1;
    }
    const trade_pilot::OrderResult placed = adapter.PlaceMarketOrder(
        "BTCUSDT", trade_pilot::OrderSide::kBuy, trade_pilot::Decimal("0.0129"), "Tabc");
    if (!placed.success || placed.order_id != "987654321" ||
        placed.status != trade_pilot::OrderStatus::kFilled ||
        placed.filled_price != trade_pilot::Decimal("50001.5")) {
      std::cerr << "预期市价单成交回报解析成功\n";
      return 1;
    }
    const std::string order_url = script->last_url();
    if (!Contains(order_url, "quantity=0.012") ||
        !Contains(order_url, "newClientOrderId=Tabc") ||
        !Contains(order_url, "signature=") || script->LastHeader("X-MBX-APIKEY") != "ak") {
      std::cerr << "Binance 下单请求不符合预期: " << order_url << "\n";
      return 1;
    }

    const trade_pilot::OrderResult queried = adapter.GetOrder(
        trade_pilot::OrderRef{.symbol = "BTCUSDT", .order_id = "987654321", .client_order_id = ""});
    if (!queried.success || queried.status != trade_pilot::OrderStatus::kCanceled ||
        !Contains(script->last_url(), "orderId=987654321")) {
      std::cerr << "预期查单解析 CANCELED\n";
      return 1;
    }

    trade_pilot::Decimal balance;
    std::vector<trade_pilot::PositionInfo> positions;
    if (!adapter.GetBalance("USDT", &balance, &error) ||
        balance != trade_pilot::Decimal("1234.5") ||
        !adapter.GetPositions(&positions, &error) || positions.size() != 1 ||
        positions[0].side != trade_pilot::PositionSide::kShort ||
        positions[0].quantity != trade_pilot::Decimal("0.5") ||
        positions[0].margin_type != "CROSS") {
      std::cerr << "预期余额与持仓解析正确（空仓位被过滤）\n";
      return 1;
    }
  }

  {
    // Gate：合约名 BTC_USDT，张数带符号，finished 映射为成交。
    auto script = std::make_shared<HttpScript>();
    script->AddRoute(
        "GET", "/api/v4/futures/usdt/contracts",
        HttpOk(R"([{"name":"BTC_USDT","quanto_multiplier":"0.0001","order_size_min":1,)"
               R"("order_size_max":1000000,"mark_price_round":"0.1"}])"));
    script->AddRoute("GET", "/api/v4/futures/usdt/tickers",
                     HttpOk(R"([{"contract":"BTC_USDT","last":"50123.4"}])"));
    script->AddRoute(
        "POST", "/api/v4/futures/usdt/orders",
        HttpOk(R"({"id":12345,"text":"t-abc","status":"finished","size":10,"left":0,)"
               R"("fill_price":"50100"})"));
    script->AddRoute(
        "GET", "/api/v4/futures/usdt/orders/12345",
        HttpOk(R"({"id":12345,"text":"t-abc","status":"cancelled","size":10,"left":10,)"
               R"("fill_price":"0"})"));
    trade_pilot::ExchangeAdapterOptions options;
    trade_pilot::GateFuturesAdapter adapter(
        trade_pilot::ExchangeCredentials{.api_key = "gk", .api_secret = "gs"}, options,
        std::make_unique<ScriptedHttpTransport>(script));

    std::string error;
    trade_pilot::SymbolInfo info;
    if (!adapter.GetSymbolInfo("BTCUSDT", &info, &error) || info.price_precision != 1 ||
        info.qty_precision != 0 || info.min_qty != trade_pilot::Decimal("0.0001")) {
      std::cerr << "预期 Gate 合约精度解析正确: " << error << "\n";
      return 1;
    }
    trade_pilot::Decimal price;
    if (!adapter.GetTicker("BTCUSDT", &price, &error) ||
        price != trade_pilot::Decimal("50123.4") ||
        !Contains(script->last_url(), "contract=BTC_USDT")) {
      std::cerr << "预期 Gate ticker 解析 last\n";
      return 1;
    }
    const trade_pilot::OrderResult sell = adapter.PlaceMarketOrder(
        "BTCUSDT", trade_pilot::OrderSide::kSell, trade_pilot::Decimal("10"), "t-abc");
    if (!sell.success || sell.order_id != "12345" ||
        sell.status != trade_pilot::OrderStatus::kFilled ||
        sell.filled_qty != trade_pilot::Decimal("10") ||
        !Contains(script->last_body(), "\"size\":-10") ||
        !Contains(script->last_body(), "\"text\":\"t-abc\"")) {
      std::cerr << "Gate 下单请求或回报不符合预期: " << script->last_body() << "\n";
      return 1;
    }
    if (script->LastHeader("KEY") != "gk" || script->LastHeader("SIGN").empty()) {
      std::cerr << "预期 Gate 私有请求带 KEY/SIGN 头\n";
      return 1;
    }
    const trade_pilot::OrderResult queried = adapter.GetOrder(
        trade_pilot::OrderRef{.symbol = "BTCUSDT", .order_id = "12345", .client_order_id = ""});
    if (!queried.success || queried.status != trade_pilot::OrderStatus::kCanceled) {
      std::cerr << "预期 Gate cancelled 映射为撤单\n";
      return 1;
    }
  }

  {
    // Bybit：retCode 非 0 折叠为失败；查单先 realtime 后 history。
    auto script = std::make_shared<HttpScript>();
    script->AddRoute(
        "GET", "/v5/market/instruments-info",
        HttpOk(R"({"retCode":0,"retMsg":"OK","result":{"list":[{"symbol":"BTCUSDT",)"
               R"("lotSizeFilter":{"qtyStep":"0.001","minOrderQty":"0.001","maxOrderQty":"100",)"
               R"("minNotionalValue":"5"},"priceFilter":{"tickSize":"0.10"}}]}})"));
    script->AddRoute("GET", "/v5/market/tickers",
                     HttpOk(R"({"retCode":0,"retMsg":"OK","result":{"list":[)"
                            R"({"symbol":"BTCUSDT","lastPrice":"50200.5"}]}})"));
    script->AddRoute("POST", "/v5/order/create",
                     HttpOk(R"({"retCode":10001,"retMsg":"params error"})"), 1);
    script->AddRoute("POST", "/v5/order/create",
                     HttpOk(R"({"retCode":0,"retMsg":"OK","result":{"orderId":"by-1",)"
                            R"("orderLinkId":"Tabc_TP"}})"));
    script->AddRoute("GET", "/v5/order/realtime",
                     HttpOk(R"({"retCode":0,"retMsg":"OK","result":{"list":[]}})"));
    script->AddRoute(
        "GET", "/v5/order/history",
        HttpOk(R"({"retCode":0,"retMsg":"OK","result":{"list":[{"orderId":"by-1",)"
               R"("orderLinkId":"Tabc_TP","orderStatus":"Filled","cumExecQty":"0.010",)"
               R"("avgPrice":"51000"}]}})"));
    trade_pilot::ExchangeAdapterOptions options;
    options.testnet = true;
    trade_pilot::BybitLinearAdapter adapter(
        trade_pilot::ExchangeCredentials{.api_key = "bk", .api_secret = "bs"}, options,
        std::make_unique<ScriptedHttpTransport>(script));

    std::string error;
    trade_pilot::Decimal price;
    if (!adapter.GetTicker("BTCUSDT", &price, &error) ||
        price != trade_pilot::Decimal("50200.5") ||
        !Contains(script->last_url(), "https://api-testnet.bybit.com/v5/market/tickers")) {
      std::cerr << "预期 Bybit 测试网 ticker 解析 lastPrice\n";
      return 1;
    }
    const trade_pilot::OrderResult rejected = adapter.PlaceTakeProfit(
        "BTCUSDT", trade_pilot::OrderSide::kSell, trade_pilot::Decimal("0.01"),
        trade_pilot::Decimal("51000"), "Tabc_TP");
    if (rejected.success || rejected.error_code != "10001") {
      std::cerr << "预期 retCode 非 0 时下单失败\n";
      return 1;
    }
    const trade_pilot::OrderResult tp = adapter.PlaceTakeProfit(
        "BTCUSDT", trade_pilot::OrderSide::kSell, trade_pilot::Decimal("0.01"),
        trade_pilot::Decimal("51000"), "Tabc_TP");
    if (!tp.success || tp.order_id != "by-1" ||
        !Contains(script->last_body(), "\"triggerDirection\":1") ||
        !Contains(script->last_body(), "\"reduceOnly\":true") ||
        !Contains(script->last_body(), "\"triggerPrice\":\"51000.0\"")) {
      std::cerr << "Bybit 止盈单请求不符合预期: " << script->last_body() << "\n";
      return 1;
    }
    if (script->LastHeader("X-BAPI-API-KEY") != "bk") {
      std::cerr << "预期 Bybit 私有请求带 API KEY 头\n";
      return 1;
    }
    const trade_pilot::OrderResult queried = adapter.GetOrder(
        trade_pilot::OrderRef{.symbol = "BTCUSDT", .order_id = "by-1", .client_order_id = ""});
    if (!queried.success || queried.status != trade_pilot::OrderStatus::kFilled ||
        queried.filled_price != trade_pilot::Decimal("51000")) {
      std::cerr << "预期 Bybit 查单回落到 history 并解析 Filled\n";
      return 1;
    }
  }

  {
    // 工厂：未知交易所返回空并给出原因。
    std::string error;
    const std::unique_ptr<trade_pilot::ExchangeAdapter> unknown =
        trade_pilot::CreateExchangeAdapter("kraken", trade_pilot::ExchangeCredentials{},
                                           trade_pilot::ExchangeAdapterOptions{}, nullptr,
                                           &error);
    if (unknown != nullptr || error.empty()) {
      std::cerr << "预期未知交易所创建失败\n";
      return 1;
    }
    if (!trade_pilot::IsSupportedExchange("Gate") ||
        trade_pilot::IsSupportedExchange("kraken")) {
      std::cerr << "交易所识别不符合预期\n";
      return 1;
    }
    auto script = std::make_shared<HttpScript>();
    const std::unique_ptr<trade_pilot::ExchangeAdapter> bybit =
        trade_pilot::CreateExchangeAdapter("BYBIT", trade_pilot::ExchangeCredentials{},
                                           trade_pilot::ExchangeAdapterOptions{},
                                           std::make_unique<ScriptedHttpTransport>(script),
                                           &error);
    if (bybit == nullptr || bybit->Name() != "bybit") {
      std::cerr << "预期按大小写不敏感的标识创建 Bybit 适配器\n";
      return 1;
    }
  }

  {
    // 进程内锁：互斥、只有持有者能释放/续期、过期后自愈。
    ManualClock clock(kBaseTimeMs);
    trade_pilot::InMemoryLockStore store(&clock);
    trade_pilot::DistributedMutex first(&store, trade_pilot::TraderLockName("T1"), 60000);
    trade_pilot::DistributedMutex second(&store, trade_pilot::TraderLockName("T1"), 60000);
    if (first.key() != "lock:trader:T1:cycle" ||
        trade_pilot::ReconcileLockName("acct-1") != "lock:reconcile:acct-1") {
      std::cerr << "锁键格式不符合预期\n";
      return 1;
    }
    if (!first.TryAcquire() || second.TryAcquire()) {
      std::cerr << "预期同名锁互斥\n";
      return 1;
    }
    if (second.Release() || second.Extend()) {
      std::cerr << "预期非持有者不能释放或续期\n";
      return 1;
    }
    clock.Advance(30000);
    if (!first.Extend(60000)) {
      std::cerr << "预期持有者续期成功\n";
      return 1;
    }
    clock.Advance(45000);
    if (second.TryAcquire()) {
      std::cerr << "预期续期后锁仍有效\n";
      return 1;
    }
    clock.Advance(20000);
    if (!second.TryAcquire()) {
      std::cerr << "预期过期后锁可被重新获取\n";
      return 1;
    }
    if (first.Release()) {
      std::cerr << "预期旧持有者不能释放别人的锁\n";
      return 1;
    }
    if (!second.Release()) {
      std::cerr << "预期持有者释放成功\n";
      return 1;
    }

    RecordingSleeper sleeper;
    trade_pilot::DistributedMutex holder(&store, "busy", 60000);
    trade_pilot::DistributedMutex waiter(&store, "busy", 60000, &sleeper);
    if (!holder.TryAcquire()) {
      std::cerr << "预期首次加锁成功\n";
      return 1;
    }
    {
      trade_pilot::ScopedMutexLock guard(&waiter, trade_pilot::LockMode::kBlocking, 500, 100);
      if (guard.owns_lock()) {
        std::cerr << "预期阻塞加锁超时失败\n";
        return 1;
      }
    }
    if (sleeper.sleeps().empty()) {
      std::cerr << "预期阻塞加锁期间按间隔轮询\n";
      return 1;
    }
    if (!holder.Release()) {
      std::cerr << "预期释放成功\n";
      return 1;
    }
    {
      trade_pilot::ScopedMutexLock guard(&waiter, trade_pilot::LockMode::kNonBlocking);
      if (!guard.owns_lock() || !waiter.held()) {
        std::cerr << "预期锁空闲时守卫持有\n";
        return 1;
      }
    }
    if (waiter.held() || !holder.TryAcquire()) {
      std::cerr << "预期守卫析构后释放锁\n";
      return 1;
    }
  }

  {
    // RESP2 编码与增量解析。
    if (trade_pilot::EncodeRedisCommand({"SET", "k", "v"}) !=
        "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$1\r\nv\r\n") {
      std::cerr << "RESP 命令编码不符合预期\n";
      return 1;
    }
    trade_pilot::RedisReply reply;
    std::size_t consumed = 0;
    std::string error;
    if (!trade_pilot::ParseRedisReply("+OK\r\n", &reply, &consumed, &error) ||
        reply.kind != trade_pilot::RedisReply::Kind::kStatus || reply.text != "OK" ||
        consumed != 5) {
      std::cerr << "预期解析状态回复 OK\n";
      return 1;
    }
    if (!trade_pilot::ParseRedisReply("$-1\r\n", &reply, &consumed, &error) ||
        reply.kind != trade_pilot::RedisReply::Kind::kNil) {
      std::cerr << "预期解析 nil 回复\n";
      return 1;
    }
    if (!trade_pilot::ParseRedisReply(":1\r\n", &reply, &consumed, &error) ||
        reply.kind != trade_pilot::RedisReply::Kind::kInteger || reply.integer != 1) {
      std::cerr << "预期解析整数回复\n";
      return 1;
    }
    if (!trade_pilot::ParseRedisReply("*2\r\n$1\r\na\r\n:3\r\n+extra", &reply, &consumed,
                                      &error) ||
        reply.kind != trade_pilot::RedisReply::Kind::kArray ||
        reply.elements.size() != 2 || reply.elements[0].text != "a" ||
        reply.elements[1].integer != 3 || consumed != 15) {
      std::cerr << "预期解析数组回复并只消耗完整部分\n";
      return 1;
    }
    error.clear();
    if (trade_pilot::ParseRedisReply("$5\r\nhel", &reply, &consumed, &error) ||
        !error.empty()) {
      std::cerr << "预期不完整数据返回 false 且不报错\n";
      return 1;
    }
    if (trade_pilot::ParseRedisReply("?bad\r\n", &reply, &consumed, &error) ||
        error.empty()) {
      std::cerr << "预期非法前缀报错\n";
      return 1;
    }
  }

  {
    // 凭证加解密：短主密钥拒绝，篡改密文认证失败。
    trade_pilot::SecretsCipher weak;
    std::string error;
    if (weak.Initialize("short", &error)) {
      std::cerr << "预期短主密钥初始化失败\n";
      return 1;
    }
    trade_pilot::SecretsCipher cipher;
    if (!cipher.Initialize(kMasterKey, &error)) {
      std::cerr << "主密钥初始化失败: " << error << "\n";
      return 1;
    }
    std::string blob;
    std::string again;
    std::string plain;
    if (!cipher.Encrypt("api-secret-value", &blob, &error) ||
        !cipher.Encrypt("api-secret-value", &again, &error) ||
        blob.rfind("v1:", 0) != 0 || blob == again) {
      std::cerr << "预期密文带版本前缀且每次随机\n";
      return 1;
    }
    if (!cipher.Decrypt(blob, &plain, &error) || plain != "api-secret-value") {
      std::cerr << "预期解密还原明文: " << error << "\n";
      return 1;
    }
    std::string tampered = blob;
    tampered[tampered.size() - 2] = tampered[tampered.size() - 2] == 'A' ? 'B' : 'A';
    if (cipher.Decrypt(tampered, &plain, &error)) {
      std::cerr << "预期篡改密文解密失败\n";
      return 1;
    }
    trade_pilot::SecretsCipher other;
    if (!other.Initialize(std::string(kMasterKey) + "-rotated", &error) ||
        other.Decrypt(blob, &plain, &error)) {
      std::cerr << "预期不同主密钥无法解密\n";
      return 1;
    }
  }

  {
    // 配置：YAML 加载、环境变量覆盖与校验。
    const std::filesystem::path dir = FreshTempDir("config");
    const std::filesystem::path path = dir / "worker.yaml";
    {
      std::ofstream out(path);
      out << "app:\n"
          << "  paper_trading: false\n"
          << "  cycle_interval_seconds: 30\n"
          << "  worker_threads: 2\n"
          << "  data_path: /tmp/trade_pilot_data\n"
          << "  paper_balance: 2500.5\n"
          << "\n"
          << "locks:\n"
          << "  backend: redis   # 多进程部署\n"
          << "  redis_host: redis.internal\n"
          << "  redis_port: 6380\n"
          << "\n"
          << "model:\n"
          << "  rate_limit_per_minute: 20\n"
          << "\n"
          << "logging:\n"
          << "  level: warn\n";
    }
    ScopedEnvVar port("TRADE_PILOT_REDIS_PORT", "6390");
    ScopedEnvVar master("TRADE_PILOT_MASTER_KEY", kMasterKey);
    trade_pilot::AppConfig config;
    std::string error;
    if (!trade_pilot::LoadAppConfigFromYaml(path.string(), &config, &error)) {
      std::cerr << "配置加载失败: " << error << "\n";
      return 1;
    }
    if (config.app.paper_trading || config.app.cycle_interval_seconds != 30 ||
        config.app.worker_threads != 2 || config.app.paper_balance != "2500.5" ||
        config.app.data_path != "/tmp/trade_pilot_data" ||
        config.locks.backend != trade_pilot::LockBackend::kRedis ||
        config.locks.redis_host != "redis.internal" ||
        config.model.rate_limit_per_minute != 20 ||
        config.log_level != trade_pilot::LogLevel::kWarn) {
      std::cerr << "配置字段解析不符合预期\n";
      return 1;
    }
    if (config.locks.redis_port != 6390 || config.master_key != kMasterKey) {
      std::cerr << "预期环境变量覆盖 redis 端口与主密钥\n";
      return 1;
    }
    if (config.reconcile.lookback_hours != 24 || config.model.max_attempts != 3) {
      std::cerr << "预期未出现的字段保留默认值\n";
      return 1;
    }

    {
      ScopedEnvVar bad_paper("TRADE_PILOT_PAPER_TRADING", "maybe");
      trade_pilot::AppConfig overridden;
      if (trade_pilot::ApplyEnvironmentOverrides(&overridden, &error)) {
        std::cerr << "预期非法布尔环境变量报错\n";
        return 1;
      }
    }

    trade_pilot::AppConfig invalid;
    invalid.locks.poll_interval_ms = 0;
    if (trade_pilot::ValidateAppConfig(invalid, &error)) {
      std::cerr << "预期 poll_interval_ms=0 校验失败\n";
      return 1;
    }
    invalid = trade_pilot::AppConfig{};
    invalid.app.paper_balance = "abc";
    if (trade_pilot::ValidateAppConfig(invalid, &error)) {
      std::cerr << "预期非法纸面余额校验失败\n";
      return 1;
    }
    if (trade_pilot::LoadAppConfigFromYaml((dir / "missing.yaml").string(), &config,
                                           &error)) {
      std::cerr << "预期不存在的配置文件加载失败\n";
      return 1;
    }
  }

  {
    // 工作池：任务全部执行；任务异常不影响其它任务；停止后拒绝投递。
    trade_pilot::WorkerPool pool(4);
    pool.Start();
    std::atomic<int> done{0};
    for (int i = 0; i < 20; ++i) {
      if (!pool.Submit("task-" + std::to_string(i), [&done, i] {
            if (i == 7) {
              throw std::runtime_error("boom");
            }
            ++done;
          })) {
        std::cerr << "预期运行中的工作池接受任务\n";
        return 1;
      }
    }
    pool.WaitIdle();
    if (done.load() != 19) {
      std::cerr << "预期 19 个任务完成，实际 " << done.load() << "\n";
      return 1;
    }
    pool.Stop();
    pool.Stop();
    if (pool.Submit("late", [] {})) {
      std::cerr << "预期停止后拒绝投递\n";
      return 1;
    }
  }

  {
    // 存储约束：幂等键唯一、计划状态只前进、执行记录引用已存在计划。
    ManualClock clock(kBaseTimeMs);
    trade_pilot::MemoryTradeStore store(&clock);
    std::string error;
    trade_pilot::DecisionLogRecord decision;
    decision.trader_id = "T1";
    decision.signal_id = "S1";
    decision.client_order_id = "Tdup";
    if (!store.InsertDecision(&decision, &error) || decision.id.empty() ||
        decision.created_at_ms != kBaseTimeMs) {
      std::cerr << "预期插入决策并分配 id 与时间\n";
      return 1;
    }
    trade_pilot::DecisionLogRecord duplicate = decision;
    duplicate.id.clear();
    if (store.InsertDecision(&duplicate, &error)) {
      std::cerr << "预期重复 client_order_id 被拒绝\n";
      return 1;
    }

    trade_pilot::TradePlanRecord plan;
    plan.exchange_account_id = "acct-1";
    plan.client_order_id = "Tdup";
    plan.symbol = "BTCUSDT";
    plan.quantity = trade_pilot::Decimal("0.01");
    if (!store.InsertTradePlan(&plan, &error)) {
      std::cerr << "交易计划插入失败: " << error << "\n";
      return 1;
    }
    plan.status = trade_pilot::TradePlanStatus::kEntryFilled;
    if (!store.UpdateTradePlan(plan, &error)) {
      std::cerr << "预期状态前进成功: " << error << "\n";
      return 1;
    }
    plan.status = trade_pilot::TradePlanStatus::kEntryPlaced;
    if (store.UpdateTradePlan(plan, &error)) {
      std::cerr << "预期状态回退被拒绝\n";
      return 1;
    }
    plan.status = trade_pilot::TradePlanStatus::kCancelled;
    if (!store.UpdateTradePlan(plan, &error)) {
      std::cerr << "预期非终态可进入 cancelled\n";
      return 1;
    }
    plan.status = trade_pilot::TradePlanStatus::kCompleted;
    if (store.UpdateTradePlan(plan, &error)) {
      std::cerr << "预期终态不可再变更\n";
      return 1;
    }

    trade_pilot::ExecutionRecord orphan;
    orphan.trade_plan_id = "no-such-plan";
    if (store.InsertExecution(&orphan, &error)) {
      std::cerr << "预期引用不存在计划的执行记录被拒绝\n";
      return 1;
    }
  }

  {
    // WAL：写入后重启回放，记录内容一致。
    const std::filesystem::path dir = FreshTempDir("wal");
    const std::string path = (dir / "trade_store.wal").string();
    ManualClock clock(kBaseTimeMs);
    trade_pilot::SecretsCipher cipher;
    std::string error;
    if (!cipher.Initialize(kMasterKey, &error)) {
      std::cerr << "主密钥初始化失败: " << error << "\n";
      return 1;
    }
    std::string decision_id;
    {
      trade_pilot::WalTradeStore store(path, &clock);
      if (!store.Open(&error) ||
          !SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kPaper, "acct-1",
                           &error)) {
        std::cerr << "WAL 写入失败: " << error << "\n";
        return 1;
      }
      trade_pilot::DecisionLogRecord decision;
      decision.trader_id = "T1";
      decision.signal_id = "S1";
      decision.client_order_id = "Twal";
      decision.status = trade_pilot::DecisionStatus::kPending;
      if (!store.InsertDecision(&decision, &error)) {
        std::cerr << "WAL 决策写入失败: " << error << "\n";
        return 1;
      }
      decision.status = trade_pilot::DecisionStatus::kBlocked;
      decision.risk_allowed = false;
      decision.risk_reasons = {"Leverage 20 exceeds max 10"};
      decision.confidence = 0.4;
      if (!store.UpdateDecision(decision, &error)) {
        std::cerr << "WAL 决策更新失败: " << error << "\n";
        return 1;
      }
      decision_id = decision.id;
    }

    trade_pilot::WalTradeStore reopened(path, &clock);
    if (!reopened.Open(&error)) {
      std::cerr << "WAL 回放失败: " << error << "\n";
      return 1;
    }
    trade_pilot::DecisionLogRecord restored;
    if (!reopened.FindDecision(decision_id, &restored) ||
        restored.status != trade_pilot::DecisionStatus::kBlocked ||
        restored.risk_allowed != std::optional<bool>(false) ||
        restored.risk_reasons.size() != 1 || restored.confidence != 0.4) {
      std::cerr << "预期回放后决策以最后一次写入为准\n";
      return 1;
    }
    trade_pilot::MarketSnapshotRecord snapshot;
    if (!reopened.FindMarketSnapshot("snap-1", &snapshot) ||
        trade_pilot::OhlcvLastClose(snapshot.ohlcv) != trade_pilot::Decimal("50000")) {
      std::cerr << "预期回放后快照 OHLCV 完整\n";
      return 1;
    }
    if (reopened.EnabledTraders().size() != 1 ||
        reopened.UnconsumedSignals("T1", "strat-1", 5).size() != 0) {
      std::cerr << "预期回放后信号已被该 trader 的决策消费\n";
      return 1;
    }
  }

  {
    // 两个进程共用一份 WAL：对方追加的记录在 Refresh 后可见，未写完的半行留待下次。
    const std::filesystem::path dir = FreshTempDir("wal_shared");
    const std::string path = (dir / "trade_store.wal").string();
    ManualClock clock(kBaseTimeMs);
    trade_pilot::SecretsCipher cipher;
    std::string error;
    if (!cipher.Initialize(kMasterKey, &error)) {
      std::cerr << "主密钥初始化失败: " << error << "\n";
      return 1;
    }
    trade_pilot::WalTradeStore producer(path, &clock);
    trade_pilot::WalTradeStore worker(path, &clock);
    if (!producer.Open(&error) ||
        !SeedTraderWorld(&producer, cipher, trade_pilot::TraderMode::kPaper, "acct-1",
                         &error) ||
        !worker.Open(&error)) {
      std::cerr << "共享 WAL 初始化失败: " << error << "\n";
      return 1;
    }
    trade_pilot::SignalRecord found;
    if (!worker.FindSignal("S1", &found) || producer.writer_id() == worker.writer_id()) {
      std::cerr << "预期 worker 打开时回放到生产方已写入的信号\n";
      return 1;
    }

    clock.Advance(1000);
    trade_pilot::SignalRecord second;
    second.id = "S2";
    second.strategy_id = "strat-1";
    second.symbol = "BTCUSDT";
    second.timeframe = "1h";
    second.snapshot_id = "snap-1";
    if (!producer.InsertSignal(&second, &error)) {
      std::cerr << "信号写入失败: " << error << "\n";
      return 1;
    }
    if (worker.FindSignal("S2", &found)) {
      std::cerr << "预期 Refresh 之前 worker 看不到新信号\n";
      return 1;
    }
    if (!worker.Refresh(&error) || !worker.FindSignal("S2", &found) ||
        worker.UnconsumedSignals("T1", "strat-1", 5).size() != 2) {
      std::cerr << "预期 Refresh 后 worker 看到新信号: " << error << "\n";
      return 1;
    }

    trade_pilot::DecisionLogRecord decision;
    decision.trader_id = "T1";
    decision.signal_id = "S2";
    decision.client_order_id = "Tshared";
    decision.status = trade_pilot::DecisionStatus::kBlocked;
    if (!worker.InsertDecision(&decision, &error)) {
      std::cerr << "决策写入失败: " << error << "\n";
      return 1;
    }
    trade_pilot::DecisionLogRecord seen;
    if (producer.FindDecisionByClientOrderId("Tshared", &seen)) {
      std::cerr << "预期 Refresh 之前生产方看不到 worker 的决策\n";
      return 1;
    }
    if (!producer.Refresh(&error)) {
      std::cerr << "生产方刷新失败: " << error << "\n";
      return 1;
    }
    const std::vector<trade_pilot::SignalRecord> unconsumed =
        producer.UnconsumedSignals("T1", "strat-1", 5);
    if (!producer.FindDecisionByClientOrderId("Tshared", &seen) ||
        seen.id != decision.id || unconsumed.size() != 1 || unconsumed[0].id != "S1") {
      std::cerr << "预期生产方 Refresh 后看到 worker 的决策并视 S2 为已消费\n";
      return 1;
    }
    if (!worker.Refresh(&error) || worker.DecisionsForSignal("S2").size() != 1) {
      std::cerr << "预期 worker 刷新时跳过自己写入的行\n";
      return 1;
    }

    trade_pilot::SignalRecord third;
    third.id = "S3";
    third.strategy_id = "strat-1";
    third.symbol = "BTCUSDT";
    third.timeframe = "1h";
    third.created_at_ms = kBaseTimeMs + 2000;
    const std::string head = R"({"kind":"signal","writer":"external","record":)";
    {
      std::ofstream out(path, std::ios::app | std::ios::binary);
      out << head;
    }
    if (!worker.Refresh(&error) || worker.FindSignal("S3", &found)) {
      std::cerr << "预期未写完的半行被忽略且刷新成功: " << error << "\n";
      return 1;
    }
    {
      std::ofstream out(path, std::ios::app | std::ios::binary);
      out << trade_pilot::SerializeJson(trade_pilot::RecordToJson(third)) << "}\n";
    }
    if (!worker.Refresh(&error) || !worker.FindSignal("S3", &found) ||
        found.created_at_ms != kBaseTimeMs + 2000) {
      std::cerr << "预期补全的行在下一次刷新时回放: " << error << "\n";
      return 1;
    }
  }

  {
    // 执行器（纸面）：按行情价模拟成交，不触达交易所。
    ManualClock clock(kBaseTimeMs);
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::TradeExecutor executor(&store, &clock);
    trade_pilot::ExecutionRequest request;
    request.plan.symbol = "BTCUSDT";
    request.plan.side = trade_pilot::PositionSide::kShort;
    request.plan.quantity = trade_pilot::Decimal("0.01");
    request.plan.tp_price = trade_pilot::Decimal("49000");
    request.exchange_account_id = "acct-1";
    request.client_order_id = "Tpaper";
    request.is_paper = true;
    request.current_price = trade_pilot::Decimal("50000");
    trade_pilot::TradePlanRecord plan;
    std::string error;
    if (!executor.Execute(request, nullptr, &plan, &error)) {
      std::cerr << "纸面执行持久化失败: " << error << "\n";
      return 1;
    }
    if (plan.status != trade_pilot::TradePlanStatus::kTpSlPlaced || !plan.is_paper ||
        plan.entry_price != trade_pilot::Decimal("50000")) {
      std::cerr << "预期纸面计划以行情价成交并挂出 TP\n";
      return 1;
    }
    const std::vector<trade_pilot::ExecutionRecord> executions =
        store.ExecutionsForPlan(plan.id);
    if (executions.size() != 2 ||
        executions[0].status != trade_pilot::ExecutionStatus::kFilled ||
        executions[0].side != trade_pilot::OrderSide::kSell ||
        executions[0].exchange_order_id != "paper-Tpaper" ||
        executions[1].order_type != trade_pilot::ExecutionOrderType::kTp ||
        executions[1].side != trade_pilot::OrderSide::kBuy ||
        executions[1].client_order_id != "Tpaper_TP") {
      std::cerr << "纸面执行记录不符合预期\n";
      return 1;
    }

    trade_pilot::ExecutionRequest unpriced = request;
    unpriced.client_order_id = "Tnoprice";
    unpriced.current_price.reset();
    if (!executor.Execute(unpriced, nullptr, &plan, &error) ||
        plan.status != trade_pilot::TradePlanStatus::kFailed ||
        plan.error_message != "No price available for paper fill") {
      std::cerr << "预期无价时纸面计划失败\n";
      return 1;
    }
  }

  {
    // 执行器（实盘）：入场失败 -> failed，错误写入计划与执行记录。
    ManualClock clock(kBaseTimeMs);
    trade_pilot::MemoryTradeStore store(&clock);
    ExchangeScript exchange;
    exchange.entry_result = trade_pilot::FailedOrderResult("-2019", "Margin is insufficient.");
    ScriptedExchangeAdapter adapter(&exchange);
    trade_pilot::TradeExecutor executor(&store, &clock);
    trade_pilot::ExecutionRequest request;
    request.plan.symbol = "BTCUSDT";
    request.plan.quantity = trade_pilot::Decimal("0.01");
    request.plan.leverage = 5;
    request.plan.tp_price = trade_pilot::Decimal("51000");
    request.exchange_account_id = "acct-1";
    request.client_order_id = "Tlive";
    request.is_paper = false;
    trade_pilot::TradePlanRecord plan;
    std::string error;
    if (!executor.Execute(request, &adapter, &plan, &error)) {
      std::cerr << "实盘执行持久化失败: " << error << "\n";
      return 1;
    }
    if (plan.status != trade_pilot::TradePlanStatus::kFailed ||
        plan.error_message != "Margin is insufficient." || exchange.protective_orders != 0 ||
        exchange.leverage_calls != std::vector<int>{5}) {
      std::cerr << "预期入场失败时计划失败且不挂保护单\n";
      return 1;
    }
    const std::vector<trade_pilot::ExecutionRecord> executions =
        store.ExecutionsForPlan(plan.id);
    if (executions.size() != 1 ||
        executions[0].status != trade_pilot::ExecutionStatus::kFailed ||
        !executions[0].exchange_order_id.empty()) {
      std::cerr << "预期记录一条失败的入场执行\n";
      return 1;
    }
  }

  {
    // 实盘入场成交后 TP 执行记录写不进去：计划仍前推并记录成交价，SL 照常下单。
    ManualClock clock(kBaseTimeMs);
    FailingExecutionStore store(&clock, trade_pilot::ExecutionOrderType::kTp);
    ExchangeScript exchange;
    exchange.entry_result = OrderOk("entry-1", trade_pilot::OrderStatus::kFilled, "FILLED");
    exchange.entry_result.filled_price = trade_pilot::Decimal("50010");
    exchange.tp_result = OrderOk("tp-1", trade_pilot::OrderStatus::kNew, "NEW");
    exchange.sl_result = OrderOk("sl-1", trade_pilot::OrderStatus::kNew, "NEW");
    ScriptedExchangeAdapter adapter(&exchange);
    trade_pilot::TradeExecutor executor(&store, &clock);
    trade_pilot::ExecutionRequest request;
    request.plan.symbol = "BTCUSDT";
    request.plan.quantity = trade_pilot::Decimal("0.01");
    request.plan.leverage = 5;
    request.plan.tp_price = trade_pilot::Decimal("51000");
    request.plan.sl_price = trade_pilot::Decimal("49500");
    request.exchange_account_id = "acct-1";
    request.client_order_id = "Tdisk";
    request.is_paper = false;
    trade_pilot::TradePlanRecord plan;
    std::string error;
    if (executor.Execute(request, &adapter, &plan, &error) ||
        !Contains(error, "disk full") || plan.id.empty()) {
      std::cerr << "预期执行记录写入失败时报错并仍返回计划\n";
      return 1;
    }
    trade_pilot::TradePlanRecord stored;
    if (!store.FindTradePlan(plan.id, &stored) ||
        stored.status != trade_pilot::TradePlanStatus::kTpSlPlaced ||
        stored.entry_price != trade_pilot::Decimal("50010") ||
        !Contains(stored.error_message, "Execution record not persisted")) {
      std::cerr << "预期计划状态与成交价已落库，实际 status="
                << trade_pilot::ToString(stored.status) << "\n";
      return 1;
    }
    const std::vector<trade_pilot::ExecutionRecord> executions =
        store.ExecutionsForPlan(plan.id);
    if (exchange.protective_orders != 2 || executions.size() != 2 ||
        executions[0].order_type != trade_pilot::ExecutionOrderType::kEntry ||
        executions[1].order_type != trade_pilot::ExecutionOrderType::kSl) {
      std::cerr << "预期 SL 照常下单，入场与 SL 两条执行记录落库\n";
      return 1;
    }
  }

  trade_pilot::SecretsCipher cipher;
  {
    std::string error;
    if (!cipher.Initialize(kMasterKey, &error)) {
      std::cerr << "主密钥初始化失败: " << error << "\n";
      return 1;
    }
  }

  {
    // 两次周期相隔 10 秒：第二次不重复下单。
    ManualClock clock(kBaseTimeMs);
    RecordingSleeper sleeper;
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kPaper, "acct-1",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    ExchangeScript exchange;
    ScriptedModelRouter router;
    router.SetResponse(ModelOk(OpenPlanJson(5)));
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::TraderCycle cycle(&store, &locks, &router, &risk, &cipher,
                                   ScriptedFactory(&exchange),
                                   trade_pilot::TraderCycleOptions{}, &clock, &sleeper);

    const trade_pilot::CycleSummary first = cycle.Run("T1");
    if (first.decisions_created != 1 || first.executed != 1) {
      std::cerr << "预期首轮执行一个决策，实际 executed=" << first.executed << "\n";
      return 1;
    }
    clock.Advance(10000);
    const trade_pilot::CycleSummary second = cycle.Run("T1");
    if (second.decisions_created != 0 || router.calls() != 1) {
      std::cerr << "预期第二轮不再为同一信号调用模型\n";
      return 1;
    }
    if (store.DecisionsForSignal("S1").size() != 1 ||
        store.QueryTradePlans(trade_pilot::TradePlanFilter{}).size() != 1) {
      std::cerr << "预期同一信号只有一条决策与一个交易计划\n";
      return 1;
    }
    if (exchange.market_orders != 0) {
      std::cerr << "预期纸面 trader 不触达交易所下单\n";
      return 1;
    }
  }

  {
    // 入场成交但 TP 下单抛网络异常：计划停在 entry_filled，保留成交价与错误信息。
    ManualClock clock(kBaseTimeMs);
    RecordingSleeper sleeper;
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kLive, "acct-1",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    ExchangeScript exchange;
    exchange.entry_result =
        OrderOk("entry-1", trade_pilot::OrderStatus::kFilled, "FILLED");
    exchange.entry_result.filled_price = trade_pilot::Decimal("50010");
    exchange.tp_exception = "network unreachable: " + std::string(300, 'x');
    exchange.sl_result = OrderOk("sl-1", trade_pilot::OrderStatus::kNew, "NEW");
    ScriptedModelRouter router;
    router.SetResponse(ModelOk(OpenPlanJson(5)));
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::TraderCycle cycle(&store, &locks, &router, &risk, &cipher,
                                   ScriptedFactory(&exchange),
                                   trade_pilot::TraderCycleOptions{}, &clock, &sleeper);
    const trade_pilot::CycleSummary summary = cycle.Run("T1");
    if (summary.decision_ids.size() != 1 || summary.executed != 1) {
      std::cerr << "预期一个已执行决策\n";
      return 1;
    }
    if (router.last_endpoint().api_key != "sk-model" ||
        router.last_endpoint().provider != "openai" ||
        !Contains(router.last_user_prompt(), "BTCUSDT")) {
      std::cerr << "预期模型调用使用解密后的密钥与信号数据\n";
      return 1;
    }

    trade_pilot::DecisionLogRecord decision;
    trade_pilot::TradePlanRecord plan;
    if (!store.FindDecision(summary.decision_ids[0], &decision) ||
        !store.FindTradePlan(decision.trade_plan_id, &plan)) {
      std::cerr << "预期决策关联交易计划\n";
      return 1;
    }
    if (plan.status != trade_pilot::TradePlanStatus::kEntryFilled ||
        plan.entry_price != trade_pilot::Decimal("50010") || plan.is_paper ||
        !Contains(plan.error_message, "TP placement failed: network unreachable") ||
        Contains(plan.error_message, "SL placement failed")) {
      std::cerr << "预期计划停在 entry_filled 并保留成交价，实际 "
                << trade_pilot::ToString(plan.status) << "\n";
      return 1;
    }
    if (plan.tp_price != trade_pilot::Decimal("51000") ||
        plan.sl_price != trade_pilot::Decimal("49500") || plan.leverage != 5) {
      std::cerr << "预期 TP/SL 以行情价换算\n";
      return 1;
    }
    if (decision.status != trade_pilot::DecisionStatus::kExecuted ||
        decision.execution_error != plan.error_message ||
        decision.tokens_used != std::optional<std::int64_t>(150) ||
        decision.risk_allowed != std::optional<bool>(true)) {
      std::cerr << "预期决策为 executed 并带执行错误\n";
      return 1;
    }
    const std::vector<trade_pilot::ExecutionRecord> executions =
        store.ExecutionsForPlan(plan.id);
    if (executions.size() != 3 ||
        executions[0].status != trade_pilot::ExecutionStatus::kFilled ||
        executions[1].order_type != trade_pilot::ExecutionOrderType::kTp ||
        executions[1].status != trade_pilot::ExecutionStatus::kFailed ||
        !executions[1].exchange_order_id.empty() ||
        executions[2].status != trade_pilot::ExecutionStatus::kSubmitted ||
        executions[2].client_order_id != decision.client_order_id + "_SL") {
      std::cerr << "执行记录不符合预期\n";
      return 1;
    }

    // 回放链：错误信息截断到 100 字符，OHLCV 只保留 5 个点。
    const trade_pilot::ReplayView view(&store, &clock);
    trade_pilot::JsonValue chain;
    if (!view.ReplayForDecision(decision.id, &chain, &error)) {
      std::cerr << "决策回放失败: " << error << "\n";
      return 1;
    }
    const trade_pilot::JsonValue* steps = trade_pilot::JsonObjectField(&chain, "chain");
    if (steps == nullptr || steps->array_value.size() != 8) {
      std::cerr << "预期回放链包含 5 个环节与 3 条执行\n";
      return 1;
    }
    const trade_pilot::JsonValue* closes = trade_pilot::JsonFindPath(
        trade_pilot::JsonArrayAt(steps, 1), {"data", "ohlcv_summary", "close"});
    if (closes == nullptr || closes->array_value.size() != 5 ||
        trade_pilot::JsonAsInt64(&closes->array_value.back()) !=
            std::optional<std::int64_t>(50000)) {
      std::cerr << "预期回放只保留最后 5 个收盘价\n";
      return 1;
    }
    const std::optional<std::string> plan_error = trade_pilot::JsonAsString(
        trade_pilot::JsonFindPath(trade_pilot::JsonArrayAt(steps, 4), {"data", "error_message"}));
    if (!plan_error.has_value() || trade_pilot::Utf8Length(*plan_error) != 100) {
      std::cerr << "预期回放错误信息截断到 100 字符\n";
      return 1;
    }
    const trade_pilot::JsonValue* step_six = trade_pilot::JsonArrayAt(steps, 5);
    if (trade_pilot::JsonAsInt64(trade_pilot::JsonObjectField(step_six, "step")) !=
            std::optional<std::int64_t>(6) ||
        trade_pilot::JsonAsBool(trade_pilot::JsonFindPath(step_six, {"data", "is_paper"})) !=
            std::optional<bool>(false)) {
      std::cerr << "预期第一条执行位于 step 6 且带 is_paper\n";
      return 1;
    }

    trade_pilot::JsonValue plan_chain;
    if (!view.ReplayForTradePlan(plan.id, &plan_chain, &error) ||
        trade_pilot::SerializeJson(plan_chain) != trade_pilot::SerializeJson(chain)) {
      std::cerr << "预期计划回放与决策回放一致\n";
      return 1;
    }
    trade_pilot::JsonValue signal_view;
    if (!view.ReplayForSignal("S1", &signal_view, &error)) {
      std::cerr << "信号回放失败: " << error << "\n";
      return 1;
    }
    if (view.ReplayForDecision("missing", &chain, &error) || error != "Decision not found") {
      std::cerr << "预期不存在的决策返回 Decision not found\n";
      return 1;
    }
    const trade_pilot::JsonValue listed =
        view.ListExecutions(plan.id);
    if (listed.array_value.size() != 3) {
      std::cerr << "预期列出 3 条执行记录\n";
      return 1;
    }
    trade_pilot::DecisionFilter live_decisions;
    live_decisions.trader_id = "T1";
    live_decisions.is_paper = false;
    trade_pilot::DecisionFilter paper_decisions = live_decisions;
    paper_decisions.is_paper = true;
    if (view.ListDecisions(live_decisions).array_value.size() != 1 ||
        !view.ListDecisions(paper_decisions).array_value.empty()) {
      std::cerr << "预期决策列表按纸面标记过滤\n";
      return 1;
    }
    trade_pilot::TradePlanFilter filled_plans;
    filled_plans.exchange_account_id = "acct-1";
    filled_plans.status = trade_pilot::TradePlanStatus::kEntryFilled;
    const trade_pilot::JsonValue plans = view.ListTradePlans(filled_plans);
    if (plans.array_value.size() != 1 ||
        trade_pilot::JsonAsString(
            trade_pilot::JsonObjectField(&plans.array_value[0], "status")) !=
            std::optional<std::string>("entry_filled")) {
      std::cerr << "预期交易计划列表按状态过滤\n";
      return 1;
    }
  }

  {
    // 纸面开关优先于 trader.mode：有交易所行情，但不下单。
    ManualClock clock(kBaseTimeMs);
    RecordingSleeper sleeper;
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kLive, "acct-1",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    ExchangeScript exchange;
    exchange.ticker = trade_pilot::Decimal("40000");
    ScriptedModelRouter router;
    router.SetResponse(ModelOk(OpenPlanJson(5)));
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::TraderCycleOptions options;
    options.paper_trading = true;
    trade_pilot::TraderCycle cycle(&store, &locks, &router, &risk, &cipher,
                                   ScriptedFactory(&exchange), options, &clock, &sleeper);
    const trade_pilot::CycleSummary summary = cycle.Run("T1");
    trade_pilot::DecisionLogRecord decision;
    trade_pilot::TradePlanRecord plan;
    if (summary.executed != 1 || !store.FindDecision(summary.decision_ids[0], &decision) ||
        !store.FindTradePlan(decision.trade_plan_id, &plan)) {
      std::cerr << "预期纸面决策已执行\n";
      return 1;
    }
    if (!plan.is_paper || !decision.is_paper ||
        plan.status != trade_pilot::TradePlanStatus::kTpSlPlaced ||
        plan.entry_price != trade_pilot::Decimal("40000") || exchange.market_orders != 0 ||
        exchange.protective_orders != 0) {
      std::cerr << "预期纸面计划按行情价模拟成交且不下单\n";
      return 1;
    }
  }

  {
    // 无交易所账户的纸面 trader：以快照收盘价模拟成交，TP/SL 无价降级。
    ManualClock clock(kBaseTimeMs);
    RecordingSleeper sleeper;
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kPaper, "missing",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    ExchangeScript exchange;
    ScriptedModelRouter router;
    router.SetResponse(ModelOk(OpenPlanJson(5)));
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::TraderCycle cycle(&store, &locks, &router, &risk, &cipher,
                                   ScriptedFactory(&exchange),
                                   trade_pilot::TraderCycleOptions{}, &clock, &sleeper);
    const trade_pilot::CycleSummary summary = cycle.Run("T1");
    trade_pilot::DecisionLogRecord decision;
    trade_pilot::TradePlanRecord plan;
    if (summary.executed != 1 || !store.FindDecision(summary.decision_ids[0], &decision) ||
        !store.FindTradePlan(decision.trade_plan_id, &plan)) {
      std::cerr << "预期无账户纸面决策已执行\n";
      return 1;
    }
    if (plan.status != trade_pilot::TradePlanStatus::kEntryFilled ||
        plan.entry_price != trade_pilot::Decimal("50000") || plan.tp_price.has_value() ||
        plan.sl_price.has_value()) {
      std::cerr << "预期以快照收盘价成交且 TP/SL 为空\n";
      return 1;
    }
  }

  {
    // 模型失败、输出非法、skip 与风控拦截各自落到对应决策状态。
    struct Case {
      std::string name;
      trade_pilot::ModelResponse response;
      trade_pilot::DecisionStatus expected;
      std::string expected_error;
    };
    const std::vector<Case> cases = {
        {"auth", trade_pilot::ModelFailure(trade_pilot::ModelErrorType::kAuth, "bad key"),
         trade_pilot::DecisionStatus::kFailed, "AI error: auth"},
        {"invalid", ModelOk("I think you should buy"), trade_pilot::DecisionStatus::kFailed,
         "Invalid JSON: "},
        {"skip", ModelOk(R"({"action":"skip","confidence":0.2,"reason_summary":"no edge"})"),
         trade_pilot::DecisionStatus::kAllowed, ""},
        {"blocked", ModelOk(OpenPlanJson(20)), trade_pilot::DecisionStatus::kBlocked, ""},
    };
    for (const Case& test_case : cases) {
      ManualClock clock(kBaseTimeMs);
      RecordingSleeper sleeper;
      trade_pilot::MemoryTradeStore store(&clock);
      trade_pilot::InMemoryLockStore locks(&clock);
      std::string error;
      if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kLive, "acct-1",
                           &error)) {
        std::cerr << "测试数据写入失败: " << error << "\n";
        return 1;
      }
      ExchangeScript exchange;
      ScriptedModelRouter router;
      router.SetResponse(test_case.response);
      const trade_pilot::RiskManager risk(&clock);
      trade_pilot::TraderCycle cycle(&store, &locks, &router, &risk, &cipher,
                                     ScriptedFactory(&exchange),
                                     trade_pilot::TraderCycleOptions{}, &clock, &sleeper);
      const trade_pilot::CycleSummary summary = cycle.Run("T1");
      trade_pilot::DecisionLogRecord decision;
      if (summary.decision_ids.size() != 1 ||
          !store.FindDecision(summary.decision_ids[0], &decision)) {
        std::cerr << test_case.name << ": 预期生成一条决策\n";
        return 1;
      }
      if (decision.status != test_case.expected ||
          decision.execution_error.rfind(test_case.expected_error, 0) != 0) {
        std::cerr << test_case.name << ": 决策状态不符合预期，实际 "
                  << trade_pilot::ToString(decision.status) << " / "
                  << decision.execution_error << "\n";
        return 1;
      }
      if (!decision.trade_plan_id.empty() || exchange.market_orders != 0) {
        std::cerr << test_case.name << ": 预期不生成交易计划\n";
        return 1;
      }
      const int expected_calls = test_case.name == "invalid" ? 2 : 1;
      if (router.calls() != expected_calls) {
        std::cerr << test_case.name << ": 模型调用次数不符合预期，实际 "
                  << router.calls() << "\n";
        return 1;
      }
      if (test_case.name == "blocked" &&
          (decision.risk_allowed != std::optional<bool>(false) ||
           !HasReasonContaining(decision.risk_reasons, "Leverage 20 exceeds max 10"))) {
        std::cerr << "预期风控拦截原因写入决策\n";
        return 1;
      }
      if (test_case.name == "skip" &&
          (decision.risk_reasons != std::vector<std::string>{"Action is skip"} ||
           decision.confidence != 0.2)) {
        std::cerr << "预期 skip 决策记录放行原因与置信度\n";
        return 1;
      }
    }
  }

  {
    // 首次输出未通过校验时以严格提示重试一次，重试结果合法则照常执行。
    ManualClock clock(kBaseTimeMs);
    RecordingSleeper sleeper;
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kPaper, "acct-1",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    ExchangeScript exchange;
    ScriptedModelRouter router;
    router.QueueResponse(ModelOk("Sure! Here is my plan: buy BTC"));
    router.SetResponse(ModelOk(OpenPlanJson(5)));
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::TraderCycle cycle(&store, &locks, &router, &risk, &cipher,
                                   ScriptedFactory(&exchange),
                                   trade_pilot::TraderCycleOptions{}, &clock, &sleeper);
    const trade_pilot::CycleSummary summary = cycle.Run("T1");
    trade_pilot::DecisionLogRecord decision;
    if (summary.executed != 1 || summary.decision_ids.size() != 1 ||
        !store.FindDecision(summary.decision_ids[0], &decision)) {
      std::cerr << "预期重试后执行一个决策\n";
      return 1;
    }
    if (router.calls() != 2 ||
        router.last_system_prompt() != trade_pilot::RetrySystemPrompt()) {
      std::cerr << "预期第二次调用使用严格提示\n";
      return 1;
    }
    if (decision.status != trade_pilot::DecisionStatus::kExecuted ||
        decision.tokens_used != std::optional<std::int64_t>(300) ||
        decision.trade_plan_id.empty()) {
      std::cerr << "预期决策累计两次调用的 token 并关联计划\n";
      return 1;
    }
  }

  {
    // trader 锁被占用时跳过周期，不创建决策。
    ManualClock clock(kBaseTimeMs);
    RecordingSleeper sleeper;
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kPaper, "acct-1",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    trade_pilot::DistributedMutex other(&locks, trade_pilot::TraderLockName("T1"), 60000);
    if (!other.TryAcquire()) {
      std::cerr << "预期占用 trader 锁成功\n";
      return 1;
    }
    ExchangeScript exchange;
    ScriptedModelRouter router;
    router.SetResponse(ModelOk(OpenPlanJson(5)));
    const trade_pilot::RiskManager risk(&clock);
    trade_pilot::TraderCycleOptions options;
    options.lock_timeout_ms = 300;
    trade_pilot::TraderCycle cycle(&store, &locks, &router, &risk, &cipher,
                                   ScriptedFactory(&exchange), options, &clock, &sleeper);
    const trade_pilot::CycleSummary summary = cycle.Run("T1");
    if (!summary.skipped_lock_contention || summary.decisions_created != 0 ||
        router.calls() != 0) {
      std::cerr << "预期锁竞争时跳过周期\n";
      return 1;
    }
    const trade_pilot::CycleSummary missing = cycle.Run("no-such-trader");
    if (missing.trader_found) {
      std::cerr << "预期不存在的 trader 静默返回\n";
      return 1;
    }
  }

  {
    // 模型调用超过锁 TTL，另一个 worker 接手：原周期续期失败后停止，每个信号只处理一次。
    ManualClock clock(kBaseTimeMs);
    RecordingSleeper sleeper;
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kPaper, "acct-1",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    clock.Advance(1000);
    trade_pilot::SignalRecord second;
    second.id = "S2";
    second.strategy_id = "strat-1";
    second.symbol = "BTCUSDT";
    second.timeframe = "1h";
    second.snapshot_id = "snap-1";
    if (!store.InsertSignal(&second, &error)) {
      std::cerr << "信号写入失败: " << error << "\n";
      return 1;
    }

    ExchangeScript exchange;
    const trade_pilot::RiskManager risk(&clock);
    ScriptedModelRouter takeover_router;
    takeover_router.SetResponse(ModelOk(OpenPlanJson(5)));
    trade_pilot::TraderCycle takeover(&store, &locks, &takeover_router, &risk, &cipher,
                                      ScriptedFactory(&exchange),
                                      trade_pilot::TraderCycleOptions{}, &clock, &sleeper);
    trade_pilot::CycleSummary takeover_summary;
    ScriptedModelRouter slow_router;
    slow_router.SetResponse(ModelOk(OpenPlanJson(5)));
    slow_router.SetOnCall([&](int call) {
      if (call == 1) {
        clock.Advance(61000);
        takeover_summary = takeover.Run("T1");
      }
    });
    trade_pilot::TraderCycle slow(&store, &locks, &slow_router, &risk, &cipher,
                                  ScriptedFactory(&exchange),
                                  trade_pilot::TraderCycleOptions{}, &clock, &sleeper);
    const trade_pilot::CycleSummary summary = slow.Run("T1");
    if (!summary.lock_lost || summary.decisions_created != 1 ||
        slow_router.calls() != 1) {
      std::cerr << "预期原周期处理一个信号后因锁失效停止\n";
      return 1;
    }
    if (takeover_summary.skipped_lock_contention || takeover_summary.executed != 1 ||
        takeover_router.calls() != 1) {
      std::cerr << "预期接手的 worker 处理剩余信号\n";
      return 1;
    }
    if (store.DecisionsForSignal("S1").size() != 1 ||
        store.DecisionsForSignal("S2").size() != 1) {
      std::cerr << "预期每个信号只有一条决策\n";
      return 1;
    }
  }

  {
    // 处理途中其它 worker 已为同一 trader/signal 写入决策：本周期跳过该信号，不再调用模型。
    ManualClock clock(kBaseTimeMs);
    RecordingSleeper sleeper;
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kPaper, "acct-1",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    clock.Advance(1000);
    trade_pilot::SignalRecord second;
    second.id = "S2";
    second.strategy_id = "strat-1";
    second.symbol = "BTCUSDT";
    second.timeframe = "1h";
    second.snapshot_id = "snap-1";
    if (!store.InsertSignal(&second, &error)) {
      std::cerr << "信号写入失败: " << error << "\n";
      return 1;
    }

    ExchangeScript exchange;
    const trade_pilot::RiskManager risk(&clock);
    ScriptedModelRouter router;
    router.SetResponse(ModelOk(OpenPlanJson(5)));
    bool inserted = false;
    router.SetOnCall([&](int call) {
      if (call != 1) {
        return;
      }
      clock.Advance(61000);
      trade_pilot::DecisionLogRecord other;
      other.trader_id = "T1";
      other.signal_id = "S1";
      other.client_order_id = "Tother-worker";
      std::string insert_error;
      inserted = store.InsertDecision(&other, &insert_error);
    });
    trade_pilot::TraderCycleOptions options;
    options.lock_ttl_ms = 600000;
    trade_pilot::TraderCycle cycle(&store, &locks, &router, &risk, &cipher,
                                   ScriptedFactory(&exchange), options, &clock, &sleeper);
    const trade_pilot::CycleSummary summary = cycle.Run("T1");
    if (!inserted || summary.lock_lost || summary.duplicates_skipped != 1 ||
        router.calls() != 1) {
      std::cerr << "预期已有决策的信号被跳过，实际 duplicates_skipped="
                << summary.duplicates_skipped << "\n";
      return 1;
    }
    if (store.DecisionsForSignal("S1").size() != 1) {
      std::cerr << "预期 S1 只保留其它 worker 写入的决策\n";
      return 1;
    }
  }

  {
    // 对账：入场成交后前推计划；重复对账结果不变；保护单全部终结后完成。
    ManualClock clock(kBaseTimeMs);
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kLive, "acct-1",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    ExchangeScript exchange;
    exchange.entry_result = OrderOk("ord-1", trade_pilot::OrderStatus::kNew, "NEW");
    ScriptedExchangeAdapter adapter(&exchange);
    trade_pilot::TradeExecutor executor(&store, &clock);
    trade_pilot::ExecutionRequest request;
    request.plan.symbol = "BTCUSDT";
    request.plan.quantity = trade_pilot::Decimal("0.01");
    request.exchange_account_id = "acct-1";
    request.client_order_id = "Trecon";
    request.is_paper = false;
    trade_pilot::TradePlanRecord plan;
    if (!executor.Execute(request, &adapter, &plan, &error) ||
        plan.status != trade_pilot::TradePlanStatus::kEntryPlaced) {
      std::cerr << "预期入场挂单后计划为 entry_placed\n";
      return 1;
    }

    trade_pilot::OrderResult filled =
        OrderOk("ord-1", trade_pilot::OrderStatus::kFilled, "FILLED");
    filled.filled_price = trade_pilot::Decimal("50020");
    exchange.orders["ord-1"] = filled;

    trade_pilot::ReconciliationEngine engine(&store, &locks, &cipher,
                                             ScriptedFactory(&exchange),
                                             trade_pilot::ReconcileOptions{}, &clock);
    clock.Advance(60000);
    const trade_pilot::ReconcileSummary first = engine.Run("acct-1");
    if (!first.account_found || first.checked != 1 || first.updated != 1) {
      std::cerr << "预期首次对账更新一个计划\n";
      return 1;
    }
    trade_pilot::TradePlanRecord reconciled;
    if (!store.FindTradePlan(plan.id, &reconciled) ||
        reconciled.status != trade_pilot::TradePlanStatus::kEntryFilled ||
        reconciled.entry_price != trade_pilot::Decimal("50020")) {
      std::cerr << "预期对账后计划为 entry_filled 且补齐成交价\n";
      return 1;
    }
    const std::vector<trade_pilot::ExecutionRecord> executions =
        store.ExecutionsForPlan(plan.id);
    if (executions.size() != 1 ||
        executions[0].status != trade_pilot::ExecutionStatus::kFilled ||
        executions[0].filled_at_ms != std::optional<std::int64_t>(kBaseTimeMs + 60000)) {
      std::cerr << "预期执行记录更新为 filled\n";
      return 1;
    }

    const int get_order_calls = exchange.get_order_calls;
    const trade_pilot::ReconcileSummary second = engine.Run("acct-1");
    trade_pilot::TradePlanRecord again;
    if (second.updated != 0 || exchange.get_order_calls != get_order_calls ||
        !store.FindTradePlan(plan.id, &again) || again.status != reconciled.status ||
        again.updated_at_ms != reconciled.updated_at_ms) {
      std::cerr << "预期重复对账不改变任何状态\n";
      return 1;
    }

    // 带保护单的计划：TP 成交、SL 撤销后计划完成。
    exchange.entry_result = OrderOk("ord-2", trade_pilot::OrderStatus::kFilled, "FILLED");
    exchange.entry_result.filled_price = trade_pilot::Decimal("50000");
    exchange.tp_result = OrderOk("tp-2", trade_pilot::OrderStatus::kNew, "NEW");
    exchange.sl_result = OrderOk("sl-2", trade_pilot::OrderStatus::kNew, "NEW");
    request.client_order_id = "Trecon2";
    request.plan.tp_price = trade_pilot::Decimal("51000");
    request.plan.sl_price = trade_pilot::Decimal("49500");
    trade_pilot::TradePlanRecord protected_plan;
    if (!executor.Execute(request, &adapter, &protected_plan, &error) ||
        protected_plan.status != trade_pilot::TradePlanStatus::kTpSlPlaced) {
      std::cerr << "预期保护单全部成功后为 tp_sl_placed\n";
      return 1;
    }
    exchange.orders["tp-2"] = OrderOk("tp-2", trade_pilot::OrderStatus::kFilled, "FILLED");
    exchange.orders["sl-2"] = OrderOk("sl-2", trade_pilot::OrderStatus::kCanceled, "CANCELED");
    const trade_pilot::ReconcileSummary third = engine.Run("acct-1");
    trade_pilot::TradePlanRecord completed;
    if (third.updated != 1 || !store.FindTradePlan(protected_plan.id, &completed) ||
        completed.status != trade_pilot::TradePlanStatus::kCompleted) {
      std::cerr << "预期保护单终结后计划完成\n";
      return 1;
    }

    // 查单失败只计数并跳过。
    exchange.entry_result = OrderOk("ord-3", trade_pilot::OrderStatus::kNew, "NEW");
    request.client_order_id = "Trecon3";
    request.plan.tp_price.reset();
    request.plan.sl_price.reset();
    trade_pilot::TradePlanRecord lost_plan;
    if (!executor.Execute(request, &adapter, &lost_plan, &error)) {
      std::cerr << "实盘执行持久化失败: " << error << "\n";
      return 1;
    }
    const trade_pilot::ReconcileSummary fourth = engine.Run("acct-1");
    if (fourth.errors != 1) {
      std::cerr << "预期查单失败计入 errors\n";
      return 1;
    }

    trade_pilot::DistributedMutex other(&locks, trade_pilot::ReconcileLockName("acct-1"),
                                        60000);
    if (!other.TryAcquire()) {
      std::cerr << "预期占用对账锁成功\n";
      return 1;
    }
    const trade_pilot::ReconcileSummary contended = engine.Run("acct-1");
    if (!contended.skipped_lock_contention || contended.checked != 0) {
      std::cerr << "预期对账锁被占用时跳过\n";
      return 1;
    }

    if (trade_pilot::MapExchangeOrderStatus("Closed") !=
            std::optional<trade_pilot::ExecutionStatus>(trade_pilot::ExecutionStatus::kFilled) ||
        trade_pilot::MapExchangeOrderStatus("expired") !=
            std::optional<trade_pilot::ExecutionStatus>(
                trade_pilot::ExecutionStatus::kCancelled) ||
        trade_pilot::MapExchangeOrderStatus("open").has_value()) {
      std::cerr << "对账状态词表映射不符合预期\n";
      return 1;
    }
  }

  {
    // 对账：入场部分成交只更新数量，计划保持 entry_placed；全部成交后再前推。
    ManualClock clock(kBaseTimeMs);
    trade_pilot::MemoryTradeStore store(&clock);
    trade_pilot::InMemoryLockStore locks(&clock);
    std::string error;
    if (!SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kLive, "acct-1",
                         &error)) {
      std::cerr << "测试数据写入失败: " << error << "\n";
      return 1;
    }
    ExchangeScript exchange;
    exchange.entry_result = OrderOk("ord-p", trade_pilot::OrderStatus::kNew, "NEW");
    ScriptedExchangeAdapter adapter(&exchange);
    trade_pilot::TradeExecutor executor(&store, &clock);
    trade_pilot::ExecutionRequest request;
    request.plan.symbol = "BTCUSDT";
    request.plan.quantity = trade_pilot::Decimal("0.01");
    request.exchange_account_id = "acct-1";
    request.client_order_id = "Tpartial";
    request.is_paper = false;
    trade_pilot::TradePlanRecord plan;
    if (!executor.Execute(request, &adapter, &plan, &error)) {
      std::cerr << "实盘执行持久化失败: " << error << "\n";
      return 1;
    }

    trade_pilot::OrderResult partial = OrderOk(
        "ord-p", trade_pilot::OrderStatus::kPartiallyFilled, "PARTIALLY_FILLED");
    partial.filled_qty = trade_pilot::Decimal("0.004");
    exchange.orders["ord-p"] = partial;
    trade_pilot::ReconciliationEngine engine(&store, &locks, &cipher,
                                             ScriptedFactory(&exchange),
                                             trade_pilot::ReconcileOptions{}, &clock);
    clock.Advance(60000);
    const trade_pilot::ReconcileSummary first = engine.Run("acct-1");
    trade_pilot::TradePlanRecord reconciled;
    std::vector<trade_pilot::ExecutionRecord> executions = store.ExecutionsForPlan(plan.id);
    if (first.errors != 0 || executions.size() != 1 ||
        executions[0].status != trade_pilot::ExecutionStatus::kPartiallyFilled ||
        executions[0].quantity != trade_pilot::Decimal("0.004") ||
        executions[0].filled_at_ms.has_value()) {
      std::cerr << "预期部分成交更新执行记录数量\n";
      return 1;
    }
    if (!store.FindTradePlan(plan.id, &reconciled) ||
        reconciled.status != trade_pilot::TradePlanStatus::kEntryPlaced ||
        reconciled.entry_price.has_value()) {
      std::cerr << "预期部分成交时计划保持 entry_placed\n";
      return 1;
    }

    trade_pilot::OrderResult filled =
        OrderOk("ord-p", trade_pilot::OrderStatus::kFilled, "FILLED");
    filled.filled_qty = trade_pilot::Decimal("0.01");
    filled.filled_price = trade_pilot::Decimal("49990");
    exchange.orders["ord-p"] = filled;
    clock.Advance(60000);
    const trade_pilot::ReconcileSummary second = engine.Run("acct-1");
    if (second.updated != 1 || !store.FindTradePlan(plan.id, &reconciled) ||
        reconciled.status != trade_pilot::TradePlanStatus::kEntryFilled ||
        reconciled.entry_price != trade_pilot::Decimal("49990")) {
      std::cerr << "预期部分成交后再全部成交时计划前推为 entry_filled\n";
      return 1;
    }

    if (trade_pilot::MapExchangeOrderStatus(" Partial ") !=
            std::optional<trade_pilot::ExecutionStatus>(
                trade_pilot::ExecutionStatus::kPartiallyFilled) ||
        trade_pilot::MapExchangeOrderStatus("canceled") !=
            std::optional<trade_pilot::ExecutionStatus>(
                trade_pilot::ExecutionStatus::kCancelled) ||
        trade_pilot::MapExchangeOrderStatus("CANCELLED") !=
            std::optional<trade_pilot::ExecutionStatus>(
                trade_pilot::ExecutionStatus::kCancelled) ||
        trade_pilot::MapExchangeOrderStatus("FILLED") !=
            std::optional<trade_pilot::ExecutionStatus>(
                trade_pilot::ExecutionStatus::kFilled)) {
      std::cerr << "对账状态词表映射不符合预期\n";
      return 1;
    }
  }

  {
    // 文本工具：按码点截断不切断多字节字符。
    if (trade_pilot::TruncateCodePoints("中文测试", 2) != "中文" ||
        trade_pilot::Utf8Length("中文ab") != 4 ||
        trade_pilot::TruncateUtf8("中文", 4) != "中") {
      std::cerr << "UTF-8 截断不符合预期\n";
      return 1;
    }
  }

  {
    // worker 启动：空库跑一轮正常退出；已启用 trader 引用未知交易所时拒绝启动。
    const std::filesystem::path dir = FreshTempDir("worker");
    trade_pilot::AppConfig config;
    config.master_key = kMasterKey;
    config.app.data_path = dir.string();
    config.log_level = trade_pilot::LogLevel::kError;
    {
      trade_pilot::WorkerApplication app(config);
      if (app.Run(trade_pilot::WorkerRunOptions{.max_ticks = std::nullopt, .once = true}) !=
          0) {
        std::cerr << "预期空库 worker 正常退出\n";
        return 1;
      }
    }
    {
      trade_pilot::WalTradeStore store((dir / "trade_store.wal").string());
      std::string error;
      if (!store.Open(&error) ||
          !SeedTraderWorld(&store, cipher, trade_pilot::TraderMode::kPaper, "acct-1",
                           &error)) {
        std::cerr << "worker 测试数据写入失败: " << error << "\n";
        return 1;
      }
      trade_pilot::ExchangeAccountRecord account;
      if (!store.FindExchangeAccount("acct-1", &account)) {
        std::cerr << "预期账户已写入\n";
        return 1;
      }
      account.exchange = "kraken";
      if (!store.UpsertExchangeAccount(&account, &error)) {
        std::cerr << "账户更新失败: " << error << "\n";
        return 1;
      }
    }
    trade_pilot::WorkerApplication app(config);
    if (app.Run(trade_pilot::WorkerRunOptions{.max_ticks = 1, .once = false}) == 0) {
      std::cerr << "预期未知交易所时 worker 拒绝启动\n";
      return 1;
    }
    config.master_key = "short";
    trade_pilot::WorkerApplication no_key(config);
    if (no_key.Run(trade_pilot::WorkerRunOptions{.max_ticks = 1, .once = false}) == 0) {
      std::cerr << "预期主密钥不可用时 worker 拒绝启动\n";
      return 1;
    }
  }

  std::cout << "trade_pilot 测试全部通过\n";
  return 0;
}
