#include "app/worker_app.h"

#include <filesystem>
#include <utility>

#include "core/clock.h"
#include "core/decimal.h"
#include "core/log.h"
#include "exchange/exchange_factory.h"
#include "lock/memory_lock_store.h"
#include "lock/redis_lock_store.h"

namespace trade_pilot {

namespace {

constexpr std::int64_t kSecondMs = 1000;

}  // namespace

WorkerApplication::WorkerApplication(AppConfig config)
    : config_(std::move(config)) {}

WorkerApplication::~WorkerApplication() {
  if (pool_ != nullptr) {
    pool_->Stop();
  }
}

bool WorkerApplication::Initialize() {
  SetMinLogLevel(config_.log_level);

  std::string error;
  if (!cipher_.Initialize(config_.master_key, &error)) {
    LogError("凭证主密钥不可用（TRADE_PILOT_MASTER_KEY）: " + error);
    return false;
  }

  const std::string wal_path =
      (std::filesystem::path(config_.app.data_path) / "trade_store.wal").string();
  store_ = std::make_unique<WalTradeStore>(wal_path);
  if (!store_->Open(&error)) {
    LogError("存储初始化失败: path=" + wal_path + ", error=" + error);
    return false;
  }
  if (!ValidateRegisteredIdentifiers()) {
    return false;
  }

  if (config_.locks.backend == LockBackend::kRedis) {
    lock_store_ = std::make_unique<RedisLockStore>(config_.locks.redis_host,
                                                   config_.locks.redis_port);
  } else {
    lock_store_ = std::make_unique<InMemoryLockStore>();
  }

  model_router_ = std::make_unique<ModelRouter>(ModelRouterOptions{
      .max_attempts = config_.model.max_attempts,
      .rate_limit_per_minute = config_.model.rate_limit_per_minute,
      .timeout_ms = config_.model.timeout_ms,
      .clock = &DefaultClock(),
      .sleeper = &DefaultSleeper(),
      .transport_factory = nullptr,
  });
  risk_manager_ = std::make_unique<RiskManager>();

  ExchangeAdapterOptions exchange_options;
  exchange_options.sleeper = &DefaultSleeper();
  exchange_options.symbol_cache = &symbol_cache_;
  const ExchangeAdapterFactory adapter_factory =
      MakeExchangeAdapterFactory(exchange_options);

  TraderCycleOptions cycle_options;
  cycle_options.paper_trading = config_.app.paper_trading;
  cycle_options.signal_batch_size =
      static_cast<std::size_t>(config_.app.signal_batch_size);
  cycle_options.lock_ttl_ms = config_.locks.trader_ttl_seconds * kSecondMs;
  cycle_options.lock_timeout_ms = config_.locks.blocking_timeout_ms;
  cycle_options.lock_poll_interval_ms = config_.locks.poll_interval_ms;
  if (!ParseDecimal(config_.app.paper_balance, &cycle_options.paper_balance)) {
    LogError("app.paper_balance 非法: " + config_.app.paper_balance);
    return false;
  }
  trader_cycle_ = std::make_unique<TraderCycle>(
      store_.get(), lock_store_.get(), model_router_.get(), risk_manager_.get(),
      &cipher_, adapter_factory, cycle_options);

  reconciler_ = std::make_unique<ReconciliationEngine>(
      store_.get(), lock_store_.get(), &cipher_, adapter_factory,
      ReconcileOptions{
          .lookback_hours = config_.reconcile.lookback_hours,
          .batch_size = static_cast<std::size_t>(config_.reconcile.batch_size),
          .lock_ttl_ms = config_.locks.reconcile_ttl_seconds * kSecondMs,
      });

  pool_ = std::make_unique<WorkerPool>(
      static_cast<std::size_t>(config_.app.worker_threads));
  pool_->Start();

  LogInfo("worker 初始化完成: paper_trading=" +
          std::string(config_.app.paper_trading ? "true" : "false") +
          ", lock_backend=" + ToString(config_.locks.backend) +
          ", worker_threads=" + std::to_string(pool_->thread_count()) +
          ", traders=" + std::to_string(store_->EnabledTraders().size()) +
          ", accounts=" + std::to_string(store_->ActiveExchangeAccounts().size()));
  return true;
}

bool WorkerApplication::ValidateRegisteredIdentifiers() const {
  for (const TraderRecord& trader : store_->EnabledTraders()) {
    ExchangeAccountRecord account;
    if (store_->FindExchangeAccount(trader.exchange_account_id, &account) &&
        !IsSupportedExchange(account.exchange)) {
      LogError("Unknown exchange: " + account.exchange +
               " (account_id=" + account.id + ")");
      return false;
    }
    ModelConfigRecord model;
    if (store_->FindModelConfig(trader.model_config_id, &model) &&
        !IsSupportedProvider(model.provider)) {
      LogError("Unknown provider: " + model.provider +
               " (model_config_id=" + model.id + ")");
      return false;
    }
  }
  return true;
}

void WorkerApplication::DispatchTick(bool reconcile_due) {
  // 读入信号生产方与其它 worker 追加的记录。
  std::string error;
  if (!store_->Refresh(&error)) {
    LogError("存储同步失败，本轮不投递任务: error=" + error);
    return;
  }
  for (const TraderRecord& trader : store_->EnabledTraders()) {
    const std::string trader_id = trader.id;
    const bool submitted =
        pool_->Submit("trader_cycle:" + trader_id,
                      [this, trader_id] { trader_cycle_->Run(trader_id); });
    if (!submitted) {
      LogWarn("工作池已停止，trader 周期未投递: trader_id=" + trader_id);
    }
  }
  if (reconcile_due) {
    for (const ExchangeAccountRecord& account : store_->ActiveExchangeAccounts()) {
      const std::string account_id = account.id;
      const bool submitted =
          pool_->Submit("reconcile:" + account_id,
                        [this, account_id] { reconciler_->Run(account_id); });
      if (!submitted) {
        LogWarn("工作池已停止，对账未投递: account_id=" + account_id);
      }
    }
  }
  pool_->WaitIdle();
}

int WorkerApplication::Run(const WorkerRunOptions& options) {
  if (!Initialize()) {
    return 1;
  }

  const Clock& clock = DefaultClock();
  const Sleeper& sleeper = DefaultSleeper();
  const std::int64_t cycle_interval_ms =
      config_.app.cycle_interval_seconds * kSecondMs;
  const std::int64_t reconcile_interval_ms =
      config_.reconcile.interval_seconds * kSecondMs;

  std::optional<int> max_ticks = options.max_ticks;
  if (options.once) {
    max_ticks = 1;
  }

  std::int64_t last_reconcile_ms = 0;
  for (int tick = 0; !max_ticks.has_value() || tick < *max_ticks; ++tick) {
    const std::int64_t tick_start_ms = clock.NowMs();
    const bool reconcile_due = last_reconcile_ms == 0 ||
                               tick_start_ms - last_reconcile_ms >= reconcile_interval_ms;
    if (reconcile_due) {
      last_reconcile_ms = tick_start_ms;
    }
    DispatchTick(reconcile_due);

    const bool last_tick = max_ticks.has_value() && tick + 1 >= *max_ticks;
    if (last_tick) {
      break;
    }
    const std::int64_t elapsed_ms = clock.NowMs() - tick_start_ms;
    if (elapsed_ms < cycle_interval_ms) {
      sleeper.SleepMs(cycle_interval_ms - elapsed_ms);
    }
  }

  pool_->Stop();
  LogInfo("worker 正常退出");
  return 0;
}

}  // namespace trade_pilot
