#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "core/config.h"
#include "exchange/exchange_support.h"
#include "execution/worker_pool.h"
#include "lock/lock_store.h"
#include "model/model_router.h"
#include "oms/reconciler.h"
#include "risk/risk_manager.h"
#include "security/secrets_cipher.h"
#include "storage/wal_trade_store.h"
#include "trader/trader_cycle.h"

namespace trade_pilot {

/// 运行方式（命令行决定）。
struct WorkerRunOptions {
  std::optional<int> max_ticks;  ///< 为空且未指定 once 时常驻运行。
  bool once{false};
};

/**
 * @brief worker 进程主应用
 *
 * 负责：
 * 1. 组装存储、锁、模型路由、风控与交易所工厂；
 * 2. 启动期校验交易所/模型供应商标识（未知标识为致命配置错误）；
 * 3. 每个 tick 把启用 trader 的决策周期和到期账户的对账投递到工作池。
 */
class WorkerApplication {
 public:
  explicit WorkerApplication(AppConfig config);
  ~WorkerApplication();

  /// @return 进程退出码（0 正常；非 0 初始化失败）
  int Run(const WorkerRunOptions& options);

 private:
  bool Initialize();
  /// 启动期检查所有已配置的交易所账户与模型配置。
  bool ValidateRegisteredIdentifiers() const;
  void DispatchTick(bool reconcile_due);

  AppConfig config_;
  SecretsCipher cipher_;
  std::unique_ptr<WalTradeStore> store_;
  std::unique_ptr<LockStore> lock_store_;
  std::unique_ptr<ModelRouter> model_router_;
  std::unique_ptr<RiskManager> risk_manager_;
  SymbolInfoCache symbol_cache_;
  std::unique_ptr<TraderCycle> trader_cycle_;
  std::unique_ptr<ReconciliationEngine> reconciler_;
  std::unique_ptr<WorkerPool> pool_;
};

}  // namespace trade_pilot
