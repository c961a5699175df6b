#include <optional>
#include <string>
#include <utility>

#include "app/worker_app.h"
#include "core/config.h"
#include "core/log.h"

namespace {

struct RuntimeOptions {
  std::string config_path{"config/default.yaml"};
  std::optional<int> max_ticks;
  bool once{false};
  bool run_forever{false};
};

bool ParseNonNegativeInt(const std::string& raw, int* out_value) {
  if (out_value == nullptr || raw.empty()) {
    return false;
  }
  int parsed = 0;
  for (char c : raw) {
    if (c < '0' || c > '9') {
      return false;
    }
    if (parsed > 100000000) {
      return false;
    }
    parsed = parsed * 10 + (c - '0');
  }
  *out_value = parsed;
  return true;
}

RuntimeOptions ParseOptions(int argc, char** argv) {
  RuntimeOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0) {
      options.config_path = arg.substr(std::string("--config=").size());
      continue;
    }
    if (arg == "--config" && i + 1 < argc) {
      ++i;
      options.config_path = argv[i];
      continue;
    }
    if (arg.rfind("--max_ticks=", 0) == 0) {
      int parsed = 0;
      const std::string raw = arg.substr(std::string("--max_ticks=").size());
      if (ParseNonNegativeInt(raw, &parsed)) {
        options.max_ticks = parsed;
      } else {
        trade_pilot::LogWarn("--max_ticks 参数非法，已忽略: " + raw);
      }
      continue;
    }
    if (arg == "--once") {
      options.once = true;
      continue;
    }
    if (arg == "--run_forever") {
      options.run_forever = true;
      continue;
    }
    trade_pilot::LogWarn("未知参数，已忽略: " + arg);
  }
  return options;
}

}  // namespace

int main(int argc, char** argv) {
  trade_pilot::LogInfo("启动 trade_pilot worker...");
  const RuntimeOptions options = ParseOptions(argc, argv);

  trade_pilot::AppConfig config;
  std::string config_error;
  if (!trade_pilot::LoadAppConfigFromYaml(options.config_path, &config,
                                          &config_error)) {
    trade_pilot::LogError("配置加载失败: " + config_error);
    return 1;
  }

  trade_pilot::LogInfo(
      "配置加载成功: config=" + options.config_path +
      ", app.paper_trading=" + (config.app.paper_trading ? "true" : "false") +
      ", app.cycle_interval_seconds=" +
      std::to_string(config.app.cycle_interval_seconds) +
      ", app.worker_threads=" + std::to_string(config.app.worker_threads) +
      ", app.data_path=" + config.app.data_path +
      ", locks.backend=" + trade_pilot::ToString(config.locks.backend) +
      ", reconcile.interval_seconds=" +
      std::to_string(config.reconcile.interval_seconds) +
      ", model.max_attempts=" + std::to_string(config.model.max_attempts));

  trade_pilot::WorkerRunOptions run_options;
  run_options.once = options.once;
  if (!options.run_forever) {
    run_options.max_ticks = options.max_ticks;
  }

  trade_pilot::WorkerApplication app(std::move(config));
  return app.Run(run_options);
}
