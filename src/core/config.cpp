#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "core/decimal.h"

namespace trade_pilot {

namespace {

// 轻量 YAML 解析：按缩进识别 `section:` 与 `key: value`，
// 只覆盖本项目用到的字段。
std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }

  std::size_t end = text.size();
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string StripInlineComment(const std::string& line) {
  // 只剔除引号外的 `#`。
  bool in_single_quotes = false;
  bool in_double_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '\'' && !in_double_quotes) {
      in_single_quotes = !in_single_quotes;
      continue;
    }
    if (ch == '"' && !in_single_quotes) {
      in_double_quotes = !in_double_quotes;
      continue;
    }
    if (ch == '#' && !in_single_quotes && !in_double_quotes) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() < 2) {
    return text;
  }
  const bool single_quoted = text.front() == '\'' && text.back() == '\'';
  const bool double_quoted = text.front() == '"' && text.back() == '"';
  if (single_quoted || double_quoted) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

std::string ToLowerCopy(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ParseInt(const std::string& text, int* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  std::istringstream iss(text);
  int value = 0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseBool(const std::string& text, bool* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  const std::string lowered = ToLowerCopy(text);
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    *out_value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    *out_value = false;
    return true;
  }
  return false;
}

bool ParseLockBackend(const std::string& text, LockBackend* out_backend) {
  const std::string lowered = ToLowerCopy(text);
  if (lowered == "memory") {
    *out_backend = LockBackend::kMemory;
    return true;
  }
  if (lowered == "redis") {
    *out_backend = LockBackend::kRedis;
    return true;
  }
  return false;
}

bool FailLine(const std::string& field, int line_no, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = field + " 解析失败，行号: " + std::to_string(line_no);
  }
  return false;
}

// 整数字段统一走这里；返回 false 时 out_error 已写好行号。
bool AssignInt(const std::string& field,
               const std::string& value,
               int line_no,
               int* target,
               std::string* out_error) {
  int parsed = 0;
  if (!ParseInt(value, &parsed)) {
    return FailLine(field, line_no, out_error);
  }
  *target = parsed;
  return true;
}

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

}  // namespace

bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error) {
  if (out_config == nullptr) {
    return Fail("out_config 为空", out_error);
  }

  std::ifstream input(file_path);
  if (!input.is_open()) {
    return Fail("无法打开配置文件: " + file_path, out_error);
  }

  AppConfig config = *out_config;
  std::string current_section;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string no_comment = Trim(StripInlineComment(line));
    if (no_comment.empty()) {
      continue;
    }

    const std::size_t indent = line.find_first_not_of(' ');
    if (indent == std::string::npos) {
      continue;
    }

    if (indent == 0 && no_comment.back() == ':') {
      current_section = Trim(no_comment.substr(0, no_comment.size() - 1));
      continue;
    }

    if (indent < 2) {
      continue;
    }

    const std::size_t colon_pos = no_comment.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }
    const std::string key = Trim(no_comment.substr(0, colon_pos));
    const std::string raw_value = Trim(no_comment.substr(colon_pos + 1));
    if (raw_value.empty()) {
      continue;
    }
    const std::string value = Unquote(raw_value);
    const std::string field = current_section + "." + key;

    if (current_section == "app" && key == "paper_trading") {
      if (!ParseBool(value, &config.app.paper_trading)) {
        return FailLine(field, line_no, out_error);
      }
      continue;
    }
    if (current_section == "app" && key == "cycle_interval_seconds") {
      if (!AssignInt(field, value, line_no,
                     &config.app.cycle_interval_seconds, out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "app" && key == "worker_threads") {
      if (!AssignInt(field, value, line_no, &config.app.worker_threads,
                     out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "app" && key == "signal_batch_size") {
      if (!AssignInt(field, value, line_no, &config.app.signal_batch_size,
                     out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "app" && key == "data_path") {
      config.app.data_path = value;
      continue;
    }
    if (current_section == "app" && key == "paper_balance") {
      Decimal parsed;
      if (!ParseDecimal(value, &parsed)) {
        return FailLine(field, line_no, out_error);
      }
      config.app.paper_balance = value;
      continue;
    }

    if (current_section == "locks" && key == "backend") {
      if (!ParseLockBackend(value, &config.locks.backend)) {
        return FailLine(field, line_no, out_error);
      }
      continue;
    }
    if (current_section == "locks" && key == "redis_host") {
      config.locks.redis_host = value;
      continue;
    }
    if (current_section == "locks" && key == "redis_port") {
      if (!AssignInt(field, value, line_no, &config.locks.redis_port,
                     out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "locks" && key == "trader_ttl_seconds") {
      if (!AssignInt(field, value, line_no, &config.locks.trader_ttl_seconds,
                     out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "locks" && key == "reconcile_ttl_seconds") {
      if (!AssignInt(field, value, line_no,
                     &config.locks.reconcile_ttl_seconds, out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "locks" && key == "blocking_timeout_ms") {
      if (!AssignInt(field, value, line_no, &config.locks.blocking_timeout_ms,
                     out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "locks" && key == "poll_interval_ms") {
      if (!AssignInt(field, value, line_no, &config.locks.poll_interval_ms,
                     out_error)) {
        return false;
      }
      continue;
    }

    if (current_section == "reconcile" && key == "lookback_hours") {
      if (!AssignInt(field, value, line_no, &config.reconcile.lookback_hours,
                     out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "reconcile" && key == "batch_size") {
      if (!AssignInt(field, value, line_no, &config.reconcile.batch_size,
                     out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "reconcile" && key == "interval_seconds") {
      if (!AssignInt(field, value, line_no,
                     &config.reconcile.interval_seconds, out_error)) {
        return false;
      }
      continue;
    }

    if (current_section == "model" && key == "max_attempts") {
      if (!AssignInt(field, value, line_no, &config.model.max_attempts,
                     out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "model" && key == "rate_limit_per_minute") {
      if (!AssignInt(field, value, line_no,
                     &config.model.rate_limit_per_minute, out_error)) {
        return false;
      }
      continue;
    }
    if (current_section == "model" && key == "timeout_ms") {
      if (!AssignInt(field, value, line_no, &config.model.timeout_ms,
                     out_error)) {
        return false;
      }
      continue;
    }

    if (current_section == "logging" && key == "level") {
      if (!ParseLogLevel(value, &config.log_level)) {
        return FailLine(field, line_no, out_error);
      }
      continue;
    }
  }

  if (!ApplyEnvironmentOverrides(&config, out_error)) {
    return false;
  }
  if (!ValidateAppConfig(config, out_error)) {
    return false;
  }
  *out_config = config;
  return true;
}

bool ApplyEnvironmentOverrides(AppConfig* config, std::string* out_error) {
  if (config == nullptr) {
    return Fail("config 为空", out_error);
  }
  if (const char* master_key = std::getenv("TRADE_PILOT_MASTER_KEY");
      master_key != nullptr) {
    config->master_key = master_key;
  }
  if (const char* host = std::getenv("TRADE_PILOT_REDIS_HOST");
      host != nullptr && host[0] != '\0') {
    config->locks.redis_host = host;
  }
  if (const char* port = std::getenv("TRADE_PILOT_REDIS_PORT");
      port != nullptr && port[0] != '\0') {
    if (!ParseInt(port, &config->locks.redis_port)) {
      return Fail("TRADE_PILOT_REDIS_PORT 解析失败: " + std::string(port),
                  out_error);
    }
  }
  if (const char* paper = std::getenv("TRADE_PILOT_PAPER_TRADING");
      paper != nullptr && paper[0] != '\0') {
    if (!ParseBool(paper, &config->app.paper_trading)) {
      return Fail("TRADE_PILOT_PAPER_TRADING 解析失败: " + std::string(paper),
                  out_error);
    }
  }
  return true;
}

bool ValidateAppConfig(const AppConfig& config, std::string* out_error) {
  if (config.app.cycle_interval_seconds <= 0) {
    return Fail("app.cycle_interval_seconds 必须大于 0", out_error);
  }
  if (config.app.worker_threads <= 0) {
    return Fail("app.worker_threads 必须大于 0", out_error);
  }
  if (config.app.signal_batch_size <= 0) {
    return Fail("app.signal_batch_size 必须大于 0", out_error);
  }
  Decimal paper_balance;
  if (!ParseDecimal(config.app.paper_balance, &paper_balance) ||
      paper_balance < 0) {
    return Fail("app.paper_balance 必须是非负数", out_error);
  }
  if (config.locks.trader_ttl_seconds < 0 ||
      config.locks.reconcile_ttl_seconds < 0) {
    return Fail("locks TTL 不能为负数", out_error);
  }
  if (config.locks.blocking_timeout_ms < 0) {
    return Fail("locks.blocking_timeout_ms 不能为负数", out_error);
  }
  if (config.locks.poll_interval_ms <= 0) {
    return Fail("locks.poll_interval_ms 必须大于 0", out_error);
  }
  if (config.locks.backend == LockBackend::kRedis &&
      (config.locks.redis_host.empty() || config.locks.redis_port <= 0 ||
       config.locks.redis_port > 65535)) {
    return Fail("locks.redis_host/redis_port 配置非法", out_error);
  }
  if (config.reconcile.lookback_hours <= 0) {
    return Fail("reconcile.lookback_hours 必须大于 0", out_error);
  }
  if (config.reconcile.batch_size <= 0) {
    return Fail("reconcile.batch_size 必须大于 0", out_error);
  }
  if (config.reconcile.interval_seconds <= 0) {
    return Fail("reconcile.interval_seconds 必须大于 0", out_error);
  }
  if (config.model.max_attempts <= 0) {
    return Fail("model.max_attempts 必须大于 0", out_error);
  }
  if (config.model.rate_limit_per_minute <= 0) {
    return Fail("model.rate_limit_per_minute 必须大于 0", out_error);
  }
  if (config.model.timeout_ms <= 0) {
    return Fail("model.timeout_ms 必须大于 0", out_error);
  }
  return true;
}

}  // namespace trade_pilot
