#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "core/json_utils.h"
#include "storage/records.h"

namespace trade_pilot {

/**
 * 记录 <-> JSON 编解码（WAL 日志行使用）。
 *
 * 十进制字段以规范化数字原文写出，读回不经过 double；
 * 枚举以小写文本写出。解码失败返回 false 并写入 out_error。
 */

JsonValue RecordToJson(const ExchangeAccountRecord& record);
JsonValue RecordToJson(const ModelConfigRecord& record);
JsonValue RecordToJson(const StrategyRecord& record);
JsonValue RecordToJson(const TraderRecord& record);
JsonValue RecordToJson(const MarketSnapshotRecord& record);
JsonValue RecordToJson(const SignalRecord& record);
JsonValue RecordToJson(const DecisionLogRecord& record);
JsonValue RecordToJson(const TradePlanRecord& record);
JsonValue RecordToJson(const ExecutionRecord& record);

bool RecordFromJson(const JsonValue& json,
                    ExchangeAccountRecord* out_record,
                    std::string* out_error);
bool RecordFromJson(const JsonValue& json,
                    ModelConfigRecord* out_record,
                    std::string* out_error);
bool RecordFromJson(const JsonValue& json,
                    StrategyRecord* out_record,
                    std::string* out_error);
bool RecordFromJson(const JsonValue& json,
                    TraderRecord* out_record,
                    std::string* out_error);
bool RecordFromJson(const JsonValue& json,
                    MarketSnapshotRecord* out_record,
                    std::string* out_error);
bool RecordFromJson(const JsonValue& json,
                    SignalRecord* out_record,
                    std::string* out_error);
bool RecordFromJson(const JsonValue& json,
                    DecisionLogRecord* out_record,
                    std::string* out_error);
bool RecordFromJson(const JsonValue& json,
                    TradePlanRecord* out_record,
                    std::string* out_error);
bool RecordFromJson(const JsonValue& json,
                    ExecutionRecord* out_record,
                    std::string* out_error);

/// 归一化计划转 JSON（决策日志 normalized_plan 字段）。
JsonValue NormalizedPlanToJson(const NormalizedPlan& plan);

/// 只保留每个 OHLCV 序列的最后 points 个点（非数组字段原样保留）。
JsonValue OhlcvTail(const JsonValue& ohlcv, std::size_t points);

/// 快照 close 序列的最后一个值。
std::optional<Decimal> OhlcvLastClose(const JsonValue& ohlcv);

}  // namespace trade_pilot
