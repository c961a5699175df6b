#include "core/decimal.h"

#include <cctype>
#include <exception>

namespace trade_pilot {

namespace {

// cpp_dec_float 的字符串构造会抛异常，先做一次轻量文法校验。
bool LooksNumeric(const std::string& text) {
  if (text.empty()) {
    return false;
  }
  std::size_t i = 0;
  if (text[i] == '+' || text[i] == '-') {
    ++i;
  }
  bool digits = false;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
    ++i;
    digits = true;
  }
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
      ++i;
      digits = true;
    }
  }
  if (!digits) {
    return false;
  }
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
      ++i;
    }
    bool exp_digits = false;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
      ++i;
      exp_digits = true;
    }
    if (!exp_digits) {
      return false;
    }
  }
  return i == text.size();
}

}  // namespace

bool ParseDecimal(const std::string& text, Decimal* out_value) {
  if (out_value == nullptr || !LooksNumeric(text)) {
    return false;
  }
  try {
    *out_value = Decimal(text);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

Decimal Pow10(int exponent) {
  Decimal result = 1;
  if (exponent >= 0) {
    for (int i = 0; i < exponent; ++i) {
      result *= 10;
    }
  } else {
    for (int i = 0; i < -exponent; ++i) {
      result /= 10;
    }
  }
  return result;
}

Decimal RoundQuantity(const Decimal& value, int precision) {
  const Decimal scale = Pow10(precision);
  const Decimal scaled = value * scale;
  const Decimal truncated = boost::multiprecision::trunc(scaled);
  return Decimal(truncated / scale);
}

Decimal RoundPrice(const Decimal& value, int precision) {
  const Decimal scale = Pow10(precision);
  const Decimal magnitude = boost::multiprecision::abs(value) * scale;
  const Decimal rounded = boost::multiprecision::floor(Decimal(magnitude + Decimal("0.5")));
  const Decimal result = rounded / scale;
  return value < 0 ? Decimal(-result) : result;
}

std::string FormatDecimal(const Decimal& value, int places) {
  std::string text;
  if (places <= 0) {
    // cpp_dec_float 把 0 位解释为“全精度”，整数位输出单独处理。
    text = RoundPrice(value, 0).str(1, std::ios_base::fixed);
    text = text.substr(0, text.find('.'));
  } else {
    text = value.str(places, std::ios_base::fixed);
  }
  // 规避 "-0.00" 这类负零输出。
  if (!text.empty() && text.front() == '-' &&
      text.find_first_not_of("-0.") == std::string::npos) {
    text.erase(0, 1);
  }
  return text;
}

std::string DecimalToString(const Decimal& value) {
  std::string text = FormatDecimal(value, 18);
  const std::size_t dot = text.find('.');
  if (dot != std::string::npos) {
    std::size_t end = text.size();
    while (end > dot + 1 && text[end - 1] == '0') {
      --end;
    }
    if (end == dot + 1) {
      end = dot;
    }
    text.resize(end);
  }
  if (text == "-0") {
    return "0";
  }
  return text;
}

std::string OptionalDecimalToString(const std::optional<Decimal>& value) {
  return value.has_value() ? DecimalToString(*value) : std::string();
}

std::optional<Decimal> JsonAsDecimal(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  std::string text;
  if (value->type == JsonType::kNumber) {
    text = value->number_text;
    if (text.empty()) {
      const auto fallback = JsonAsString(value);
      text = fallback.value_or("");
    }
  } else if (value->type == JsonType::kString) {
    text = value->string_value;
  } else {
    return std::nullopt;
  }
  Decimal parsed;
  if (!ParseDecimal(text, &parsed)) {
    return std::nullopt;
  }
  return parsed;
}

JsonValue MakeJsonDecimal(const Decimal& value) {
  return MakeJsonNumberText(DecimalToString(value));
}

JsonValue MakeJsonOptionalDecimal(const std::optional<Decimal>& value) {
  return value.has_value() ? MakeJsonDecimal(*value) : MakeJsonNull();
}

}  // namespace trade_pilot
