/**
 * @file json_util.hpp
 * @brief Non-throwing helpers around nlohmann::json used across mwb.
 *
 * Every helper here is safe on arbitrary untrusted input: parsing uses the
 * non-throwing overload, typed access checks the type first, and dumping
 * replaces invalid UTF-8 instead of raising.
 */

#ifndef MWB_JSON_UTIL_HPP_
#define MWB_JSON_UTIL_HPP_

#include "mwb/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

namespace mwb {

using Json = nlohmann::json;

/**
 * @brief Parse @p data as a JSON object.
 * @return The object, or nullopt for empty input, parse errors and
 *         non-object documents.
 */
inline optional<Json> ParseJsonObject(const std::string& data) {
  if (data.empty()) return nullopt;
  Json j = Json::parse(data, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return nullopt;
  return j;
}

/// @brief Serialize without ever throwing on invalid UTF-8.
inline std::string DumpJson(const Json& j) {
  return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

/// @brief ASCII lower-case copy.
inline std::string ToLowerAscii(const std::string& s) {
  std::string out(s);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 32);
  }
  return out;
}

/// @brief Copy with leading/trailing ASCII whitespace removed.
inline std::string TrimAscii(const std::string& s) {
  static const char* kWs = " \t\r\n\f\v";
  size_t first = s.find_first_not_of(kWs);
  if (first == std::string::npos) return std::string();
  size_t last = s.find_last_not_of(kWs);
  return s.substr(first, last - first + 1);
}

/// @brief true for a non-empty key made only of decimal digits ("0", "17").
inline bool IsByteIndexKey(const std::string& key) noexcept {
  if (key.empty()) return false;
  for (char c : key) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

/**
 * @brief Parse a decimal real from a trimmed string.
 *
 * Accepts an optional sign, digits, one decimal point and an exponent.
 * Rejects empty strings, "nan", "inf" and hexadecimal forms.
 */
inline optional<double> ParseDecimal(const std::string& raw) {
  std::string s = TrimAscii(raw);
  if (s.empty()) return nullopt;
  for (char c : s) {
    bool ok = (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.' ||
              c == 'e' || c == 'E';
    if (!ok) return nullopt;
  }
  const char* begin = s.c_str();
  char* end = nullptr;
  double v = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || !std::isfinite(v)) return nullopt;
  return v;
}

/**
 * @brief Interpret a JSON value as a number.
 *
 * JSON numbers and numeric strings qualify. Booleans, null, objects and
 * arrays do not.
 */
inline optional<double> AsNumber(const Json& v) {
  if (v.is_number()) {
    double d = v.get<double>();
    if (!std::isfinite(d)) return nullopt;
    return d;
  }
  if (v.is_string()) return ParseDecimal(v.get_ref<const std::string&>());
  return nullopt;
}

/**
 * @brief Interpret a JSON value as an int32, truncating toward zero.
 *
 * 10 -> 10, 10.9 -> 10, " 55 " -> 55, "12.7" -> 12; "" and "nan-value"
 * yield nullopt, as do values outside the int32 range.
 */
inline optional<int32_t> AsIntOrNone(const Json& v) {
  if (v.is_number_integer()) {
    if (v.is_number_unsigned()) {
      uint64_t u = v.get<uint64_t>();
      if (u > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        return nullopt;
      }
      return static_cast<int32_t>(u);
    }
    int64_t i = v.get<int64_t>();
    if (i < std::numeric_limits<int32_t>::min() ||
        i > std::numeric_limits<int32_t>::max()) {
      return nullopt;
    }
    return static_cast<int32_t>(i);
  }
  optional<double> d = AsNumber(v);
  if (!d.has_value()) return nullopt;
  double t = std::trunc(*d);
  if (t < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
      t > static_cast<double>(std::numeric_limits<int32_t>::max())) {
    return nullopt;
  }
  return static_cast<int32_t>(t);
}

}  // namespace mwb

#endif  // MWB_JSON_UTIL_HPP_
