#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace turngate::json {

struct Value;
using Array = std::vector<Value>;
// Ordered map: stringify() output is deterministic without a separate key sort.
using Object = std::map<std::string, Value>;

// JSON value (null, bool, number, string, array, object).
//
// Numbers are stored as double. Integral values up to 2^53 round-trip exactly,
// which covers every counter and turn number the engine stores.
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  Value() : variant(nullptr) {}
  Value(int v) : variant(static_cast<double>(v)) {}
  Value(std::int64_t v) : variant(static_cast<double>(v)) {}
  Value(std::uint64_t v) : variant(static_cast<double>(v)) {}
  Value(const char* s) : variant(std::string(s)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  Array* as_array();
  Object* as_object();

  // Throws std::runtime_error if not present / wrong type.
  const Value& at(const std::string& key) const;
  const Value& at(std::size_t index) const;

  // Returns nullptr if this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Throw on wrong type.
  const Object& object() const;
  const Array& array() const;
};

// True if the number has no fractional part and fits an int64.
bool is_integral(double d);

// Parse a JSON document. Throws std::runtime_error with line/column info.
Value parse(const std::string& text);

// indent <= 0 produces compact single-line output.
std::string stringify(const Value& v, int indent = 2);

} // namespace turngate::json
