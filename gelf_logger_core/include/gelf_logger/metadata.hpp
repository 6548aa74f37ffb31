#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace gelf_logger
{

class MetadataValue;

using MetadataEntry = std::pair<std::string, MetadataValue>;

// Ordered key/value list; duplicate keys are allowed, the last one wins when read.
using Metadata = std::vector<MetadataEntry>;

class MetadataValue
{
 public:
  enum class Type : uint8_t
  {
    Null,
    Bool,
    Integer,
    Float,
    String,
    List,
    Map
  };

  MetadataValue() = default;
  MetadataValue(std::nullptr_t) {}
  MetadataValue(bool value) : type_(Type::Bool), bool_(value) {}
  MetadataValue(double value) : type_(Type::Float), float_(value) {}
  MetadataValue(const char* value) : type_(Type::String), str_(value ? value : "") {}
  MetadataValue(std::string value) : type_(Type::String), str_(std::move(value)) {}
  MetadataValue(std::string_view value) : type_(Type::String), str_(value) {}

  template <typename T, typename std::enable_if_t<std::is_integral_v<T> &&
                                                      !std::is_same_v<T, bool>,
                                                  int> = 0>
  MetadataValue(T value) : type_(Type::Integer), int_(static_cast<int64_t>(value))
  {
  }

  static MetadataValue List(std::vector<MetadataValue> items);
  static MetadataValue Map(Metadata entries);

  Type GetType() const { return type_; }
  bool IsScalar() const { return type_ != Type::List && type_ != Type::Map && type_ != Type::Null; }

  bool AsBool() const { return bool_; }
  int64_t AsInteger() const { return int_; }
  double AsFloat() const { return float_; }
  const std::string& AsString() const { return str_; }
  const std::vector<MetadataValue>& Items() const { return items_; }
  const Metadata& Entries() const { return entries_; }

  // Plain text for scalars, Inspect() for everything else.
  std::string ToText() const;

  // Debug representation, e.g. [1, "a", nil] or {key: "v"}.
  std::string Inspect() const;

  bool operator==(const MetadataValue& other) const;
  bool operator!=(const MetadataValue& other) const { return !(*this == other); }

 private:
  Type type_ = Type::Null;
  bool bool_ = false;
  int64_t int_ = 0;
  double float_ = 0.0;
  std::string str_;
  std::vector<MetadataValue> items_;
  Metadata entries_;
};

// Last value stored under `key`, or nullptr.
const MetadataValue* find_metadata(const Metadata& metadata, std::string_view key);

}  // namespace gelf_logger
