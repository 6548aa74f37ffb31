#include "gelf_logger/metadata.hpp"

#include <fmt/format.h>

#include <iterator>

namespace gelf_logger
{

namespace
{

void append_quoted(std::string& out, const std::string& s)
{
  out += '"';
  for (char c : s)
  {
    switch (c)
    {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
        break;
    }
  }
  out += '"';
}

// 整数值的浮点数保留 ".0"，与整数区分
std::string float_text(double value)
{
  std::string text = fmt::format("{}", value);
  if (text.find_first_not_of("-0123456789") == std::string::npos)
  {
    text += ".0";
  }
  return text;
}

void append_inspect(std::string& out, const MetadataValue& value)
{
  switch (value.GetType())
  {
    case MetadataValue::Type::Null:
      out += "nil";
      break;
    case MetadataValue::Type::Bool:
      out += value.AsBool() ? "true" : "false";
      break;
    case MetadataValue::Type::Integer:
      fmt::format_to(std::back_inserter(out), "{}", value.AsInteger());
      break;
    case MetadataValue::Type::Float:
      out += float_text(value.AsFloat());
      break;
    case MetadataValue::Type::String:
      append_quoted(out, value.AsString());
      break;
    case MetadataValue::Type::List:
    {
      out += '[';
      bool first = true;
      for (const auto& item : value.Items())
      {
        if (!first) out += ", ";
        first = false;
        append_inspect(out, item);
      }
      out += ']';
      break;
    }
    case MetadataValue::Type::Map:
    {
      out += '{';
      bool first = true;
      for (const auto& entry : value.Entries())
      {
        if (!first) out += ", ";
        first = false;
        out += entry.first;
        out += ": ";
        append_inspect(out, entry.second);
      }
      out += '}';
      break;
    }
  }
}

}  // namespace

MetadataValue MetadataValue::List(std::vector<MetadataValue> items)
{
  MetadataValue v;
  v.type_ = Type::List;
  v.items_ = std::move(items);
  return v;
}

MetadataValue MetadataValue::Map(Metadata entries)
{
  MetadataValue v;
  v.type_ = Type::Map;
  v.entries_ = std::move(entries);
  return v;
}

std::string MetadataValue::ToText() const
{
  switch (type_)
  {
    case Type::Null:
      return {};
    case Type::Bool:
      return bool_ ? "true" : "false";
    case Type::Integer:
      return fmt::format("{}", int_);
    case Type::Float:
      return float_text(float_);
    case Type::String:
      return str_;
    case Type::List:
    case Type::Map:
      break;
  }
  return Inspect();
}

std::string MetadataValue::Inspect() const
{
  std::string out;
  append_inspect(out, *this);
  return out;
}

bool MetadataValue::operator==(const MetadataValue& other) const
{
  if (type_ != other.type_) return false;
  switch (type_)
  {
    case Type::Null:
      return true;
    case Type::Bool:
      return bool_ == other.bool_;
    case Type::Integer:
      return int_ == other.int_;
    case Type::Float:
      return float_ == other.float_;
    case Type::String:
      return str_ == other.str_;
    case Type::List:
      return items_ == other.items_;
    case Type::Map:
      return entries_ == other.entries_;
  }
  return false;
}

const MetadataValue* find_metadata(const Metadata& metadata, std::string_view key)
{
  for (auto it = metadata.rbegin(); it != metadata.rend(); ++it)
  {
    if (it->first == key) return &it->second;
  }
  return nullptr;
}

}  // namespace gelf_logger
