#include "hookjudge/common/json_util.hpp"

#include <cmath>
#include <memory>

namespace hookjudge::common {

namespace {

std::string write_with(const Json::Value &value, const std::string &indentation) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = indentation;
  builder["emitUTF8"] = true;
  builder["commentStyle"] = "None";
  return Json::writeString(builder, value);
}

// JsonCpp's strict mode still accepts comments inside containers, so they are
// rejected here. A '/' is never valid JSON outside a string literal.
bool has_comment(const std::string &text) {
  bool in_string = false;
  bool escaped = false;
  for (const char ch : text) {
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
    } else if (ch == '"') {
      in_string = true;
    } else if (ch == '/') {
      return true;
    }
  }
  return false;
}

} // namespace

Result<Json::Value> parse_json(const std::string &text) {
  if (has_comment(text)) {
    return Result<Json::Value>::failure("comments are not allowed in JSON");
  }
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  bool parsed = false;
  try {
    parsed = reader->parse(text.data(), text.data() + text.size(), &root, &errors);
  } catch (const Json::Exception &ex) {
    return Result<Json::Value>::failure(ex.what());
  }
  if (!parsed) {
    std::string message = errors;
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
      message.pop_back();
    }
    return Result<Json::Value>::failure(message.empty() ? "invalid JSON" : message);
  }
  return Result<Json::Value>::success(std::move(root));
}

std::string dump_json(const Json::Value &value) { return write_with(value, ""); }

std::string dump_json_pretty(const Json::Value &value) { return write_with(value, "  "); }

std::string json_type_name(const Json::Value &value) {
  switch (value.type()) {
  case Json::nullValue:
    return "null";
  case Json::intValue:
  case Json::uintValue:
    return "integer";
  case Json::realValue: {
    const double number = value.asDouble();
    double whole = 0.0;
    if (std::isfinite(number) && std::modf(number, &whole) == 0.0) {
      return "integer";
    }
    return "number";
  }
  case Json::stringValue:
    return "string";
  case Json::booleanValue:
    return "boolean";
  case Json::arrayValue:
    return "array";
  case Json::objectValue:
    return "object";
  }
  return "unknown";
}

} // namespace hookjudge::common
