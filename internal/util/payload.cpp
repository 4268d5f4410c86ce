#include "payload.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace ctxsync::util {

namespace {

void AppendEscaped(std::string& out, const std::string& text) {
  out.push_back('"');
  for (const unsigned char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out.push_back('"');
}

void AppendNumber(std::string& out, double value) {
  if (!std::isfinite(value)) {
    out += "null";
    return;
  }
  if (value == std::floor(value) && std::fabs(value) < 1e15) {
    out += std::to_string(static_cast<long long>(value));
    return;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", value);
  out += buf;
}

void AppendValue(std::string& out, const google::protobuf::Value& value);

void AppendStruct(std::string& out, const Payload& payload) {
  std::vector<const std::string*> keys;
  keys.reserve(payload.fields_size());
  for (const auto& [key, _] : payload.fields()) {
    keys.push_back(&key);
  }
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out.push_back('{');
  bool first = true;
  for (const auto* key : keys) {
    if (!first) out.push_back(',');
    first = false;
    AppendEscaped(out, *key);
    out.push_back(':');
    AppendValue(out, payload.fields().at(*key));
  }
  out.push_back('}');
}

void AppendValue(std::string& out, const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      AppendNumber(out, value.number_value());
      break;
    case google::protobuf::Value::kStringValue:
      AppendEscaped(out, value.string_value());
      break;
    case google::protobuf::Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      break;
    case google::protobuf::Value::kStructValue:
      AppendStruct(out, value.struct_value());
      break;
    case google::protobuf::Value::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out.push_back(',');
        first = false;
        AppendValue(out, item);
      }
      out.push_back(']');
      break;
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
    default:
      out += "null";
  }
}

} // namespace

std::string PayloadToJson(const Payload& payload) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) {
    throw std::runtime_error("payload to json: " + std::string(status.message()));
  }
  return json;
}

Payload PayloadFromJson(const std::string& json) {
  Payload payload;
  if (json.empty()) {
    return payload;
  }
  auto status = google::protobuf::util::JsonStringToMessage(json, &payload);
  if (!status.ok()) {
    throw std::runtime_error("payload from json: " + std::string(status.message()));
  }
  return payload;
}

std::string CanonicalJson(const Payload& payload) {
  std::string out;
  AppendStruct(out, payload);
  return out;
}

std::string CanonicalJson(const google::protobuf::Value& value) {
  std::string out;
  AppendValue(out, value);
  return out;
}

bool PayloadEquals(const Payload& lhs, const Payload& rhs) {
  return google::protobuf::util::MessageDifferencer::Equals(lhs, rhs);
}

bool ValueEquals(const google::protobuf::Value& lhs, const google::protobuf::Value& rhs) {
  return google::protobuf::util::MessageDifferencer::Equals(lhs, rhs);
}

std::size_t PayloadBytes(const Payload& payload) {
  return payload.ByteSizeLong();
}

std::string MetadataToJson(const std::map<std::string, std::string>& metadata) {
  Payload doc;
  for (const auto& [key, value] : metadata) {
    (*doc.mutable_fields())[key].set_string_value(value);
  }
  return CanonicalJson(doc);
}

std::map<std::string, std::string> MetadataFromJson(const std::string& json) {
  std::map<std::string, std::string> metadata;
  const Payload                      doc = PayloadFromJson(json);
  for (const auto& [key, value] : doc.fields()) {
    metadata[key] = value.kind_case() == google::protobuf::Value::kStringValue ? value.string_value() : CanonicalJson(value);
  }
  return metadata;
}

} // namespace ctxsync::util
