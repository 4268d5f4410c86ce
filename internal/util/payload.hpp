#pragma once

#include <cstddef>
#include <map>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace ctxsync::util {

/*
  Payload helpers.

  Payloads are google.protobuf.Struct documents. Storage uses protobuf JSON,
  comparisons and embedding input use the canonical rendering below which
  orders object keys so that equal documents always render identically.
*/

using Payload = google::protobuf::Struct;

std::string PayloadToJson(const Payload& payload);
Payload     PayloadFromJson(const std::string& json);

std::string CanonicalJson(const Payload& payload);
std::string CanonicalJson(const google::protobuf::Value& value);

bool PayloadEquals(const Payload& lhs, const Payload& rhs);
bool ValueEquals(const google::protobuf::Value& lhs, const google::protobuf::Value& rhs);

// Size of the serialized payload; the hard cap is checked against this.
std::size_t PayloadBytes(const Payload& payload);

std::string                        MetadataToJson(const std::map<std::string, std::string>& metadata);
std::map<std::string, std::string> MetadataFromJson(const std::string& json);

} // namespace ctxsync::util
