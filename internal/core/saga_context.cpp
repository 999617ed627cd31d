#include "saga_context.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "saga/orchestrator/v1/context.pb.h"

namespace saga::core {

std::string SerializeContext(const ContextValues& values) {
  saga::orchestrator::v1::SagaContext message;
  auto&                               map = *message.mutable_values();
  for (const auto& [key, value] : values) map[key] = value;

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) throw util::InvalidState("context serialization failed: " + status.ToString());
  return out;
}

ContextValues ParseContext(const std::string& blob) {
  if (blob.empty()) return {};

  saga::orchestrator::v1::SagaContext message;
  const auto                          status = google::protobuf::util::JsonStringToMessage(blob, &message);
  if (!status.ok()) throw util::InvalidState("context blob does not parse: " + status.ToString());

  return ContextValues(message.values().begin(), message.values().end());
}

std::optional<ContextValues> TryParseContext(const std::string& blob) {
  if (blob.empty()) return ContextValues{};

  saga::orchestrator::v1::SagaContext message;
  if (!google::protobuf::util::JsonStringToMessage(blob, &message).ok()) return std::nullopt;
  return ContextValues(message.values().begin(), message.values().end());
}

void MergeFragment(ContextValues& values, const ContextValues& fragment) {
  for (const auto& [key, value] : fragment) values[key] = value;
}

} // namespace saga::core
