#include "json.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace progress::util {

std::string EncodeMilestoneMap(const std::map<std::string, double>& milestones) {
  google::protobuf::Struct as_struct;
  for (const auto& [name, value] : milestones) {
    (*as_struct.mutable_fields())[name].set_number_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(as_struct, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode milestone map: " + std::string(status.message()));
  }
  return json;
}

std::map<std::string, double> DecodeMilestoneMap(const std::string& raw) {
  std::map<std::string, double> milestones;
  if (raw.empty()) {
    return milestones;
  }

  google::protobuf::Struct as_struct;
  auto                     status = google::protobuf::util::JsonStringToMessage(raw, &as_struct);
  if (!status.ok()) {
    throw std::runtime_error("corrupt milestone map: " + std::string(status.message()));
  }

  for (const auto& [name, value] : as_struct.fields()) {
    if (value.kind_case() != google::protobuf::Value::kNumberValue) {
      throw std::runtime_error("corrupt milestone map: value of '" + name + "' is not a number");
    }
    milestones[name] = value.number_value();
  }
  return milestones;
}

} // namespace progress::util
