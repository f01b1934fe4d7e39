#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace modelreg::util {

/*
  Protobuf <-> JSON used for every document this repository writes: the
  registry, sidecars and lineage reports. Field names are preserved as
  declared in the .proto files and default values are always printed so the
  documents diff cleanly over time.
*/

std::string ToJson(const google::protobuf::Message& message);

// Returns false and fills `error` when `json` is not a valid encoding of the
// message type. Unknown fields are rejected.
bool FromJson(const std::string& json, google::protobuf::Message* message, std::string* error);

} // namespace modelreg::util
