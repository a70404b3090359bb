#include "poolkit/json/i_json.hpp"

#include <fstream>
#include <sstream>

namespace poolkit {
namespace json {

#define PK_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kJson, (detail))

api::Result<Json> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Json>(Json::parse(text));
  } catch (const std::exception& ex) {
    return api::Result<Json>(PK_STATUS(api::StatusCode::kInvalidArgument,
                                       std::string("json parse failed: ") + ex.what(), 0x0001));
  }
}

api::Result<Json> JsonCodec::LoadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<Json>(
        PK_STATUS(api::StatusCode::kNotFound, "json file not found: " + path, 0));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str());
}

std::string JsonCodec::Dump(const Json& value, int indent) {
  try {
    return value.dump(indent);
  } catch (const std::exception&) {
    // dump throws type_error on invalid UTF-8; logging callers get an empty string.
    return std::string();
  }
}

#undef PK_STATUS

}  // namespace json
}  // namespace poolkit
