#include "asynckit/json/i_json.hpp"

#include <fstream>
#include <sstream>

namespace asynckit {
namespace json {

#define ASYNCKIT_JSON_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kJson)

api::Result<Json> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Json>(Json::parse(text));
  } catch (const Json::parse_error& ex) {
    return api::Result<Json>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, std::string("json parse failed: ") + ex.what(),
        api::ErrorModule::kJson, 0x0001));
  }
}

api::Result<Json> JsonCodec::LoadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<Json>(
        ASYNCKIT_JSON_STATUS(api::StatusCode::kNotFound, "json file not found: " + path));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str());
}

api::Status JsonCodec::SaveFile(const std::string& path, const Json& value, int indent) {
  std::ofstream out(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return ASYNCKIT_JSON_STATUS(api::StatusCode::kIoError, "open json file for write failed");
  }
  try {
    out << value.dump(indent) << "\n";
  } catch (const Json::type_error& ex) {
    return ASYNCKIT_JSON_STATUS(api::StatusCode::kIoError,
                                std::string("json write failed: ") + ex.what());
  }
  if (!out.good()) {
    return ASYNCKIT_JSON_STATUS(api::StatusCode::kIoError, "json write failed");
  }
  return api::Status::Ok();
}

std::string JsonCodec::Dump(const Json& value, int indent) {
  // Invalid UTF-8 is replaced instead of throwing so diagnostics never fail.
  return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

#undef ASYNCKIT_JSON_STATUS

}  // namespace json
}  // namespace asynckit
