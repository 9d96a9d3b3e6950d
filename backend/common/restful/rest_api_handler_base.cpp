#include "rest_api_handler_base.hpp"

#include <cctype>

namespace common {

namespace {

std::string percentDecode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%' && i + 2 < in.size() &&
        std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(std::string(in.substr(i + 1, 2)), nullptr, 16)));
      i += 2;
    } else if (in[i] == '+') {
      out.push_back(' ');
    } else {
      out.push_back(in[i]);
    }
  }
  return out;
}

} // namespace

RequestTarget parseTarget(std::string_view target) {
  RequestTarget result;

  auto qpos = target.find('?');
  std::string_view path = target.substr(0, qpos);
  size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    if (end > start) {
      result.segments.push_back(percentDecode(path.substr(start, end - start)));
    }
    start = end + 1;
  }

  if (qpos != std::string_view::npos) {
    std::string_view query = target.substr(qpos + 1);
    size_t pos = 0;
    while (pos < query.size()) {
      auto amp = query.find('&', pos);
      if (amp == std::string_view::npos) amp = query.size();
      auto pair = query.substr(pos, amp - pos);
      auto eq = pair.find('=');
      if (eq == std::string_view::npos) {
        result.query[percentDecode(pair)] = "";
      } else {
        result.query[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
      }
      pos = amp + 1;
    }
  }
  return result;
}

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

http::response<http::string_body> RestApiHandlerBase::createBinaryResponse(
  http::status status, std::string body, const std::string& content_type) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, content_type);
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  try {
    if (body.empty()) {
        return nlohmann::json{};
    }
    return nlohmann::json::parse(body);
  } catch (const std::exception& e) {
    throw std::invalid_argument("Invalid JSON in request body: " + std::string(e.what()));
  }
}

}
