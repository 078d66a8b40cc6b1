#include "HttpUtils.hpp"

#include "string_utils.hpp"

ParamMap parseUrlEncoded(const std::string& body) {
  ParamMap params;
  for (const auto& pair : utils::splitAny(body, "&")) {
    auto eq = pair.find('=');
    std::string key = utils::percentDecode(pair.substr(0, eq), true);
    std::string value =
        eq == std::string::npos ? std::string()
                                : utils::percentDecode(pair.substr(eq + 1), true);
    if (!key.empty()) params[key] = value;
  }
  return params;
}

RequestTarget parseTarget(const std::string& target) {
  RequestTarget parsed;
  auto question = target.find('?');
  parsed.path = target.substr(0, question);
  if (question != std::string::npos) {
    parsed.query = parseUrlEncoded(target.substr(question + 1));
  }
  if (parsed.path.empty()) parsed.path = "/";
  return parsed;
}

std::string attachmentFileName(const std::string& name) {
  std::string safe;
  safe.reserve(name.size());
  for (char c : name) {
    unsigned char u = static_cast<unsigned char>(c);
    safe.push_back((u < 0x20 || c == '"' || c == '\\' || u == 0x7f) ? '_' : c);
  }
  return safe;
}
