#include "Credentials.hpp"

#include <openssl/crypto.h>

#include <boost/beast/core/detail/base64.hpp>
#include <stdexcept>

#include "string_utils.hpp"

namespace {

bool decodeBase64(const std::string& encoded, std::string* decoded) {
  namespace base64 = boost::beast::detail::base64;
  std::string trimmed = encoded;
  while (!trimmed.empty() && trimmed.back() == '=') trimmed.pop_back();

  decoded->resize(base64::decoded_size(encoded.size()));
  auto result = base64::decode(&(*decoded)[0], trimmed.data(), trimmed.size());
  if (result.second != trimmed.size()) return false;
  decoded->resize(result.first);
  return true;
}

// 等长时按常数时间比较，耗时不随首个不同字节的位置变化
bool passwordsMatch(const std::string& expected, const std::string& given) {
  if (expected.size() != given.size()) return false;
  if (expected.empty()) return true;
  return CRYPTO_memcmp(expected.data(), given.data(), expected.size()) == 0;
}

}  // namespace

Credentials Credentials::parse(const std::string& list) {
  Credentials credentials;
  for (const auto& entry : utils::splitAny(list, ",")) {
    auto colon = entry.find(':');
    if (colon == std::string::npos || colon == 0) {
      throw std::invalid_argument("credential entry '" + entry +
                                  "' is not user:password");
    }
    credentials.add(entry.substr(0, colon), entry.substr(colon + 1));
  }
  return credentials;
}

void Credentials::add(const std::string& user, const std::string& password) {
  users_[user] = password;
}

bool Credentials::authorize(const std::string& authorizationHeader) const {
  if (!enabled()) return true;

  std::string header = utils::trim(authorizationHeader);
  if (!utils::startsWithNoCase(header, "Basic ")) return false;

  std::string decoded;
  if (!decodeBase64(utils::trim(header.substr(6)), &decoded)) return false;

  auto colon = decoded.find(':');
  if (colon == std::string::npos) return false;
  auto it = users_.find(decoded.substr(0, colon));
  if (it == users_.end()) return false;
  return passwordsMatch(it->second, decoded.substr(colon + 1));
}
