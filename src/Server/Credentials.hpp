#ifndef CREDENTIALS_HPP_
#define CREDENTIALS_HPP_

#include <cstddef>
#include <map>
#include <string>

// HTTP Basic credentials. An empty set disables authentication.
class Credentials {
 public:
  Credentials() = default;

  // "user:pass,user2:pass2". Throws std::invalid_argument on an entry
  // without a user name or a ':' separator.
  static Credentials parse(const std::string& list);

  void add(const std::string& user, const std::string& password);

  bool enabled() const { return !users_.empty(); }
  size_t size() const { return users_.size(); }

  // Checks an Authorization header value ("Basic <base64>").
  bool authorize(const std::string& authorizationHeader) const;

 private:
  std::map<std::string, std::string> users_;
};

#endif  // CREDENTIALS_HPP_
