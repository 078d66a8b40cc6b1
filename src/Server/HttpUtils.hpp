#ifndef HTTP_UTILS_HPP_
#define HTTP_UTILS_HPP_

#include <map>
#include <string>

using ParamMap = std::map<std::string, std::string>;

struct RequestTarget {
  std::string path;
  ParamMap query;
};

// "a=1&b=x%20y" -> {a: "1", b: "x y"}; later duplicates win.
ParamMap parseUrlEncoded(const std::string& body);

// "/progress?sessionID=abc" -> {"/progress", {sessionID: abc}}
RequestTarget parseTarget(const std::string& target);

// Value for a Content-Disposition filename, with quotes and control
// characters replaced.
std::string attachmentFileName(const std::string& name);

#endif  // HTTP_UTILS_HPP_
