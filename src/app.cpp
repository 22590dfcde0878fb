#include "app.hpp"

#include <cctype>
#include <cstring>

namespace {

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); i++) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

bool is_tchar(char c) {
  if (std::isalnum(static_cast<unsigned char>(c))) return true;
  return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) e--;
  return s.substr(b, e - b);
}

}  // namespace

std::optional<std::string> find_header(const Headers& headers,
                                       const std::string& name) {
  for (const auto& h : headers) {
    if (iequals(h.first, name)) return h.second;
  }
  return std::nullopt;
}

bool header_has_token(const std::string& list, const std::string& token) {
  size_t start = 0;
  while (start <= list.size()) {
    size_t comma = list.find(',', start);
    if (comma == std::string::npos) comma = list.size();
    if (iequals(trim(list.substr(start, comma - start)), token)) return true;
    start = comma + 1;
  }
  return false;
}

bool is_token(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!is_tchar(c)) return false;
  }
  return true;
}

HttpResponse HttpResponse::text(int status, std::string body,
                                std::string content_type) {
  HttpResponse r;
  r.status = status;
  r.headers.emplace_back("Content-Type", std::move(content_type));
  r.body = std::move(body);
  return r;
}

void check_response(const HttpResponse& resp) {
  if (resp.status < 200 || resp.status > 599) {
    throw HandlerError("invalid status code " + std::to_string(resp.status));
  }
  if (resp.reason.find_first_of("\r\n") != std::string::npos) {
    throw HandlerError("line break in reason phrase");
  }
  for (const auto& h : resp.headers) {
    if (!is_token(h.first)) {
      throw HandlerError("invalid header name '" + h.first + "'");
    }
    if (h.second.find_first_of("\r\n") != std::string::npos ||
        h.second.find('\0') != std::string::npos) {
      throw HandlerError("invalid value for header '" + h.first + "'");
    }
  }
}
