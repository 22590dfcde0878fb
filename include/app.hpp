#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using Headers = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive lookup; returns the first match.
std::optional<std::string> find_header(const Headers& headers,
                                       const std::string& name);

// True if `list` (a comma separated header value) contains `token`,
// compared case-insensitively.
bool header_has_token(const std::string& list, const std::string& token);

struct HttpRequest {
  std::string method;
  std::string target;  // as sent on the request line
  std::string path;    // percent-decoded, without the query
  std::string query;   // raw, without the '?'
  int version_minor = 1;
  Headers headers;
  std::string body;

  std::string remote_addr;
  uint16_t remote_port = 0;

  std::optional<std::string> header(const std::string& name) const {
    return find_header(headers, name);
  }
};

struct HttpResponse {
  int status = 200;
  std::string reason;  // empty: use the standard phrase
  Headers headers;
  std::string body;

  static HttpResponse text(int status, std::string body,
                           std::string content_type = "text/plain; charset=utf-8");
};

// The served application. Invoked concurrently from every worker thread, so
// it must not rely on unsynchronized mutable state.
using Application = std::function<HttpResponse(const HttpRequest&)>;

// The application failed or produced something that cannot be sent.
class HandlerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Throws HandlerError if `resp` cannot be put on the wire.
void check_response(const HttpResponse& resp);

bool is_token(const std::string& s);
