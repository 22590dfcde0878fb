#pragma once

#include <chrono>
#include <cstddef>
#include <ctime>
#include <string>

#include "app.hpp"

using Deadline = std::chrono::steady_clock::time_point;

enum class ReadStatus {
  Ok,
  // The connection is finished; nothing should be sent back.
  Closed,
  Timeout,
  Error,
  // The request is bad; answer with status_for() and close.
  Malformed,
  Stalled,
  UriTooLong,
  HeadersTooLarge,
  BodyTooLarge,
  NotImplemented,
  VersionNotSupported,
};

// Status code to answer a failed read with, or 0 if the connection should
// just be closed.
int status_for(ReadStatus st);
const char* to_string(ReadStatus st);

struct RequestLimits {
  size_t max_line = 4094;
  size_t max_fields = 100;
  size_t max_field_size = 8190;
  size_t max_body = 16 * 1024 * 1024;
};

// Reads HTTP/1.x requests from a blocking socket. Every read is bounded by a
// deadline. Bytes past the end of one request stay buffered for the next
// (pipelining).
class RequestReader {
 public:
  RequestReader(int fd, const RequestLimits& limits);

  // Waits up to `idle` for the first byte of the next request.
  ReadStatus wait_for_request(std::chrono::milliseconds idle);

  // Request line and header fields.
  ReadStatus read_head(HttpRequest& req, Deadline deadline);

  // Body as framed by Content-Length or chunked Transfer-Encoding.
  ReadStatus read_body(HttpRequest& req, Deadline deadline);

  bool has_buffered() const { return !buffer_.empty(); }

 private:
  ReadStatus fill(Deadline deadline);
  ReadStatus read_line(std::string& line, size_t limit, ReadStatus too_long,
                       Deadline deadline);
  ReadStatus read_bytes(size_t n, std::string& out, Deadline deadline);
  ReadStatus read_chunked(std::string& out, Deadline deadline);

  int fd_;
  RequestLimits limits_;
  std::string buffer_;
};

// Splits and decodes the request target into req.path / req.query.
bool parse_target(HttpRequest& req);

bool percent_decode(const std::string& in, std::string& out);

bool wants_keep_alive(const HttpRequest& req);

const char* reason_phrase(int status);

// Generic response for protocol errors and application failures.
HttpResponse error_response(int status);

std::string http_date(std::time_t t);

// Serializes a complete response. Framing headers (Connection,
// Content-Length, Transfer-Encoding) set by the application are replaced.
std::string render_response(const HttpResponse& resp, bool keep_alive,
                            bool head_only);

extern const char kContinueResponse[];

bool send_all(int fd, const char* data, size_t len);
bool send_str(int fd, const std::string& s);
