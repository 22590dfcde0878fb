#include "protocol.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <string>

const char kContinueResponse[] = "HTTP/1.1 100 Continue\r\n\r\n";

namespace {

bool iequals(const std::string& a, const char* b) {
  size_t n = std::strlen(b);
  if (a.size() != n) return false;
  for (size_t i = 0; i < n; i++) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) e--;
  return s.substr(b, e - b);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parse_version(const std::string& v, int& minor, ReadStatus& err) {
  if (v == "HTTP/1.1") {
    minor = 1;
    return true;
  }
  if (v == "HTTP/1.0") {
    minor = 0;
    return true;
  }
  bool well_formed = v.size() == 8 && v.compare(0, 5, "HTTP/") == 0 &&
                     std::isdigit(static_cast<unsigned char>(v[5])) &&
                     v[6] == '.' &&
                     std::isdigit(static_cast<unsigned char>(v[7]));
  err = well_formed ? ReadStatus::VersionNotSupported : ReadStatus::Malformed;
  return false;
}

// Content-Length may repeat (or be a list) as long as every value agrees.
bool parse_content_length(const Headers& headers, bool& present,
                          size_t& length) {
  present = false;
  for (const auto& h : headers) {
    if (!iequals(h.first, "Content-Length")) continue;
    size_t start = 0;
    while (start <= h.second.size()) {
      size_t comma = h.second.find(',', start);
      if (comma == std::string::npos) comma = h.second.size();
      std::string v = trim(h.second.substr(start, comma - start));
      if (v.empty() || v.size() > 18) return false;
      for (char c : v) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
      }
      size_t n = std::stoull(v);
      if (present && n != length) return false;
      present = true;
      length = n;
      start = comma + 1;
    }
  }
  return true;
}

}  // namespace

int status_for(ReadStatus st) {
  switch (st) {
    case ReadStatus::Malformed:
      return 400;
    case ReadStatus::Stalled:
      return 408;
    case ReadStatus::BodyTooLarge:
      return 413;
    case ReadStatus::UriTooLong:
      return 414;
    case ReadStatus::HeadersTooLarge:
      return 431;
    case ReadStatus::NotImplemented:
      return 501;
    case ReadStatus::VersionNotSupported:
      return 505;
    default:
      return 0;
  }
}

const char* to_string(ReadStatus st) {
  switch (st) {
    case ReadStatus::Ok:
      return "ok";
    case ReadStatus::Closed:
      return "closed";
    case ReadStatus::Timeout:
      return "timeout";
    case ReadStatus::Error:
      return "error";
    case ReadStatus::Malformed:
      return "malformed request";
    case ReadStatus::Stalled:
      return "request timed out";
    case ReadStatus::UriTooLong:
      return "request line too long";
    case ReadStatus::HeadersTooLarge:
      return "header fields too large";
    case ReadStatus::BodyTooLarge:
      return "body too large";
    case ReadStatus::NotImplemented:
      return "unsupported transfer coding";
    case ReadStatus::VersionNotSupported:
      return "unsupported HTTP version";
  }
  return "unknown";
}

RequestReader::RequestReader(int fd, const RequestLimits& limits)
    : fd_(fd), limits_(limits) {}

ReadStatus RequestReader::fill(Deadline deadline) {
  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) return ReadStatus::Timeout;

    pollfd p{};
    p.fd = fd_;
    p.events = POLLIN;
    int rc = ::poll(&p, 1, static_cast<int>(left.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      return ReadStatus::Error;
    }
    if (rc == 0) return ReadStatus::Timeout;

    char tmp[4096];
    ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      return ReadStatus::Error;
    }
    if (n == 0) return ReadStatus::Closed;
    buffer_.append(tmp, tmp + n);
    return ReadStatus::Ok;
  }
}

ReadStatus RequestReader::read_line(std::string& line, size_t limit,
                                    ReadStatus too_long, Deadline deadline) {
  while (true) {
    auto pos = buffer_.find('\n');
    if (pos != std::string::npos) {
      line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.size() > limit) return too_long;
      return ReadStatus::Ok;
    }

    // no newline yet and already past the limit: stop buffering
    if (buffer_.size() > limit + 1) return too_long;

    ReadStatus st = fill(deadline);
    if (st != ReadStatus::Ok) return st;
  }
}

ReadStatus RequestReader::read_bytes(size_t n, std::string& out,
                                     Deadline deadline) {
  while (buffer_.size() < n) {
    ReadStatus st = fill(deadline);
    if (st == ReadStatus::Timeout) return ReadStatus::Stalled;
    if (st != ReadStatus::Ok) return st;
  }
  out.append(buffer_, 0, n);
  buffer_.erase(0, n);
  return ReadStatus::Ok;
}

ReadStatus RequestReader::wait_for_request(std::chrono::milliseconds idle) {
  if (!buffer_.empty()) return ReadStatus::Ok;
  return fill(std::chrono::steady_clock::now() + idle);
}

ReadStatus RequestReader::read_head(HttpRequest& req, Deadline deadline) {
  std::string line;

  // Tolerate stray CRLFs between pipelined requests.
  for (int skipped = 0;; skipped++) {
    bool nothing_received = buffer_.empty();
    ReadStatus st =
        read_line(line, limits_.max_line, ReadStatus::UriTooLong, deadline);
    if (st == ReadStatus::Timeout) {
      return nothing_received && skipped == 0 ? ReadStatus::Timeout
                                              : ReadStatus::Stalled;
    }
    if (st != ReadStatus::Ok) return st;
    if (!line.empty()) break;
    if (skipped >= 8) return ReadStatus::Malformed;
  }

  auto sp1 = line.find(' ');
  auto sp2 = sp1 == std::string::npos ? sp1 : line.find(' ', sp1 + 1);
  if (sp2 == std::string::npos || line.find(' ', sp2 + 1) != std::string::npos) {
    return ReadStatus::Malformed;
  }

  req.method = line.substr(0, sp1);
  req.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
  std::string version = line.substr(sp2 + 1);

  if (!is_token(req.method)) return ReadStatus::Malformed;
  ReadStatus version_err = ReadStatus::Malformed;
  if (!parse_version(version, req.version_minor, version_err)) {
    return version_err;
  }
  if (!parse_target(req)) return ReadStatus::Malformed;

  while (true) {
    ReadStatus st = read_line(line, limits_.max_field_size,
                              ReadStatus::HeadersTooLarge, deadline);
    if (st == ReadStatus::Timeout) return ReadStatus::Stalled;
    if (st != ReadStatus::Ok) return st;
    if (line.empty()) break;

    // obsolete line folding
    if (line.front() == ' ' || line.front() == '\t') return ReadStatus::Malformed;

    auto colon = line.find(':');
    if (colon == std::string::npos) return ReadStatus::Malformed;
    std::string name = line.substr(0, colon);
    if (!is_token(name)) return ReadStatus::Malformed;
    std::string value = trim(line.substr(colon + 1));
    if (value.find('\0') != std::string::npos) return ReadStatus::Malformed;

    if (req.headers.size() >= limits_.max_fields) {
      return ReadStatus::HeadersTooLarge;
    }
    req.headers.emplace_back(std::move(name), std::move(value));
  }

  return ReadStatus::Ok;
}

ReadStatus RequestReader::read_body(HttpRequest& req, Deadline deadline) {
  bool has_length = false;
  size_t length = 0;
  if (!parse_content_length(req.headers, has_length, length)) {
    return ReadStatus::Malformed;
  }

  auto te = req.header("Transfer-Encoding");
  if (te) {
    if (has_length) return ReadStatus::Malformed;
    if (!iequals(trim(*te), "chunked")) return ReadStatus::NotImplemented;
    return read_chunked(req.body, deadline);
  }

  if (!has_length || length == 0) return ReadStatus::Ok;
  if (length > limits_.max_body) return ReadStatus::BodyTooLarge;
  return read_bytes(length, req.body, deadline);
}

ReadStatus RequestReader::read_chunked(std::string& out, Deadline deadline) {
  std::string line;
  while (true) {
    ReadStatus st =
        read_line(line, limits_.max_line, ReadStatus::Malformed, deadline);
    if (st == ReadStatus::Timeout) return ReadStatus::Stalled;
    if (st != ReadStatus::Ok) return st;

    // chunk extensions are ignored
    std::string size_str = trim(line.substr(0, line.find(';')));
    if (size_str.empty() || size_str.size() > 15) return ReadStatus::Malformed;
    size_t size = 0;
    for (char c : size_str) {
      int v = hex_value(c);
      if (v < 0) return ReadStatus::Malformed;
      size = size * 16 + static_cast<size_t>(v);
    }

    if (size == 0) break;
    if (out.size() + size > limits_.max_body) return ReadStatus::BodyTooLarge;

    st = read_bytes(size, out, deadline);
    if (st != ReadStatus::Ok) return st;

    st = read_line(line, 0, ReadStatus::Malformed, deadline);
    if (st == ReadStatus::Timeout) return ReadStatus::Stalled;
    if (st != ReadStatus::Ok) return st;
  }

  // trailer section, discarded
  for (size_t fields = 0;; fields++) {
    ReadStatus st = read_line(line, limits_.max_field_size,
                              ReadStatus::HeadersTooLarge, deadline);
    if (st == ReadStatus::Timeout) return ReadStatus::Stalled;
    if (st != ReadStatus::Ok) return st;
    if (line.empty()) break;
    if (fields >= limits_.max_fields) return ReadStatus::HeadersTooLarge;
  }
  return ReadStatus::Ok;
}

bool percent_decode(const std::string& in, std::string& out) {
  out.clear();
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); i++) {
    if (in[i] != '%') {
      out.push_back(in[i]);
      continue;
    }
    if (i + 2 >= in.size()) return false;
    int hi = hex_value(in[i + 1]);
    int lo = hex_value(in[i + 2]);
    if (hi < 0 || lo < 0) return false;
    out.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }
  return true;
}

bool parse_target(HttpRequest& req) {
  const std::string& t = req.target;
  if (t.empty()) return false;
  for (char c : t) {
    if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f) return false;
  }

  if (t == "*") {
    req.path = "*";
    req.query.clear();
    return true;
  }

  std::string origin;
  if (t.front() == '/') {
    origin = t;
  } else {
    // absolute-form: scheme://authority/path?query
    auto scheme_end = t.find("://");
    if (scheme_end == std::string::npos) return false;
    auto slash = t.find('/', scheme_end + 3);
    auto question = t.find('?', scheme_end + 3);
    if (slash == std::string::npos || (question != std::string::npos && question < slash)) {
      origin = "/" + (question == std::string::npos ? "" : t.substr(question));
    } else {
      origin = t.substr(slash);
    }
  }

  auto q = origin.find('?');
  std::string raw_path = origin.substr(0, q);
  req.query = q == std::string::npos ? "" : origin.substr(q + 1);
  // drop any fragment a client sent by mistake
  auto hash = req.query.find('#');
  if (hash != std::string::npos) req.query.erase(hash);
  return percent_decode(raw_path, req.path);
}

bool wants_keep_alive(const HttpRequest& req) {
  auto conn = req.header("Connection");
  if (req.version_minor == 0) {
    return conn && header_has_token(*conn, "keep-alive");
  }
  return !(conn && header_has_token(*conn, "close"));
}

const char* reason_phrase(int status) {
  switch (status) {
    case 100: return "Continue";
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 206: return "Partial Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 303: return "See Other";
    case 304: return "Not Modified";
    case 307: return "Temporary Redirect";
    case 308: return "Permanent Redirect";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 409: return "Conflict";
    case 411: return "Length Required";
    case 413: return "Content Too Large";
    case 414: return "URI Too Long";
    case 415: return "Unsupported Media Type";
    case 422: return "Unprocessable Content";
    case 429: return "Too Many Requests";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    case 505: return "HTTP Version Not Supported";
    default: break;
  }
  if (status >= 200 && status < 300) return "OK";
  if (status >= 300 && status < 400) return "Redirect";
  if (status >= 400 && status < 500) return "Client Error";
  return "Server Error";
}

HttpResponse error_response(int status) {
  return HttpResponse::text(
      status, std::to_string(status) + " " + reason_phrase(status) + "\n");
}

std::string http_date(std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[64];
  size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  return std::string(buf, n);
}

std::string render_response(const HttpResponse& resp, bool keep_alive,
                            bool head_only) {
  bool bodyless = resp.status == 204 || resp.status == 304 ||
                  (resp.status >= 100 && resp.status < 200);

  std::string out;
  out.reserve(256 + (head_only || bodyless ? 0 : resp.body.size()));
  out += "HTTP/1.1 ";
  out += std::to_string(resp.status);
  out += ' ';
  out += resp.reason.empty() ? reason_phrase(resp.status) : resp.reason;
  out += "\r\n";

  bool has_server = false;
  bool has_date = false;
  for (const auto& h : resp.headers) {
    if (iequals(h.first, "Connection") || iequals(h.first, "Content-Length") ||
        iequals(h.first, "Transfer-Encoding"))
      continue;
    if (iequals(h.first, "Server")) has_server = true;
    if (iequals(h.first, "Date")) has_date = true;
    out += h.first;
    out += ": ";
    out += h.second;
    out += "\r\n";
  }

  if (!has_server) out += "Server: apphost\r\n";
  if (!has_date) out += "Date: " + http_date(std::time(nullptr)) + "\r\n";
  out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
  if (!bodyless) {
    out += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
  }
  out += "\r\n";

  if (!head_only && !bodyless) out += resp.body;
  return out;
}

bool send_all(int fd, const char* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return false;
    sent += static_cast<size_t>(n);
  }
  return true;
}

bool send_str(int fd, const std::string& s) {
  return send_all(fd, s.data(), s.size());
}
