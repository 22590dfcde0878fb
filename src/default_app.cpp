#include "default_app.hpp"

#include <string>

namespace {

HttpResponse not_allowed(const std::string& allow) {
  HttpResponse r = HttpResponse::text(405, "405 Method Not Allowed\n");
  r.headers.emplace_back("Allow", allow);
  return r;
}

bool is_read(const HttpRequest& req) {
  return req.method == "GET" || req.method == "HEAD";
}

}  // namespace

Application make_default_app() {
  return [](const HttpRequest& req) -> HttpResponse {
    if (req.path == "/") {
      if (!is_read(req)) return not_allowed("GET, HEAD");
      return HttpResponse::text(200, "apphost is running\n");
    }

    if (req.path == "/health") {
      if (!is_read(req)) return not_allowed("GET, HEAD");
      return HttpResponse::text(200, "{\"status\":\"ok\"}", "application/json");
    }

    if (req.path == "/echo") {
      if (req.method != "POST") return not_allowed("POST");
      auto type = req.header("Content-Type");
      return HttpResponse::text(200, req.body,
                                type ? *type : "application/octet-stream");
    }

    return HttpResponse::text(404, "404 Not Found\n");
  };
}
