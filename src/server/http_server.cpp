#include "batch_reader/http_server.hpp"
#include "batch_reader/batch_reader.hpp"
#include "batch_reader/errors.hpp"
#include "batch_reader/json_writer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <string>
#include <utility>

namespace br {

static constexpr const char* kJson = "application/json; charset=utf-8";

// Strict unsigned decimal parse; false on junk or overflow.
static bool parse_u64(const std::string& s, std::uint64_t& out) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

struct HttpServer::Impl {
  const BatchReader& reader;
  Config cfg;
  httplib::Server svr;
  int bound_port{-1};

  Impl(const BatchReader& r, Config c) : reader(r), cfg(std::move(c)) {}

  static void fail(httplib::Response& res, int status, const std::string& msg) {
    res.status = status;
    res.set_content(JsonWriter::error_json(msg), kJson);
  }

  // Run one reader operation and map its failure kind to a status code.
  template <class Fn>
  static void respond(httplib::Response& res, Fn&& fn) {
    try {
      res.set_content(fn(), kJson);
    } catch (const FormatError& e) {
      fail(res, 422, e.what());
    } catch (const IoError& e) {
      fail(res, 500, e.what());
    }
  }

  void routes() {
    svr.Get("/info", [this](const httplib::Request&, httplib::Response& res) {
      respond(res, [&]{ return JsonWriter::to_json(reader.file_info()); });
    });

    svr.Get("/count", [this](const httplib::Request&, httplib::Response& res) {
      respond(res, [&]{ return JsonWriter::count_json(reader.count_rows()); });
    });

    svr.Get("/chunk", [this](const httplib::Request& req, httplib::Response& res) {
      std::uint64_t start = 0;
      std::uint64_t rows = reader.batch_size();
      if (!req.has_param("start") || !parse_u64(req.get_param_value("start"), start)) {
        fail(res, 400, "query parameter 'start' must be a non-negative integer");
        return;
      }
      if (req.has_param("rows") && !parse_u64(req.get_param_value("rows"), rows)) {
        fail(res, 400, "query parameter 'rows' must be a non-negative integer");
        return;
      }
      respond(res, [&]{
        return JsonWriter::to_json(reader.read_chunk(start, static_cast<std::size_t>(rows)));
      });
    });

    svr.Get("/batches", [this](const httplib::Request&, httplib::Response& res) {
      respond(res, [&]{ return JsonWriter::to_json(reader.read_all()); });
    });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
      spdlog::debug("[serve] {} {} -> {}", req.method, req.path, res.status);
    });
  }
};

HttpServer::HttpServer(const BatchReader& reader, Config cfg)
  : p_(new Impl(reader, std::move(cfg))) { p_->routes(); }
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  if (p_->cfg.port == 0) {
    p_->bound_port = p_->svr.bind_to_any_port(p_->cfg.host);
    return p_->bound_port > 0;
  }
  if (!p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) return false;
  p_->bound_port = p_->cfg.port;
  return true;
}

bool HttpServer::serve() { return p_->svr.listen_after_bind(); }

int HttpServer::run() {
  if (!start()) return -1;
  return serve() ? 0 : -1;
}

void HttpServer::stop() { p_->svr.stop(); }

int HttpServer::port() const noexcept { return p_->bound_port; }

}
