#pragma once
#include <string>

namespace br {

class BatchReader;

// Tiny wrapper around cpp-httplib exposing one reader as JSON:
//   GET /info  GET /count  GET /chunk?start=S&rows=N  GET /batches
class HttpServer {
public:
  struct Config {
    std::string host = "127.0.0.1";
    int port = 8080; // 0 picks a free port
  };

  // `reader` must outlive the server.
  HttpServer(const BatchReader& reader, Config cfg);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind without serving; returns false on bind error.
  bool start();

  // Serve on the bound socket; blocks until stop().
  bool serve();

  // start() + serve(); returns -1 if binding or listening fails.
  int run();

  // Stop if running.
  void stop();

  // Bound port once start() succeeded.
  int port() const noexcept;

private:
  struct Impl;
  Impl* p_;
};

}
