// === HTTP Server =============================================================
//
// Asynchronous HTTP/1.1 listener built on Boost.Beast. Accepted connections are
// served on a small pool of io_context threads; every request is handed to
// HttpApi and the response written back, honouring keep-alive.

#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/logger.h>

#include "beacon_presence/http_api.hpp"

namespace beacon_presence {

/** @brief Owns the listening socket and the io threads serving HttpApi. */
class HttpServer final {
  public:
    HttpServer(HttpConfig config, HttpApi& http_api);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /** @brief Bind, listen and start the io threads; may follow stop(). Throws std::runtime_error when binding fails. */
    void start();
    /** @brief Stop accepting, abandon open sessions and join the io threads. */
    void stop();

    [[nodiscard]] bool is_running() const noexcept;
    /** @brief Port actually bound; differs from the configured one when that was 0. */
    [[nodiscard]] unsigned short bound_port() const noexcept;

  private:
    void do_accept();

    HttpConfig config_;
    HttpApi& http_api_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> list_threads_;
    std::atomic<bool> flag_running_{false};
    std::atomic<unsigned short> bound_port_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace beacon_presence
