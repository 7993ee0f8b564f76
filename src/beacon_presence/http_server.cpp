#include "beacon_presence/http_server.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "beacon_presence/logging.hpp"

namespace beacon_presence {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

constexpr std::chrono::seconds k_session_timeout{30};

/** @brief One client connection; keeps itself alive through its handlers. */
class HttpSession final : public std::enable_shared_from_this<HttpSession> {
  public:
    HttpSession(tcp::socket&& socket, HttpApi& http_api, std::shared_ptr<spdlog::logger> logger)
        : stream_(std::move(socket)),
          http_api_(http_api),
          logger_(std::move(logger)) {}

    void start() {
        asio::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

  private:
    void do_read() {
        request_ = {};
        stream_.expires_after(k_session_timeout);
        http::async_read(stream_, buffer_, request_, beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code error_code, std::size_t) {
        if (error_code == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (error_code) {
            if (error_code != beast::error::timeout) {
                logger_->debug("HTTP read failed: {}", error_code.message());
            }
            return;
        }

        response_ = std::make_shared<HttpResponse>(http_api_.handle(request_));
        const bool keep_alive = response_->keep_alive();
        http::async_write(stream_, *response_, beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), keep_alive));
    }

    void on_write(bool keep_alive, beast::error_code error_code, std::size_t) {
        if (error_code) {
            logger_->debug("HTTP write failed: {}", error_code.message());
            return;
        }
        if (!keep_alive) {
            do_close();
            return;
        }
        response_.reset();
        do_read();
    }

    void do_close() {
        beast::error_code error_code;
        stream_.socket().shutdown(tcp::socket::shutdown_send, error_code);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    HttpRequest request_;
    std::shared_ptr<HttpResponse> response_;
    HttpApi& http_api_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace

HttpServer::HttpServer(HttpConfig config, HttpApi& http_api)
    : config_(std::move(config)),
      http_api_(http_api),
      io_context_(config_.threads),
      acceptor_(asio::make_strand(io_context_)),
      logger_(get_logger()) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    // A previous stop() leaves the io_context stopped.
    io_context_.restart();

    beast::error_code error_code;
    const asio::ip::address address = asio::ip::make_address(config_.address, error_code);
    if (error_code) {
        flag_running_.store(false);
        throw std::runtime_error("Invalid HTTP listen address " + config_.address + ": " + error_code.message());
    }
    const tcp::endpoint endpoint{address, config_.port};

    acceptor_.open(endpoint.protocol(), error_code);
    if (!error_code) {
        acceptor_.set_option(asio::socket_base::reuse_address(true), error_code);
    }
    if (!error_code) {
        acceptor_.bind(endpoint, error_code);
    }
    if (!error_code) {
        acceptor_.listen(asio::socket_base::max_listen_connections, error_code);
    }
    if (error_code) {
        flag_running_.store(false);
        beast::error_code close_error;
        acceptor_.close(close_error);
        throw std::runtime_error("Unable to listen on " + config_.address + ":" + std::to_string(config_.port) + ": " + error_code.message());
    }
    bound_port_.store(acceptor_.local_endpoint().port());
    logger_->info("HTTP API listening on {}:{}", config_.address, bound_port_.load());

    do_accept();
    list_threads_.reserve(static_cast<std::size_t>(config_.threads));
    for (int index = 0; index < config_.threads; ++index) {
        list_threads_.emplace_back([this]() { io_context_.run(); });
    }
}

void HttpServer::stop() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Stopping HTTP API");
    io_context_.stop();
    for (std::thread& thread : list_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    list_threads_.clear();
    beast::error_code error_code;
    acceptor_.close(error_code);
}

bool HttpServer::is_running() const noexcept {
    return flag_running_.load();
}

unsigned short HttpServer::bound_port() const noexcept {
    return bound_port_.load();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_context_), [this](beast::error_code error_code, tcp::socket socket) {
        if (error_code) {
            if (error_code == asio::error::operation_aborted) {
                return;
            }
            logger_->warn("HTTP accept failed: {}", error_code.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), http_api_, logger_)->start();
        }
        if (flag_running_.load()) {
            do_accept();
        }
    });
}

}  // namespace beacon_presence
