#include "http_server.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/core/ignore_unused.hpp>
#include <csignal>
#include <optional>
#include <future>
#include <algorithm>
#include <cctype>

namespace flowapi {

Request to_dispatch_request(const http::request<http::string_body>& req, const tcp::endpoint& remote) {
    Request request;
    request.method = std::string(req.method_string());
    request.target = std::string(req.target());
    request.body = req.body();
    request.client_host = remote.address().to_string();
    request.client_port = remote.port();

    for (const auto& field : req) {
        std::string name(field.name_string());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        request.headers[name] = std::string(field.value());
    }
    return request;
}

http::response<http::string_body> to_http_response(const Response& response, unsigned version, bool keep_alive) {
    http::response<http::string_body> res{static_cast<http::status>(response.status), version};
    res.set(http::field::server, "flowapi-server");
    for (const auto& [name, value] : response.headers) {
        res.set(name, value);
    }
    res.keep_alive(keep_alive);
    res.body() = response.body;
    res.prepare_payload();
    return res;
}

// ============================================================================
// Session
// ============================================================================

class HttpServer::Session : public std::enable_shared_from_this<HttpServer::Session> {
public:
    Session(tcp::socket&& socket, HttpServer& server)
        : stream_(std::move(socket)), server_(server) {}

    void start() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    http::response<http::string_body> response_;
    HttpServer& server_;

    void do_read() {
        parser_.emplace();
        parser_->body_limit(server_.options_.body_limit);

        stream_.expires_after(server_.options_.idle_timeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }

        if (ec == http::error::body_limit) {
            Response response;
            response.status = 413;
            response.headers.emplace_back("Content-Type", "application/json");
            response.body = "{\"detail\":\"Request body too large\"}";
            write(to_http_response(response, 11, false));
            return;
        }

        if (ec) {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
                Logger::get_instance().log_event(LogLevel::DEBUG, "Read error", {
                    {"event", "read_error"},
                    {"error_message", ec.message()}
                });
            }
            return;
        }

        if (server_.stopping_) {
            do_close();
            return;
        }

        http::request<http::string_body> req = parser_->release();

        beast::error_code remote_ec;
        tcp::endpoint remote = stream_.socket().remote_endpoint(remote_ec);
        Request request = to_dispatch_request(req, remote);
        unsigned version = req.version();
        bool keep_alive = req.keep_alive();

        stream_.expires_never();

        auto self = shared_from_this();
        net::post(*server_.workers_, [self, request = std::move(request), version, keep_alive]() {
            Response response;
            try {
                response = self->server_.dispatcher_.dispatch(request, &self->server_.stopping_);
            } catch (const std::exception& e) {
                Logger::get_instance().log_error(LogContext("", request.method, request.target), e.what());
                response = Response();
                response.status = 500;
                response.headers.emplace_back("Content-Type", "application/json");
                response.body = "{\"detail\":\"Requested process failed\"}";
            }

            net::post(self->stream_.get_executor(),
                      [self, response = std::move(response), version, keep_alive]() {
                          self->write(to_http_response(response, version, keep_alive));
                      });
        });
    }

    void write(http::response<http::string_body> response) {
        response_ = std::move(response);
        bool close = response_.need_eof();

        stream_.expires_after(server_.options_.idle_timeout);
        http::async_write(stream_, response_,
                          beast::bind_front_handler(&Session::on_write, shared_from_this(), close));
    }

    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec) {
            return;
        }

        if (close) {
            do_close();
            return;
        }

        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(const RequestDispatcher& dispatcher, HttpServerOptions options)
    : dispatcher_(dispatcher),
      options_(std::move(options)),
      acceptor_(ioc_),
      running_(false),
      stopping_(false),
      bound_port_(0) {
    if (options_.pipeline_workers == 0) {
        throw FlowApiError("HttpServer requires at least one pipeline worker");
    }
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) {
        return;
    }

    tcp::endpoint endpoint{net::ip::make_address(options_.address), options_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    workers_ = std::make_unique<net::thread_pool>(options_.pipeline_workers);
    running_ = true;
    stopping_ = false;

    do_accept();

    unsigned int thread_count = options_.io_threads;
    if (thread_count == 0) {
        thread_count = std::max(1u, std::thread::hardware_concurrency());
    }
    io_threads_.reserve(thread_count);
    for (unsigned int i = 0; i < thread_count; ++i) {
        io_threads_.emplace_back([this] { ioc_.run(); });
    }

    Logger::get_instance().log_event(LogLevel::INFO, "Server listening", {
        {"event", "server_started"},
        {"address", options_.address},
        {"port", std::to_string(bound_port_)},
        {"io_threads", std::to_string(thread_count)},
        {"pipeline_workers", std::to_string(options_.pipeline_workers)}
    });
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    Logger& logger = Logger::get_instance();
    logger.log_event(LogLevel::INFO, "Server stopping", {{"event", "server_stopping"}});

    stopping_ = true;
    net::post(ioc_, [this]() {
        beast::error_code ec;
        acceptor_.close(ec);
    });

    // Drain: running walks stop at their next node boundary
    workers_->join();

    ioc_.stop();
    for (auto& thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    io_threads_.clear();

    logger.log_event(LogLevel::INFO, "Server stopped", {{"event", "server_stopped"}});
    logger.flush();
}

void HttpServer::run() {
    std::promise<int> stop_signal;
    std::future<int> stopped = stop_signal.get_future();

    net::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([&stop_signal](const beast::error_code& ec, int signal_number) {
        if (!ec) {
            stop_signal.set_value(signal_number);
        }
    });

    start();

    int signal_number = stopped.get();
    Logger::get_instance().log_event(LogLevel::INFO, "Signal received", {
        {"event", "signal"},
        {"signal", std::to_string(signal_number)}
    });

    stop();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&HttpServer::on_accept, this)
    );
}

void HttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        Logger::get_instance().log_warning(LogContext(), "Accept error: " + ec.message());
    } else {
        std::make_shared<Session>(std::move(socket), *this)->start();
    }

    if (running_) {
        do_accept();
    }
}

} // namespace flowapi
