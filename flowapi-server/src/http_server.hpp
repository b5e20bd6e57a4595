/**
 * @file http_server.hpp
 * @brief HTTP/1.1 transport for the request dispatcher (Boost.Beast)
 *
 * Threading model:
 * - `io_threads` threads run the io_context: accept, read and write.
 *   Every connection is bound to its own strand.
 * - Each complete request is posted to a pool of `pipeline_workers`
 *   threads that run RequestDispatcher::dispatch(). A node that blocks
 *   (SleepOperator, HttpRequester) holds only its worker.
 * - The response is posted back to the connection's strand and written.
 */

#ifndef FLOWAPI_HTTP_SERVER_HPP
#define FLOWAPI_HTTP_SERVER_HPP

#include "dispatcher.hpp"
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace flowapi {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct HttpServerOptions {
    std::string address;
    unsigned short port;                // 0 picks an ephemeral port
    unsigned int io_threads;            // 0 = hardware concurrency
    unsigned int pipeline_workers;
    size_t body_limit;                  // Larger bodies are answered with 413
    std::chrono::seconds idle_timeout;

    HttpServerOptions()
        : address("0.0.0.0"), port(1979), io_threads(0), pipeline_workers(16),
          body_limit(1024 * 1024), idle_timeout(30) {}
};

/**
 * @brief Convert a Beast request into a dispatcher Request
 */
Request to_dispatch_request(const http::request<http::string_body>& req, const tcp::endpoint& remote);

/**
 * @brief Convert a dispatcher Response into a Beast response
 */
http::response<http::string_body> to_http_response(const Response& response, unsigned version, bool keep_alive);

class HttpServer {
public:
    HttpServer(const RequestDispatcher& dispatcher, HttpServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start the I/O threads; returns immediately
     *
     * @throws boost::system::system_error If the address cannot be bound
     */
    void start();

    /**
     * @brief Stop accepting, let in-flight pipelines finish, stop all threads
     *
     * Pipelines still running are abandoned at their next node boundary.
     */
    void stop();

    /**
     * @brief start(), then block until SIGINT or SIGTERM, then stop()
     */
    void run();

    /**
     * @brief Port actually bound (valid after start())
     */
    unsigned short bound_port() const { return bound_port_; }

    bool is_running() const { return running_; }

private:
    class Session;

    const RequestDispatcher& dispatcher_;
    HttpServerOptions options_;

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::unique_ptr<net::thread_pool> workers_;
    std::vector<std::thread> io_threads_;

    std::atomic<bool> running_;
    std::atomic<bool> stopping_;
    unsigned short bound_port_;

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
};

} // namespace flowapi

#endif // FLOWAPI_HTTP_SERVER_HPP
