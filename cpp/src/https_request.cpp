#include "arbscan/https_request.hpp"

namespace arbscan {

HttpsRequest::HttpsRequest(asio::io_context& ioc, ssl::context& ssl_ctx, std::string host, std::string port)
    : resolver_(asio::make_strand(ioc))
    , stream_(asio::make_strand(ioc), ssl_ctx)
    , host_(std::move(host))
    , port_(std::move(port))
{
}

void HttpsRequest::get(const std::string& target, Handler handler) {
    req_.method(http::verb::get);
    req_.target(target);
    run(std::move(handler));
}

void HttpsRequest::post(const std::string& target, const std::string& body, Handler handler) {
    req_.method(http::verb::post);
    req_.target(target);
    req_.set(http::field::content_type, "application/json");
    req_.body() = body;
    req_.prepare_payload();
    run(std::move(handler));
}

void HttpsRequest::run(Handler handler) {
    handler_ = std::move(handler);
    req_.version(11);
    req_.set(http::field::host, host_);
    req_.set(http::field::user_agent, "arbscan/1.0");

    // Set SNI hostname
    if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str())) {
        finish(beast::error_code{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()});
        return;
    }

    resolver_.async_resolve(
        host_,
        port_,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                self->finish(ec);
                return;
            }
            self->connect(results);
        }
    );
}

void HttpsRequest::connect(const tcp::resolver::results_type& results) {
    beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(TIMEOUT_SECONDS));
    beast::get_lowest_layer(stream_).async_connect(
        results,
        [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
            if (ec) {
                self->finish(ec);
                return;
            }
            self->handshake();
        }
    );
}

void HttpsRequest::handshake() {
    stream_.async_handshake(
        ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec) {
            if (ec) {
                self->finish(ec);
                return;
            }
            self->write();
        }
    );
}

void HttpsRequest::write() {
    http::async_write(
        stream_,
        req_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                self->finish(ec);
                return;
            }
            self->read();
        }
    );
}

void HttpsRequest::read() {
    http::async_read(
        stream_,
        buffer_,
        res_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                self->finish(ec);
                return;
            }
            self->shutdown();
        }
    );
}

void HttpsRequest::shutdown() {
    // The response is complete; deliver it before the TLS close_notify
    finish({});

    beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(TIMEOUT_SECONDS));
    stream_.async_shutdown([self = shared_from_this()](beast::error_code) {
        // Servers routinely drop the connection without close_notify
    });
}

void HttpsRequest::finish(beast::error_code ec) {
    if (!handler_) {
        return;
    }
    Handler handler = std::move(handler_);
    handler_ = nullptr;
    handler(ec, ec ? 0u : res_.result_int(), ec ? std::string() : res_.body());
}

} // namespace arbscan
