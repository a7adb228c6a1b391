#include "arbscan/websocket_client.hpp"
#include <iostream>

namespace arbscan {

WebSocketClient::WebSocketClient(
    asio::io_context& ioc,
    ssl::context& ssl_ctx,
    const std::string& name,
    const std::string& host,
    const std::string& port,
    const std::string& path,
    std::vector<std::string> symbols
)
    : name_(name)
    , symbols_(std::move(symbols))
    , strand_(asio::make_strand(ioc))
    , ssl_ctx_(ssl_ctx)
    , resolver_(strand_)
    , reconnect_timer_(strand_)
    , host_(host)
    , port_(port)
    , path_(path)
    , running_(false)
    , messages_received_(0)
    , reconnect_attempts_(0)
{
}

websocket::stream_base::timeout WebSocketClient::stream_timeouts() {
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::seconds(CONNECT_TIMEOUT_SECONDS);
    opt.idle_timeout = std::chrono::seconds(IDLE_TIMEOUT_SECONDS);
    opt.keep_alive_pings = true;
    return opt;
}

void WebSocketClient::start() {
    running_ = true;
    std::cout << "[" << name_ << "] Connecting to wss://" << host_ << ":" << port_ << path_
              << " for " << symbols_.size() << " symbols" << std::endl;
    asio::post(strand_, [self = shared_from_this()]() {
        self->reconnect_attempts_ = 0;
        self->open_session();
    });
}

void WebSocketClient::stop() {
    running_ = false;
    asio::post(strand_, [self = shared_from_this()]() {
        self->reconnect_timer_.cancel();
        self->resolver_.cancel();
        if (self->ws_ && self->ws_->is_open()) {
            self->ws_->async_close(websocket::close_code::normal, [self](beast::error_code ec) {
                if (ec && ec != asio::error::operation_aborted) {
                    std::cerr << "[" << self->name_ << "] Close error: " << ec.message() << std::endl;
                }
            });
        } else if (self->ws_) {
            beast::get_lowest_layer(*self->ws_).cancel();
        }
    });
    std::cout << "[" << name_ << "] Stopped after " << messages_received_.load() << " messages" << std::endl;
}

void WebSocketClient::open_session() {
    // Fresh stream per attempt; a failed TLS session cannot be reused
    ws_ = std::make_unique<Stream>(strand_, ssl_ctx_);
    buffer_.consume(buffer_.size());

    resolver_.async_resolve(
        host_,
        port_,
        [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
            self->on_resolve(ec, results);
        }
    );
}

void WebSocketClient::on_resolve(beast::error_code ec, const tcp::resolver::results_type& results) {
    if (ec) {
        return fail("Resolve", ec);
    }

    beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(CONNECT_TIMEOUT_SECONDS));
    beast::get_lowest_layer(*ws_).async_connect(
        results,
        [self = shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
            self->on_connect(ec);
        }
    );
}

void WebSocketClient::on_connect(beast::error_code ec) {
    if (ec) {
        return fail("Connect", ec);
    }

    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), host_.c_str())) {
        ec = beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
        return fail("SNI", ec);
    }

    beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(CONNECT_TIMEOUT_SECONDS));
    ws_->next_layer().async_handshake(
        ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void WebSocketClient::on_ssl_handshake(beast::error_code ec) {
    if (ec) {
        return fail("SSL handshake", ec);
    }

    // The websocket layer keeps its own timers from here on
    beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(stream_timeouts());
    ws_->set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "arbscan/1.0");
        }
    ));

    ws_->async_handshake(
        host_,
        path_,
        [self = shared_from_this()](beast::error_code ec) {
            self->on_ws_handshake(ec);
        }
    );
}

void WebSocketClient::on_ws_handshake(beast::error_code ec) {
    if (ec) {
        return fail("WebSocket handshake", ec);
    }

    std::cout << "[" << name_ << "] Stream connected" << std::endl;
    reconnect_attempts_ = 0;
    subscribe();
}

void WebSocketClient::subscribe() {
    auto request = std::make_shared<std::string>(get_subscribe_message());
    if (request->empty()) {
        read();
        return;
    }

    ws_->async_write(
        asio::buffer(*request),
        [self = shared_from_this(), request](beast::error_code ec, std::size_t) {
            if (ec) {
                return self->fail("Subscribe", ec);
            }
            std::cout << "[" << self->name_ << "] Subscribed: " << *request << std::endl;
            self->read();
        }
    );
}

void WebSocketClient::read() {
    ws_->async_read(
        buffer_,
        [self = shared_from_this()](beast::error_code ec, std::size_t bytes_transferred) {
            self->on_read(ec, bytes_transferred);
        }
    );
}

void WebSocketClient::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        if (ec == websocket::error::closed || ec == asio::error::operation_aborted) {
            if (running_) {
                std::cout << "[" << name_ << "] Stream closed by peer" << std::endl;
                reconnect();
            }
            return;
        }
        return fail("Read", ec);
    }

    const std::string message = beast::buffers_to_string(buffer_.data());
    buffer_.consume(bytes_transferred);
    ++messages_received_;

    try {
        deliver(parse_message(message));
    } catch (const std::exception& e) {
        std::cerr << "[" << name_ << "] Parse error: " << e.what() << std::endl;
    }

    if (running_) {
        read();
    }
}

void WebSocketClient::fail(const char* stage, beast::error_code ec) {
    if (!running_) {
        return;
    }
    std::cerr << "[" << name_ << "] " << stage << " error: " << ec.message() << std::endl;
    reconnect();
}

void WebSocketClient::reconnect() {
    if (!running_) {
        return;
    }
    if (reconnect_attempts_ >= MAX_RECONNECT_ATTEMPTS) {
        std::cerr << "[" << name_ << "] Giving up after " << MAX_RECONNECT_ATTEMPTS
                  << " reconnection attempts" << std::endl;
        return;
    }

    ++reconnect_attempts_;
    std::cout << "[" << name_ << "] Reconnecting in " << RECONNECT_DELAY_SECONDS
              << "s (attempt " << reconnect_attempts_ << "/" << MAX_RECONNECT_ATTEMPTS << ")" << std::endl;

    if (ws_) {
        beast::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);
    }

    reconnect_timer_.expires_after(std::chrono::seconds(RECONNECT_DELAY_SECONDS));
    reconnect_timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
        if (ec || !self->running_) {
            return;
        }
        self->open_session();
    });
}

void WebSocketClient::deliver(const std::vector<PriceQuote>& quotes) {
    if (!callback_) {
        return;
    }
    // One rejected quote must not drop the rest of the frame
    for (const auto& quote : quotes) {
        try {
            callback_(quote);
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] Quote for " << quote.symbol << " rejected: " << e.what() << std::endl;
        }
    }
}

} // namespace arbscan
