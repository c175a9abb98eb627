/**
 * @file signaling_client.cpp
 * @brief 信令 WebSocket 客户端实现
 */

#include "call_client/signaling_client.hpp"
#include "session_core/signal_codec.hpp"
#include "session_core/logger.hpp"

#include <chrono>

namespace telelink::client {

SignalingClient::SignalingClient(net::io_context& io, SignalingConfig config)
    : io_(io)
    , config_(std::move(config))
    , resolver_(io)
{
}

void SignalingClient::connect() {
    ++generation_;
    open_ = false;
    closing_ = false;
    writing_ = false;
    write_queue_.clear();
    buffer_.clear();

    // 丢弃旧流，其挂起的回调会带着旧代号返回
    ws_ = std::make_unique<websocket::stream<beast::tcp_stream>>(io_);

    LOG_INFO("[SignalingClient] Connecting to " << config_.host << ":" << config_.port << config_.path);

    uint64_t gen = generation_;
    resolver_.async_resolve(config_.host, config_.port,
        [self = shared_from_this(), gen](beast::error_code ec, tcp::resolver::results_type results) {
            self->on_resolve(gen, ec, std::move(results));
        });
}

void SignalingClient::on_resolve(uint64_t gen, beast::error_code ec,
                                 tcp::resolver::results_type results) {
    if (gen != generation_) {
        return;
    }
    if (ec) {
        return fail(gen, ec, "resolve");
    }

    beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(10));
    beast::get_lowest_layer(*ws_).async_connect(results,
        [self = shared_from_this(), gen](beast::error_code connect_ec,
                                         tcp::resolver::results_type::endpoint_type ep) {
            self->on_connect(gen, connect_ec, ep);
        });
}

void SignalingClient::on_connect(uint64_t gen, beast::error_code ec,
                                 tcp::resolver::results_type::endpoint_type ep) {
    if (gen != generation_) {
        return;
    }
    if (ec) {
        return fail(gen, ec, "connect");
    }

    // 握手阶段之后交由 websocket 自身的超时设置，空闲时发送 ping 探测半开连接
    beast::get_lowest_layer(*ws_).expires_never();
    auto timeout = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeout.idle_timeout = config_.idle_timeout;
    timeout.keep_alive_pings = true;
    ws_->set_option(timeout);
    ws_->binary(false);

    std::string host = config_.host + ":" + std::to_string(ep.port());
    ws_->async_handshake(host, config_.path,
        [self = shared_from_this(), gen](beast::error_code handshake_ec) {
            self->on_handshake(gen, handshake_ec);
        });
}

void SignalingClient::on_handshake(uint64_t gen, beast::error_code ec) {
    if (gen != generation_) {
        return;
    }
    if (ec) {
        return fail(gen, ec, "handshake");
    }

    open_ = true;
    LOG_INFO("[SignalingClient] Connected");

    do_read(gen);

    if (on_open_) {
        on_open_();
    }
}

void SignalingClient::do_read(uint64_t gen) {
    ws_->async_read(buffer_,
        [self = shared_from_this(), gen](beast::error_code ec, std::size_t bytes) {
            self->on_read(gen, ec, bytes);
        });
}

void SignalingClient::on_read(uint64_t gen, beast::error_code ec, std::size_t bytes) {
    if (gen != generation_) {
        return;
    }
    if (ec) {
        return fail(gen, ec, "read");
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(bytes);

    try {
        auto msg = core::decode_message(text);
        if (on_message_) {
            on_message_(msg);
        }
    } catch (const core::MalformedMessage& e) {
        LOG_WARN("[SignalingClient] Malformed message from server: " << e.what());
    }

    // 回调中可能已关闭或重连
    if (gen == generation_ && open_) {
        do_read(gen);
    }
}

bool SignalingClient::send(const core::SignalMessage& msg) {
    if (!open_ || closing_) {
        LOG_WARN("[SignalingClient] Not connected, dropping " << core::to_string(msg.type));
        return false;
    }

    write_queue_.push_back(core::encode_message(msg));
    if (!writing_) {
        writing_ = true;
        do_write(generation_);
    }
    return true;
}

void SignalingClient::do_write(uint64_t gen) {
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }

    ws_->async_write(net::buffer(write_queue_.front()),
        [self = shared_from_this(), gen](beast::error_code ec, std::size_t bytes) {
            self->on_write(gen, ec, bytes);
        });
}

void SignalingClient::on_write(uint64_t gen, beast::error_code ec, std::size_t /*bytes*/) {
    if (gen != generation_) {
        return;
    }
    if (ec) {
        return fail(gen, ec, "write");
    }

    write_queue_.pop_front();
    do_write(gen);
}

void SignalingClient::close() {
    if (!ws_ || closing_) {
        return;
    }
    closing_ = true;

    if (!open_) {
        ++generation_;
        beast::error_code ec;
        beast::get_lowest_layer(*ws_).socket().close(ec);
        if (on_close_) {
            on_close_(true);
        }
        return;
    }

    uint64_t gen = generation_;
    ws_->async_close(websocket::close_code::normal,
        [self = shared_from_this(), gen](beast::error_code ec) {
            if (ec) {
                LOG_DEBUG("[SignalingClient] Close: " << ec.message());
            }
            if (gen != self->generation_) {
                return;
            }
            ++self->generation_;
            self->open_ = false;
            if (self->on_close_) {
                self->on_close_(true);
            }
        });
}

void SignalingClient::fail(uint64_t gen, beast::error_code ec, const char* what) {
    if (gen != generation_) {
        return;
    }
    ++generation_;

    bool was_closing = closing_;
    open_ = false;
    writing_ = false;
    write_queue_.clear();

    if (ec == websocket::error::closed) {
        LOG_INFO("[SignalingClient] Connection closed by server");
    } else if (!was_closing) {
        LOG_WARN("[SignalingClient] " << what << " failed: " << ec.message());
    }

    if (on_close_) {
        on_close_(was_closing);
    }
}

} // namespace telelink::client
