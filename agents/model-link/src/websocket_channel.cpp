#include "../include/websocket_channel.hpp"
#include "../include/link_state.hpp"
#include "../include/log.hpp"
#include "../include/text_util.hpp"
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/uri.hpp>
#include <boost/asio/ssl.hpp>
#include <condition_variable>
#include <deque>
#include <stdexcept>
#include <thread>

namespace {

using PlainClient = websocketpp::client<websocketpp::config::asio_client>;
using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;

const std::chrono::seconds kHandshakeTimeout{30};
const std::chrono::seconds kKeepalive{30};
const std::chrono::milliseconds kStopPoll{250};

void configure_tls(PlainClient&, const std::string&) {}

void configure_tls(TlsClient& client, const std::string& host) {
    client.set_tls_init_handler([host](websocketpp::connection_hdl) {
        namespace ssl = boost::asio::ssl;
        auto ctx = websocketpp::lib::make_shared<ssl::context>(ssl::context::tlsv12_client);
        ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3);
        ctx->set_default_verify_paths();
        ctx->set_verify_mode(ssl::verify_peer);
        ctx->set_verify_callback(ssl::host_name_verification(host));
        return ctx;
    });
}

template <typename Client>
class WebsocketChannel final : public LinkChannel {
public:
    WebsocketChannel() {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
        client_.set_user_agent("model-link/1.0");
        client_.set_open_handshake_timeout(std::chrono::milliseconds(kHandshakeTimeout).count());
    }

    ~WebsocketChannel() override {
        close("closing", std::chrono::milliseconds(1000));
        client_.stop();
        if (io_.joinable()) io_.join();
    }

    void open(const ConnectRequest& req, const CancellationSignal& stop) {
        websocketpp::uri uri(req.url);
        configure_tls(client_, uri.get_host());

        websocketpp::lib::error_code ec;
        typename Client::connection_ptr con = client_.get_connection(req.url, ec);
        if (ec) throw std::runtime_error("Invalid link URL: " + ec.message());
        for (const auto& h : req.headers) con->append_header(h.first, h.second);
        for (const auto& p : req.subprotocols) {
            con->add_subprotocol(p, ec);
            if (ec) throw std::runtime_error("Invalid sub-protocol: " + ec.message());
        }

        con->set_open_handler([this](websocketpp::connection_hdl) {
            std::lock_guard<std::mutex> lock(mtx_);
            phase_ = Phase::Open;
            last_traffic_ = LinkClock::now();
            cv_.notify_all();
        });
        con->set_fail_handler([this](websocketpp::connection_hdl h) {
            auto c = client_.get_con_from_hdl(h);
            std::string err = c->get_ec().message();
            if (c->get_response_code() != websocketpp::http::status_code::uninitialized) {
                err += " (HTTP " + std::to_string(static_cast<int>(c->get_response_code())) + ")";
            }
            std::lock_guard<std::mutex> lock(mtx_);
            phase_ = Phase::Closed;
            error_ = err;
            cv_.notify_all();
        });
        con->set_close_handler([this](websocketpp::connection_hdl h) {
            auto c = client_.get_con_from_hdl(h);
            CloseInfo info;
            websocketpp::close::status::value code = c->get_remote_close_code();
            if (code != websocketpp::close::status::no_status && code != websocketpp::close::status::abnormal_close) {
                info.code = static_cast<int>(code);
                info.reason = c->get_remote_close_reason();
            }
            std::lock_guard<std::mutex> lock(mtx_);
            phase_ = Phase::Closed;
            close_info_ = info;
            cv_.notify_all();
        });
        con->set_message_handler([this](websocketpp::connection_hdl, typename Client::message_ptr msg) {
            if (msg->get_opcode() != websocketpp::frame::opcode::text) return;
            std::lock_guard<std::mutex> lock(mtx_);
            inbox_.push_back(msg->get_payload());
            last_traffic_ = LinkClock::now();
            cv_.notify_all();
        });

        hdl_ = con->get_handle();
        client_.connect(con);
        io_ = std::thread([this] {
            try {
                client_.run();
            } catch (const std::exception& e) {
                log_error(std::string("Link I/O error: ") + e.what());
            }
            std::lock_guard<std::mutex> lock(mtx_);
            phase_ = Phase::Closed;
            cv_.notify_all();
        });

        auto deadline = LinkClock::now() + kHandshakeTimeout;
        std::unique_lock<std::mutex> lock(mtx_);
        while (phase_ == Phase::Connecting) {
            if (stop.cancelled()) throw std::runtime_error("Connect cancelled");
            if (LinkClock::now() >= deadline) throw std::runtime_error("Handshake timed out");
            cv_.wait_for(lock, kStopPoll);
        }
        if (phase_ != Phase::Open) throw std::runtime_error(error_.empty() ? "Connection closed during handshake" : error_);
    }

    bool send_text(const std::string& text) override {
        if (!is_open()) return false;
        websocketpp::lib::error_code ec;
        client_.send(hdl_, text, websocketpp::frame::opcode::text, ec);
        if (ec) {
            log_warn("Link send failed: " + ec.message());
            return false;
        }
        std::lock_guard<std::mutex> lock(mtx_);
        last_traffic_ = LinkClock::now();
        return true;
    }

    ReceiveStatus receive(std::string& out, std::chrono::milliseconds wait) override {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, wait, [this] { return !inbox_.empty() || phase_ != Phase::Open; });
        if (!inbox_.empty()) {
            out = std::move(inbox_.front());
            inbox_.pop_front();
            return ReceiveStatus::Message;
        }
        if (phase_ != Phase::Open) return ReceiveStatus::Closed;

        auto now = LinkClock::now();
        if (now - last_traffic_ < kKeepalive) return ReceiveStatus::Idle;
        last_traffic_ = now;
        lock.unlock();
        websocketpp::lib::error_code ec;
        client_.ping(hdl_, "", ec);
        if (ec) log_warn("Link ping failed: " + ec.message());
        return ReceiveStatus::Idle;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return phase_ == Phase::Open;
    }

    CloseInfo close_info() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return close_info_;
    }

    void close(const std::string& reason, std::chrono::milliseconds timeout) override {
        if (!is_open()) return;
        websocketpp::lib::error_code ec;
        client_.close(hdl_, websocketpp::close::status::normal, reason, ec);
        if (ec) {
            log_warn("Link close failed: " + ec.message());
            return;
        }
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return phase_ != Phase::Open; });
    }

private:
    enum class Phase { Connecting, Open, Closed };

    Client client_;
    websocketpp::connection_hdl hdl_;
    std::thread io_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    Phase phase_{Phase::Connecting};
    CloseInfo close_info_;
    std::string error_;
    LinkClock::time_point last_traffic_{};
};

template <typename Client>
std::shared_ptr<LinkChannel> open_channel(const ConnectRequest& req, const CancellationSignal& stop) {
    auto channel = std::make_shared<WebsocketChannel<Client>>();
    channel->open(req, stop);
    return channel;
}

}

std::shared_ptr<LinkChannel> WebsocketConnector::connect(const ConnectRequest& req, const CancellationSignal& stop) {
    if (starts_with_ci(req.url, "wss://")) return open_channel<TlsClient>(req, stop);
    return open_channel<PlainClient>(req, stop);
}
