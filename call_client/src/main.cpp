/**
 * @file main.cpp
 * @brief 通话端主程序入口
 */

#include "call_client/call_session.hpp"
#include "call_client/config.hpp"
#include "session_core/logger.hpp"

#include <rtc/rtc.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <memory>

namespace net = boost::asio;
using namespace telelink;

int main(int argc, char* argv[]) {
    std::string config_path = "config/call_client.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    client::Config config;
    try {
        config = client::load_config(config_path);
    } catch (const std::exception& e) {
        LOG_WARN("Failed to load config from: " << config_path << " (" << e.what() << "), using defaults");
    }
    client::apply_env_overrides(config);
    core::set_log_level(core::parse_log_level(config.logging.level));

    auto config_error = client::validate_config(config);
    if (!config_error.empty()) {
        LOG_ERROR("Invalid config: " << config_error);
        return 1;
    }

    LOG_INFO("=== telelink call client ===");
    LOG_INFO("Participant: " << config.participant.id);
    LOG_INFO("Signaling: " << config.signaling.host << ":" << config.signaling.port);

    rtc::InitLogger(rtc::LogLevel::Warning);

    try {
        net::io_context io_context;

        net::signal_set signals(io_context, SIGINT, SIGTERM);

        auto call = std::make_shared<client::CallSession>(io_context, config);
        call->set_finished_handler([&signals]() {
            // 取消信号等待后，关闭握手完成即退出 run()
            boost::system::error_code ec;
            signals.cancel(ec);
        });

        signals.async_wait([call](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            LOG_INFO("Received signal " << signal << ", ending call...");
            call->end("ended_by_participant");
        });

        call->start();
        io_context.run();

    } catch (const std::exception& e) {
        LOG_ERROR("Error: " << e.what());
        return 1;
    }

    LOG_INFO("Call client exit");
    return 0;
}
