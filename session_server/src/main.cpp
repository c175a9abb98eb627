/**
 * @file main.cpp
 * @brief 会话服务主程序入口
 */

#include "session_server/analysis_client.hpp"
#include "session_server/config.hpp"
#include "session_server/http_client.hpp"
#include "session_server/result_sink.hpp"
#include "session_server/session_registry.hpp"
#include "session_server/session_sweeper.hpp"
#include "session_server/signaling_relay.hpp"
#include "session_server/signaling_server.hpp"
#include "session_server/telemetry_pipeline.hpp"
#include "session_server/telemetry_server.hpp"
#include "session_core/logger.hpp"

#include <google/protobuf/stubs/common.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

namespace net = boost::asio;
using namespace telelink;

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    // 配置文件路径
    std::string config_path = "/etc/telelink/session_server.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    // 加载配置
    server::Config config;
    if (!config.load_from_file(config_path)) {
        LOG_WARN("Failed to load config from: " << config_path << ", using defaults");
    }
    config.load_from_env();
    core::set_log_level(core::parse_log_level(config.logging.level));

    LOG_INFO("=== telelink session server ===");
    LOG_INFO("Config: " << config_path);
    LOG_INFO("Signaling: " << config.server.host << ":" << config.server.signaling_port);
    LOG_INFO("Telemetry: " << config.server.host << ":" << config.server.telemetry_port);

    server::http_global_init();

    try {
        net::io_context io_context;

        // 分析与持久化调用在独立线程池中执行
        net::thread_pool analysis_pool(static_cast<std::size_t>(std::max(1, config.telemetry.analysis_threads)));

        server::SessionRegistry registry(config.session.ice_buffer_capacity);

        server::SignalingRelay::Options relay_options;
        relay_options.reconnect_grace = std::chrono::milliseconds(config.session.reconnect_grace_ms);
        relay_options.eviction_grace = std::chrono::milliseconds(config.session.eviction_grace_ms);
        relay_options.outbox_capacity = config.session.outbox_capacity;
        relay_options.ice_servers = config.webrtc.ice_servers;
        server::SignalingRelay relay(registry, relay_options);

        server::HttpAnalysisClient analyzer(analysis_pool,
                                            config.telemetry.analysis_url,
                                            config.telemetry.service_token,
                                            config.telemetry.analysis_timeout_ms);
        server::HttpResultSink sink(analysis_pool,
                                    config.telemetry.persistence_url,
                                    config.telemetry.service_token);

        server::TelemetryPipeline::Options pipeline_options;
        pipeline_options.min_interval = std::chrono::milliseconds(config.telemetry.min_interval_ms);
        pipeline_options.analysis_timeout = std::chrono::milliseconds(config.telemetry.analysis_timeout_ms);
        server::TelemetryPipeline pipeline(registry, analyzer, io_context.get_executor(), pipeline_options);
        if (!config.telemetry.persistence_url.empty()) {
            pipeline.set_result_sink(&sink);
        }

        // 会话结束前取消进行中的分析
        relay.set_session_end_hook([&pipeline](server::Session& session) {
            pipeline.close_locked(session);
        });

        auto signaling = std::make_shared<server::SignalingServer>(io_context, config, relay);
        auto telemetry = std::make_shared<server::TelemetryServer>(io_context, config, registry, pipeline);

        if (!signaling->start() || !telemetry->start()) {
            LOG_ERROR("Failed to start listeners");
            signaling->stop();
            telemetry->stop();
            analysis_pool.join();
            server::http_global_cleanup();
            return 1;
        }

        server::SessionSweeper sweeper(relay, std::chrono::milliseconds(config.session.sweep_interval_ms));
        sweeper.start();

        // 信号处理
        net::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            LOG_INFO("Received signal " << signal << ", shutting down...");
            sweeper.stop();
            signaling->stop();
            telemetry->stop();
            io_context.stop();
        });

        // 运行 IO 上下文（多线程）
        unsigned thread_count = config.server.threads > 0
            ? static_cast<unsigned>(config.server.threads)
            : std::max(1u, std::thread::hardware_concurrency());
        std::vector<std::thread> threads;
        threads.reserve(thread_count - 1);

        for (auto i = 0u; i < thread_count - 1; ++i) {
            threads.emplace_back([&io_context]() {
                io_context.run();
            });
        }

        // 主线程也运行 IO
        io_context.run();

        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }

        sweeper.stop();
        analysis_pool.join();

    } catch (const std::exception& e) {
        LOG_ERROR("Error: " << e.what());
        server::http_global_cleanup();
        return 1;
    }

    server::http_global_cleanup();
    google::protobuf::ShutdownProtobufLibrary();

    LOG_INFO("Session server shutdown complete");
    return 0;
}
