#include <csignal>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include "config.hpp"
#include "logger.hpp"
#include "message_store.hpp"
#include "tool_adapter.hpp"
#include "mcp_endpoint.hpp"
#include "api_router.hpp"
#include "server.hpp"

// usage: agent_relay [config.json]
int main(int argc, char** argv) {
    RelayConfig cfg;
    try {
        std::string config_path;
        if (argc > 1) config_path = argv[1];
        else if (const char* env_cfg = std::getenv("AGENT_RELAY_CONFIG")) config_path = env_cfg;
        cfg = load_config(config_path);
    } catch (const ConfigError& ex) {
        Logger::instance().error("Configuration error", { {"what", ex.what()} });
        return 2;
    }

    try {
        Logger::instance().init(cfg.log_path, cfg.log_level, cfg.log_max_bytes, cfg.log_backup_count, cfg.service_name);
        Logger::instance().info("Logger initialized", { {"config", config_to_json(cfg)} });

        MessageStore store(cfg.channels, cfg.max_messages_per_channel);
        store.set_post_observer(log_posted_message);
        ToolAdapter tools(store);
        McpEndpoint mcp(tools);
        ApiRouter router(store, mcp, cfg.mcp_path);

        boost::asio::io_context ioc;
        Server server(ioc, cfg.host, cfg.port, router);
        server.run_accept();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) return;
            Logger::instance().info("Signal received, stopping", { {"signal", signal_number} });
            server.stop();
            ioc.stop();
        });

        size_t thread_count = cfg.io_threads;
        if (thread_count == 0) thread_count = std::thread::hardware_concurrency();
        if (thread_count < 2) thread_count = 2;

        std::vector<std::thread> io_threads;
        for (size_t thread_index = 0; thread_index < thread_count; ++thread_index) {
            io_threads.emplace_back([&ioc, thread_index](){
                try {
                    ioc.run();
                    Logger::instance().debug("Thread exit normally", {{"id", thread_index}});
                } catch (const std::exception& ex) {
                    Logger::instance().error("Thread exception", {{"id", thread_index}, {"what", ex.what()}});
                }
            });
        }
        Logger::instance().info("Server listening", { {"host", cfg.host}, {"port", server.port()},
                                                      {"mcp_path", cfg.mcp_path},
                                                      {"thread_count", static_cast<uint64_t>(thread_count)} });

        for (auto& thread_obj : io_threads) thread_obj.join();
        Logger::instance().info("All threads joined, exiting");
        Logger::instance().close();
    } catch (const std::exception& ex) {
        Logger::instance().error("Main thread exception caught", {{"what", ex.what()}});
        return 1;
    }
    return 0;
}
