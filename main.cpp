#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <CLI/CLI.hpp>
#include "config.hpp"
#include "logger.hpp"
#include "network_utils.hpp"
#include "crypto/crypto.hpp"
#include "tunnels/tunnel.hpp"
#include "tunnels/ship_multiplexer.hpp"
#include "tunnels/offshore_demultiplexer.hpp"

namespace
{
    Tunnel *g_tunnel = nullptr;

    void handle_signal(int)
    {
        if (g_tunnel)
            g_tunnel->stop();
    }

    struct Config
    {
        std::string key;
        std::string crypto = "none";
        std::string log_level = "info";
        ShipOptions ship;
        OffshoreOptions offshore;
    };

    // host:port or a bare port; a bare port keeps the current host.
    std::function<void(const std::string &)> address_setter(std::string &host, uint16_t &port, bool host_required)
    {
        return [&host, &port, host_required](const std::string &val)
        {
            std::string parsed_host = host;
            uint16_t parsed_port = 0;
            if (!parse_host_port(val, parsed_host, parsed_port))
                throw CLI::ValidationError("Address must be [host:]port with a port in 1-65535: " + val);
            if (host_required && val.find(':') == std::string::npos)
                throw CLI::ValidationError("Address must be specified as host:port: " + val);
            host = parsed_host;
            port = parsed_port;
        };
    }
}

int main(int argc, char *argv[])
{
    CLI::App app{"Tiny Ship Proxy - HTTP/HTTPS forwarding proxy multiplexed over one link"};

    app.set_version_flag("-v,--version", "1.0.0");

    Config config;

    auto ship = app.add_subcommand("ship", "Run as ship (accepts local proxy clients and multiplexes them to offshore)");
    auto offshore = app.add_subcommand("offshore", "Run as offshore (accepts the ship link and connects to targets)");

    // Ship-specific options
    ship->add_option_function<std::string>("-l,--local",
                                           address_setter(config.ship.listen_host, config.ship.listen_port, false),
                                           "Local proxy listen address (host:port or port)");

    ship->add_option_function<std::string>("-r,--remote",
                                           address_setter(config.ship.offshore_host, config.ship.offshore_port, true),
                                           "Offshore address (host:port)");

    ship->add_option("--reconnect-attempts", config.ship.reconnect_attempts,
                     "Link reconnect attempts before giving up (0 = forever)")
        ->check(CLI::NonNegativeNumber);

    ship->add_option("--connect-timeout", config.ship.link_connect_timeout_ms, "Link connect timeout in ms")
        ->check(CLI::PositiveNumber);

    ship->add_option("--open-timeout", config.ship.open_timeout_ms, "Time allowed for offshore to open a session, in ms")
        ->check(CLI::PositiveNumber);

    // Offshore-specific options
    offshore->add_option_function<std::string>("-l,--local",
                                               address_setter(config.offshore.listen_host, config.offshore.listen_port, false),
                                               "Link listen address (host:port or port)");

    offshore->add_option("--connect-timeout", config.offshore.connect_timeout_ms, "Target connect timeout in ms")
        ->check(CLI::PositiveNumber);

    offshore->add_option("--idle-timeout", config.offshore.response_idle_timeout_ms,
                         "Response idle timeout in ms")
        ->check(CLI::PositiveNumber);

    offshore->add_option("--resolver-threads", config.offshore.resolver_threads, "Name resolution threads")
        ->check(CLI::Range(1, 64));

    // Common options
    app.add_option("-c,--crypto", config.crypto, "Link cipher")
        ->check(CLI::IsMember({"none", "xor", "aes"}));

    app.add_option("-k,--key", config.key, "Link cipher key");

    app.add_option("--log-level", config.log_level, "Log level")
        ->check(CLI::IsMember({"debug", "info", "warning", "error"}));

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try
    {
        set_log_level(parse_log_level(config.log_level));

        if (config.crypto != "none" && config.key.empty())
        {
            throw std::runtime_error("--key is required with --crypto " + config.crypto);
        }
        std::shared_ptr<Crypto> crypto = create_crypto(config.crypto, config.key);

        std::unique_ptr<Tunnel> tunnel;

        if (ship->parsed())
        {
            tunnel = std::make_unique<ShipMultiplexer>(config.ship, crypto);
        }
        else if (offshore->parsed())
        {
            tunnel = std::make_unique<OffshoreDemultiplexer>(config.offshore, crypto);
        }
        else
        {
            throw std::runtime_error("Unknown mode");
        }

        g_tunnel = tunnel.get();
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        std::signal(SIGPIPE, SIG_IGN);

        tunnel->run();
        g_tunnel = nullptr;
        LOG_INFO(tunnel->is_running() ? "Event loop exited" : "Stopped on request", " (link ",
                 to_string(tunnel->link_state()), ", ", tunnel->session_count(), " session(s) left)");
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
