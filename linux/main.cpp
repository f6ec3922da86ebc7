#include "bluez.hpp"
#include "event_loop.hpp"

#include <protocol/packets.hpp>
#include <protocol/parse.hpp>
#include <session/connection_session.hpp>
#include <session/registry.hpp>
#include <session/scan_session.hpp>

#include <signal.h>

#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

using namespace probelink;

// Global state (for signal handling)
static loop::EventLoop g_loop;

// Signal handler
static void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    g_loop.quit();
}

static void install_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
}

static std::optional<int> parse_seconds(const char* arg) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(arg, arg + strlen(arg), value);
    if (ec != std::errc() || *ptr != '\0' || value <= 0) {
        return std::nullopt;
    }
    return value;
}

static std::string to_hex(std::span<const uint8_t> data) {
    std::string result;
    char buf[4];
    for (uint8_t byte : data) {
        snprintf(buf, sizeof(buf), "%02x", byte);
        result += buf;
    }
    return result;
}

static void print_error(const char* what, const Error& error) {
    std::cerr << what << " failed (" << to_string(error.kind) << "): " << error.message << std::endl;
}

// Bring up BlueZ and hook its bus into the event loop
static bool init_transport(bluez::GattTransport& transport) {
    auto status = transport.initialize();
    if (!status) {
        print_error("Bluetooth initialization", status.error());
        return false;
    }
    g_loop.watch(transport.get_fd(), [&transport](short) {
        transport.process_pending();
    });
    return true;
}

static void print_device(const DeviceRecord& device) {
    auto band = proximity(device);
    std::cout << format_device(device)
              << "  " << device.signal_strength << " dBm " << band.label
              << " [" << to_string(band.severity) << "]";
    if (device.parsed_identity) {
        const auto& identity = *device.parsed_identity;
        std::cout << "  " << identity.probe_name()
                  << " serial=" << identity.serial_number
                  << " battery=" << static_cast<int>(identity.battery_state_of_charge) << "%";
    } else {
        std::cout << "  " << probe_label(device);
    }
    std::cout << std::endl;
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static int cmd_scan(std::optional<int> seconds) {
    install_signal_handlers();

    bluez::GattTransport transport;
    if (!init_transport(transport)) return 1;

    DeviceRegistry registry;
    ScanSession scan(transport, g_loop, registry);

    ScanOptions options;
    if (seconds) {
        options.duration = std::chrono::seconds(*seconds);
    }

    ScanCallbacks callbacks;
    callbacks.on_device = [](const ScanEvent& event) {
        if (event.decode_error) {
            std::cerr << "scan: " << event.device.id << ": " << event.decode_error->message << std::endl;
        }
        print_device(event.device);
    };
    callbacks.on_stopped = []() {
        g_loop.quit();
    };

    std::cout << "Scanning for probes..." << std::endl;
    auto status = scan.start(options, std::move(callbacks));
    if (!status) {
        print_error("Scan", status.error());
        g_loop.unwatch(transport.get_fd());
        return 1;
    }

    g_loop.run();

    if (auto stopped = scan.stop(); !stopped) {
        print_error("Stop scan", stopped.error());
    }
    g_loop.unwatch(transport.get_fd());

    auto devices = registry.list();
    std::cout << "\nFound " << devices.size() << " probe(s)" << std::endl;
    for (const auto& device : devices) {
        print_device(device);
    }
    return 0;
}

// Connect to id, run action, disconnect. action returns the exit code.
static int with_session(const std::string& id,
                        const std::function<int(ConnectionSession&)>& action) {
    install_signal_handlers();

    bluez::GattTransport transport;
    if (!init_transport(transport)) return 1;

    SessionCallbacks callbacks;
    callbacks.on_state_changed = [](ConnectionState state) {
        if (state == ConnectionState::Disconnected) {
            g_loop.quit();
        }
    };
    // Errors end the command
    callbacks.on_error = [](const Error& error) {
        print_error("Probe", error);
        g_loop.quit();
    };

    ConnectionSession session(transport, g_loop, id, std::move(callbacks));
    auto status = session.connect();
    if (!status) {
        print_error("Connect", status.error());
        g_loop.unwatch(transport.get_fd());
        return 1;
    }

    int ret = action(session);

    if (auto dropped = session.disconnect(); !dropped) {
        print_error("Disconnect", dropped.error());
    }
    g_loop.unwatch(transport.get_fd());
    return ret;
}

static int cmd_services(const std::string& id) {
    return with_session(id, [](ConnectionSession& session) {
        auto services = session.list_interaction_points();
        if (!services) {
            print_error("List services", services.error());
            return 1;
        }
        for (const auto& [service, characteristics] : *services) {
            std::cout << service << std::endl;
            for (const auto& characteristic : characteristics) {
                std::cout << "  " << characteristic << std::endl;
            }
        }
        return 0;
    });
}

static int cmd_battery(const std::string& id) {
    return with_session(id, [](ConnectionSession& session) {
        auto level = session.read_status();
        if (!level) {
            print_error("Read battery", level.error());
            return 1;
        }
        std::cout << "Battery: " << static_cast<int>(*level) << "% ("
                  << to_string(battery_band(*level)) << ")" << std::endl;
        return 0;
    });
}

static int cmd_beep(const std::string& id) {
    return with_session(id, [](ConnectionSession& session) {
        auto status = session.beep();
        if (!status) {
            print_error("Beep", status.error());
            return 1;
        }
        std::cout << "Beep sent" << std::endl;
        return 0;
    });
}

static int cmd_serial(const std::string& id) {
    constexpr auto reply_timeout = std::chrono::seconds(5);

    return with_session(id, [reply_timeout](ConnectionSession& session) {
        bool answered = false;
        auto status = session.request_serial_number([&answered](const AcknowledgmentFrame& frame) {
            std::cout << "Acknowledgment: type=" << frame.command_type
                      << " code=0x" << std::hex << static_cast<int>(frame.command_code) << std::dec
                      << " seq=" << frame.sequential_command_number
                      << " status=" << frame.command_status
                      << " data=" << to_hex(frame.payload) << std::endl;
            if (frame.payload.size() >= 4) {
                std::cout << "Serial number: "
                          << parse::format_serial_number(packets::read_u32_le(frame.payload, 0))
                          << std::endl;
            }
            answered = true;
            g_loop.quit();
        });
        if (!status) {
            print_error("Request serial number", status.error());
            return 1;
        }

        Timer timeout(&g_loop, g_loop.schedule(reply_timeout, []() { g_loop.quit(); }, false));
        g_loop.run();

        if (!answered) {
            std::cerr << "No acknowledgment received" << std::endl;
            return 1;
        }
        return 0;
    });
}

static int cmd_monitor(const std::string& id, std::optional<int> seconds) {
    PollOptions options;
    if (seconds) {
        options.interval = std::chrono::seconds(*seconds);
    }

    return with_session(id, [&options](ConnectionSession& session) {
        auto status = session.start_status_polling(options, [](uint8_t level) {
            std::cout << "Battery: " << static_cast<int>(level) << "% ("
                      << to_string(battery_band(level)) << ")" << std::endl;
        });
        if (!status) {
            print_error("Status polling", status.error());
            return 1;
        }

        std::cout << "Monitoring " << session.device_id() << ", Ctrl-C to stop" << std::endl;
        g_loop.run();

        // Polling stops itself on a failed read
        return session.state() == ConnectionState::Disconnected || !session.polling() ? 1 : 0;
    });
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  scan [seconds]             Discover nearby probes (default 5 s)\n"
              << "  services <id>              List services and characteristics\n"
              << "  battery <id>               Read the battery level\n"
              << "  beep <id>                  Make the probe beep\n"
              << "  serial <id>                Request the serial number\n"
              << "  monitor <id> [seconds]     Poll the battery level (default 5 s)\n"
              << "  help                       Show this help\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd == "scan") {
        std::optional<int> seconds;
        if (argc >= 3) {
            seconds = parse_seconds(argv[2]);
            if (!seconds) {
                std::cerr << "Invalid duration: " << argv[2] << std::endl;
                return 1;
            }
        }
        return cmd_scan(seconds);
    }

    if (cmd == "services" || cmd == "battery" || cmd == "beep" ||
        cmd == "serial" || cmd == "monitor") {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " " << cmd << " <id>\n";
            return 1;
        }
        std::string id = argv[2];

        if (cmd == "services") return cmd_services(id);
        if (cmd == "battery") return cmd_battery(id);
        if (cmd == "beep") return cmd_beep(id);
        if (cmd == "serial") return cmd_serial(id);

        std::optional<int> seconds;
        if (argc >= 4) {
            seconds = parse_seconds(argv[3]);
            if (!seconds) {
                std::cerr << "Invalid interval: " << argv[3] << std::endl;
                return 1;
            }
        }
        return cmd_monitor(id, seconds);
    }

    std::cerr << "Unknown command: " << cmd << std::endl;
    print_usage(argv[0]);
    return 1;
}
