/// @file sse_client.cpp
/// @brief Server-Sent Events command-line client
///
/// Connects to an event stream, prints every event it receives and keeps
/// reconnecting until it is stopped, a limit is reached, or Ctrl+C.
///
/// Usage: ./sse_client [options] [url]
/// Default: http://localhost:8080/events
///
/// Features demonstrated:
/// - event_source with primary handlers and typed listeners
/// - Automatic reconnection and Last-Event-ID resumption
/// - Heartbeat watchdog and retry configuration
/// - Credentials and extra request headers

#include <eventline/eventline.hpp>

#include <charconv>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace eventline;

namespace {

runtime::event_loop* g_loop = nullptr;

void handle_interrupt(int) {
    if (g_loop) {
        g_loop->stop();
    }
}

struct options {
    std::string url = "http://localhost:8080/events";
    sse::client_config client;
    sse::http_transport_config transport;
    std::optional<long> max_events;
    std::optional<long> duration_s;
    std::vector<std::string> event_types;
    bool verbose = false;
};

std::optional<long> parse_number(std::string_view text) {
    long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [url]\n"
              << "\n"
              << "Options:\n"
              << "  --header 'Name: value'  Add a request header (repeatable)\n"
              << "  --with-credentials      Send URL credentials and --cookie\n"
              << "  --cookie <value>        Cookie header sent with credentials\n"
              << "  --last-event-id <id>    Resume from this event id\n"
              << "  --event <type>          Also print events of this type (repeatable)\n"
              << "  --heartbeat <ms>        Inactivity timeout (default 45000)\n"
              << "  --retry <ms>            Initial reconnect delay (default 1000)\n"
              << "  --max-events <n>        Exit after n events\n"
              << "  --duration <seconds>    Exit after this long\n"
              << "  --insecure              Skip TLS certificate verification\n"
              << "  --verbose               Log connection details\n"
              << "  --help                  Show this help\n"
              << "\n"
              << "Default URL: http://localhost:8080/events\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " http://localhost:8080/events\n"
              << "  " << program << " --max-events 10 --header 'Authorization: Bearer t' https://example.com/sse\n";
}

/// @return Parsed options, or nullopt after printing a diagnostic
std::optional<options> parse_args(int argc, char* argv[], bool& show_help) {
    options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                EVENTLINE_LOG_ERROR("{} needs a value", arg);
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };
        auto number = [&]() -> std::optional<long> {
            auto v = value();
            if (!v) return std::nullopt;
            auto n = parse_number(*v);
            if (!n) EVENTLINE_LOG_ERROR("{} expects a non-negative number, got '{}'", arg, *v);
            return n;
        };

        if (arg == "--help" || arg == "-h") {
            show_help = true;
            return opts;
        } else if (arg == "--header" || arg == "-H") {
            auto v = value();
            if (!v) return std::nullopt;
            auto colon = v->find(':');
            if (colon == std::string_view::npos || colon == 0) {
                EVENTLINE_LOG_ERROR("Malformed header '{}', expected 'Name: value'", *v);
                return std::nullopt;
            }
            opts.client.headers.add(http::trim(v->substr(0, colon)), http::trim(v->substr(colon + 1)));
        } else if (arg == "--with-credentials") {
            opts.client.with_credentials = true;
        } else if (arg == "--cookie") {
            auto v = value();
            if (!v) return std::nullopt;
            opts.transport.cookie = std::string(*v);
        } else if (arg == "--last-event-id") {
            auto v = value();
            if (!v) return std::nullopt;
            opts.client.last_event_id = std::string(*v);
        } else if (arg == "--event" || arg == "-e") {
            auto v = value();
            if (!v) return std::nullopt;
            opts.event_types.emplace_back(*v);
        } else if (arg == "--heartbeat") {
            auto n = number();
            if (!n) return std::nullopt;
            opts.client.heartbeat_timeout = std::chrono::milliseconds(*n);
        } else if (arg == "--retry") {
            auto n = number();
            if (!n) return std::nullopt;
            opts.client.initial_retry = std::chrono::milliseconds(*n);
        } else if (arg == "--max-events") {
            opts.max_events = number();
            if (!opts.max_events) return std::nullopt;
        } else if (arg == "--duration") {
            opts.duration_s = number();
            if (!opts.duration_s) return std::nullopt;
        } else if (arg == "--insecure" || arg == "-k") {
            opts.transport.verify_certificate = false;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] != '-') {
            opts.url = std::string(arg);
        } else {
            EVENTLINE_LOG_ERROR("Unknown option {}", arg);
            return std::nullopt;
        }
    }
    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    bool show_help = false;
    auto opts = parse_args(argc, argv, show_help);
    if (show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (!opts) {
        print_usage(argv[0]);
        return 2;
    }
    if (opts->verbose) {
        log::logger::instance().set_level(log::level::debug);
    }

    runtime::event_loop loop;
    g_loop = &loop;
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    std::optional<sse::event_source> source;
    try {
        source.emplace(loop, opts->url, opts->client, opts->transport);
    } catch (const std::exception& e) {
        EVENTLINE_LOG_ERROR("Cannot connect to {}: {}", opts->url, e.what());
        return 1;
    }

    EVENTLINE_LOG_INFO("Connecting to {} (heartbeat {} ms, retry {} ms)", source->url(),
                       source->get_connection().heartbeat_timeout().count(),
                       source->get_connection().initial_retry().count());

    long received = 0;
    auto count = [&]() {
        if (opts->max_events && ++received >= *opts->max_events) {
            EVENTLINE_LOG_INFO("Received {} events, stopping", received);
            source->close();
            loop.stop();
        }
    };

    source->on_open([&](const sse::event& ev) {
        const auto& status = std::get<sse::open_event>(ev).response;
        EVENTLINE_LOG_INFO("Connected: {} {}", status.status, status.status_text);
        if (opts->verbose) {
            for (const auto& [name, value] : status.headers) {
                EVENTLINE_LOG_INFO("  {}: {}", name, value);
            }
        }
    });

    source->on_error([&](const sse::event& ev) {
        const auto& err = std::get<sse::error_event>(ev);
        if (err.response) {
            EVENTLINE_LOG_WARNING("Rejected response: {} {}", err.response->status, err.response->status_text);
        } else if (err.error) {
            EVENTLINE_LOG_WARNING("Connection error: {}", err.error->message);
        } else if (opts->verbose) {
            EVENTLINE_LOG_INFO("Stream ended, reconnecting in {} ms",
                               source->get_connection().retry_interval().count());
        }
        if (source->state() == sse::ready_state::closed) {
            loop.stop();
        }
    });

    source->on_message([&](const sse::event& ev) {
        const auto& msg = std::get<sse::message_event>(ev);
        EVENTLINE_LOG_INFO("[message] id={} data={}",
                           msg.last_event_id.empty() ? "(none)" : msg.last_event_id, msg.data);
        count();
    });

    // Named event types only reach listeners registered for them
    for (const auto& type : opts->event_types) {
        source->add_event_listener(type, [&](const sse::event& ev) {
            const auto& msg = std::get<sse::message_event>(ev);
            EVENTLINE_LOG_INFO("[{}] id={} data={}", msg.type,
                               msg.last_event_id.empty() ? "(none)" : msg.last_event_id, msg.data);
            count();
        });
    }

    if (opts->duration_s) {
        loop.schedule_after(std::chrono::seconds(*opts->duration_s), [&]() {
            EVENTLINE_LOG_INFO("Duration elapsed, stopping");
            source->close();
            loop.stop();
        });
    }

    loop.run();

    EVENTLINE_LOG_INFO("Last event id: {}", source->last_event_id().empty() ? "(none)" : source->last_event_id());
    source.reset();
    g_loop = nullptr;
    return 0;
}
