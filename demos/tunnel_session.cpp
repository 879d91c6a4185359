// Tunnel Session Demo
//
// One relay endpoint and one client endpoint over a local socket pair:
// register -> http:request -> streamed response -> ping/pong -> close
//
// Usage:
//   ./tunnel_session [body_bytes] [--chunk-size N] [--skip-chunk N]
//
// Options:
//   body_bytes    - size of the streamed response body (default: 200000)
//   --chunk-size  - bytes per chunk, 1..65536 (default: 65536)
//   --skip-chunk  - client omits chunk N to show gap detection

#include "relay/config.hpp"
#include "relay/message_codec.hpp"
#include "relay/session_authority.hpp"
#include "relay/stream_assembler.hpp"
#include "relay/stream_chunker.hpp"
#include "relay/tunnel_registry.hpp"
#include "relay/validate_config.hpp"

#include <sys/socket.h>
#include <unistd.h>  // close()

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr std::size_t kRecvBufferSize = 256 * 1024;
constexpr std::int64_t kDemoLocalPort = 3000;

// Statistics
struct Stats {
    std::uint64_t sent = 0;
    std::uint64_t received = 0;
    std::uint64_t dropped = 0;
};

// Deterministic body so the relay can verify what it assembled
relay::Bytes make_body(std::size_t size) {
    relay::Bytes body(size);
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<std::byte>(i % 251);
    }
    return body;
}

bool send_message(int fd, const relay::Envelope& envelope, Stats& stats) {
    std::string frame = relay::serialize_message(envelope);
    ssize_t n = send(fd, frame.data(), frame.size(), MSG_NOSIGNAL);
    if (n < 0 || static_cast<std::size_t>(n) != frame.size()) {
        std::fprintf(stderr, "send %s failed: %s\n",
                     relay::to_string(envelope.type()), std::strerror(errno));
        return false;
    }
    ++stats.sent;
    return true;
}

// Blocks for the next well-formed message.
// std::nullopt when the peer has closed or the socket failed.
std::optional<relay::Envelope> recv_message(int fd, std::vector<char>& buffer, Stats& stats) {
    while (true) {
        iovec iov{.iov_base = buffer.data(), .iov_len = buffer.size()};
        msghdr msg{};
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;

        ssize_t n = recvmsg(fd, &msg, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::fprintf(stderr, "recv failed: %s\n", std::strerror(errno));
            return std::nullopt;
        }
        if (n == 0) {
            return std::nullopt;
        }
        if (msg.msg_flags & MSG_TRUNC) {
            ++stats.dropped;
            std::fprintf(stderr, "dropped truncated frame\n");
            continue;
        }

        auto result = relay::decode_message(std::string_view(buffer.data(), static_cast<std::size_t>(n)),
                                            relay::CodecLimits::kMaxInputBytes);
        if (const auto* reason = std::get_if<relay::MessageDropReason>(&result)) {
            ++stats.dropped;
            std::fprintf(stderr, "dropped frame: %s\n", relay::to_string(*reason));
            continue;
        }
        ++stats.received;
        return std::get<relay::Envelope>(std::move(result));
    }
}

// ============================================================================
// Client endpoint: owns the "local service" and answers relay requests
// ============================================================================

struct ClientOptions {
    std::string api_key;
    std::size_t body_bytes;
    std::size_t chunk_size;
    std::optional<std::uint64_t> skip_chunk;
};

void run_client(int fd, ClientOptions options) {
    Stats stats;
    std::vector<char> buffer(kRecvBufferSize);

    if (!send_message(fd, relay::make_tunnel_register(std::nullopt, kDemoLocalPort, options.api_key), stats)) {
        close(fd);
        return;
    }

    std::string tunnel_id;
    while (auto envelope = recv_message(fd, buffer, stats)) {
        if (const auto* registered = envelope->get_if<relay::TunnelRegistered>()) {
            tunnel_id = registered->tunnel_id;
            std::fprintf(stderr, "[client] tunnel %s live at %s -> localhost:%lld\n",
                         registered->tunnel_id.c_str(), registered->public_url.c_str(),
                         static_cast<long long>(kDemoLocalPort));

        } else if (const auto* error = envelope->get_if<relay::ErrorMessage>()) {
            std::fprintf(stderr, "[client] relay error %s: %s\n",
                         error->code.c_str(), error->error.c_str());
            break;

        } else if (const auto* request = envelope->get_if<relay::HttpRequest>()) {
            std::fprintf(stderr, "[client] %s %s (request %s)\n",
                         request->method.c_str(), request->path.c_str(),
                         request->request_id.c_str());

            relay::Bytes body = make_body(options.body_bytes);
            relay::Headers headers{
                {"content-type", "application/octet-stream"},
                {"content-length", std::to_string(body.size())},
            };
            if (!send_message(fd, relay::make_http_response_header(request->request_id, 200, headers), stats)) {
                break;
            }

            // Pull one chunk at a time; a full socket buffer blocks send()
            relay::StreamChunker chunker(body, options.chunk_size);
            bool ok = true;
            while (auto chunk = chunker.next()) {
                if (options.skip_chunk && *options.skip_chunk == chunk->index) {
                    continue;
                }
                auto message = relay::make_http_response_chunk(request->request_id, chunk->bytes, chunk->index);
                if (!send_message(fd, message, stats)) {
                    ok = false;
                    break;
                }
            }
            if (!ok || !send_message(fd, relay::make_http_response_end(request->request_id), stats)) {
                break;
            }

        } else if (const auto* ping = envelope->get_if<relay::Ping>()) {
            if (!send_message(fd, relay::make_pong(ping->timestamp), stats)) {
                break;
            }
            if (!send_message(fd, relay::make_tunnel_close(tunnel_id), stats)) {
                break;
            }

        } else if (const auto* closed = envelope->get_if<relay::TunnelClosed>()) {
            std::fprintf(stderr, "[client] tunnel %s closed: %s\n",
                         closed->tunnel_id.c_str(), closed->reason.c_str());
            break;

        } else {
            std::fprintf(stderr, "[client] ignoring %s\n", relay::to_string(envelope->type()));
        }
    }

    std::fprintf(stderr, "[client] sent %lu, received %lu, dropped %lu\n",
                 stats.sent, stats.received, stats.dropped);
    close(fd);
}

// ============================================================================
// Relay endpoint
// ============================================================================

void print_stats(const Stats& stats,
                 const relay::StreamAssembler& assembler,
                 const relay::TunnelRegistry& registry,
                 const relay::SessionAuthority& authority) {
    std::fprintf(stderr, "\n--- Relay stats ---\n");
    std::fprintf(stderr, "Sent:              %lu\n", stats.sent);
    std::fprintf(stderr, "Received:          %lu\n", stats.received);
    std::fprintf(stderr, "Dropped frames:    %lu\n", stats.dropped);
    std::fprintf(stderr, "Streams opened:    %lu\n", assembler.streams_opened());
    std::fprintf(stderr, "Streams completed: %lu\n", assembler.streams_completed());
    std::fprintf(stderr, "Violations:        %lu\n", assembler.violations());
    std::fprintf(stderr, "Registrations:     %lu (%lu rejected)\n",
                 registry.registrations(), registry.rejections());
    std::fprintf(stderr, "Open tunnels:      %zu\n", registry.tunnel_count());
    std::fprintf(stderr, "Active sessions:   %zu\n", authority.session_count());
    std::fprintf(stderr, "-------------------\n\n");
}

// Returns true if the streamed body arrived intact
bool run_relay(int fd,
               const relay::RelayConfig& config,
               relay::SessionAuthority& authority,
               std::size_t body_bytes) {
    Stats stats;
    std::vector<char> buffer(kRecvBufferSize);
    relay::TunnelRegistry registry(authority, config.tunnel);
    relay::StreamAssembler assembler(config.stream);

    const std::string request_id = "req-1";
    bool body_ok = false;

    while (auto envelope = recv_message(fd, buffer, stats)) {
        if (const auto* reg = envelope->get_if<relay::TunnelRegister>()) {
            auto result = registry.register_tunnel(*reg);
            if (const auto* error = std::get_if<relay::RegistrationError>(&result)) {
                std::fprintf(stderr, "[relay] registration refused: %s\n", relay::to_string(error->code));
                send_message(fd, relay::make_registration_error(*error), stats);
                break;
            }
            const auto& tunnel = std::get<relay::Tunnel>(result);
            std::fprintf(stderr, "[relay] registered %s as %s\n",
                         tunnel.tunnel_id.c_str(), tunnel.subdomain.c_str());
            if (!send_message(fd, relay::make_registered_message(tunnel), stats)) {
                break;
            }
            auto request = relay::make_http_request(request_id, "GET", "/download",
                                                    {{"host", tunnel.subdomain}}, std::nullopt);
            if (!send_message(fd, request, stats)) {
                break;
            }

        } else if (const auto* header = envelope->get_if<relay::HttpResponseHeader>()) {
            if (auto v = assembler.open(header->request_id, header->status_code, header->headers)) {
                std::fprintf(stderr, "[relay] %s\n", relay::to_string(*v));
            }

        } else if (const auto* chunk = envelope->get_if<relay::HttpResponseChunk>()) {
            if (auto v = assembler.accept_chunk(chunk->request_id, chunk->index, chunk->chunk)) {
                auto error = relay::make_violation_error(chunk->request_id, *v);
                std::fprintf(stderr, "[relay] chunk %lu rejected, answering: %s\n",
                             chunk->index, relay::serialize_message(error).c_str());
            }

        } else if (const auto* end = envelope->get_if<relay::HttpResponseEnd>()) {
            auto result = assembler.finish(end->request_id);
            if (const auto* v = std::get_if<relay::StreamViolation>(&result)) {
                std::fprintf(stderr, "[relay] end for %s rejected: %s\n",
                             end->request_id.c_str(), relay::to_string(*v));
            } else {
                const auto& response = std::get<relay::AssembledResponse>(result);
                body_ok = response.body == make_body(body_bytes);
                std::fprintf(stderr, "[relay] %s: status %lld, %zu bytes in %lu chunks (%s)\n",
                             response.request_id.c_str(),
                             static_cast<long long>(response.status_code),
                             response.body.size(), response.chunk_count,
                             body_ok ? "intact" : "CORRUPT");
            }
            if (!send_message(fd, relay::make_ping(), stats)) {
                break;
            }

        } else if (const auto* pong = envelope->get_if<relay::Pong>()) {
            std::fprintf(stderr, "[relay] pong (rtt %lld ms)\n",
                         static_cast<long long>(relay::current_time_ms() - pong->ping_timestamp));

        } else if (const auto* close_req = envelope->get_if<relay::TunnelClose>()) {
            if (auto closed = registry.close_tunnel(close_req->tunnel_id, close_req->reason)) {
                send_message(fd, *closed, stats);
            }
            break;

        } else {
            std::fprintf(stderr, "[relay] ignoring %s\n", relay::to_string(envelope->type()));
        }
    }

    print_stats(stats, assembler, registry, authority);
    return body_ok;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse arguments
    std::size_t body_bytes = 200000;
    relay::RelayConfig config = relay::kDefaultConfig;
    std::optional<std::uint64_t> skip_chunk;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--chunk-size") == 0 && i + 1 < argc) {
            config.stream.max_chunk_bytes = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--skip-chunk") == 0 && i + 1 < argc) {
            skip_chunk = std::strtoull(argv[++i], nullptr, 10);
        } else {
            body_bytes = std::strtoull(argv[i], nullptr, 10);
        }
    }

    if (auto issue = relay::validate_config(config)) {
        std::fprintf(stderr, "Invalid configuration: %s\n", relay::to_string(*issue));
        return EXIT_FAILURE;
    }

    int fds[2];
    if (socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds) != 0) {
        std::fprintf(stderr, "socketpair failed: %s\n", std::strerror(errno));
        return EXIT_FAILURE;
    }

    std::fprintf(stderr, "Streaming %zu bytes in chunks of %zu\n",
                 body_bytes, config.stream.max_chunk_bytes);

    std::optional<relay::SessionAuthority> authority;
    try {
        authority.emplace(config.auth);
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        close(fds[0]);
        close(fds[1]);
        return EXIT_FAILURE;
    }

    std::thread client(run_client, fds[1], ClientOptions{
        .api_key = authority->dev_key(),
        .body_bytes = body_bytes,
        .chunk_size = config.stream.max_chunk_bytes,
        .skip_chunk = skip_chunk,
    });

    bool ok = false;
    try {
        ok = run_relay(fds[0], config, *authority, body_bytes);
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
    }

    // Unblocks the client if the relay stopped early
    shutdown(fds[0], SHUT_RDWR);
    client.join();

    close(fds[0]);
    std::fprintf(stderr, ok ? "Session complete.\n" : "Session failed.\n");
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
