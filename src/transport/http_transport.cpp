#include <cowgnition/transport/http_transport.hpp>

#include <httplib.h>

#include <atomic>
#include <iomanip>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace cowgnition {

namespace {

constexpr const char* kComponent = "http";
constexpr const char* kSessionHeader = "Mcp-Session-Id";
constexpr std::chrono::milliseconds kStopPollInterval{200};

std::string GenerateSessionId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << dis(gen)
        << std::setw(16) << dis(gen);
    return oss.str();
}

HttpExchange JsonStatus(int status, const std::string& message) {
    HttpExchange exchange;
    exchange.status = status;
    exchange.body = nlohmann::json{{"error", message}}.dump();
    return exchange;
}

bool IsInitializeRequest(const std::string& body) {
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return false;
    auto method = doc.find("method");
    return method != doc.end() && method->is_string() && *method == "initialize" &&
           doc.contains("id");
}

} // anonymous namespace

struct HttpTransport::Impl {
    using Clock = std::chrono::steady_clock;

    struct SessionEntry {
        std::shared_ptr<ConnectionServer> server;
        Clock::time_point last_used;
    };

    HttpTransportOptions options;
    ConnectionFactory factory;
    std::shared_ptr<Logger> logger;

    mutable std::mutex sessions_mutex;
    std::map<std::string, SessionEntry> sessions;

    std::atomic<int> bound_port{0};
    std::atomic<bool> listening{false};
    std::atomic<bool> stopping{false};

    // Looks up a session and marks it used.
    std::shared_ptr<ConnectionServer> FindSession(const std::string& id) {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        auto it = sessions.find(id);
        if (it == sessions.end()) return nullptr;
        it->second.last_used = Clock::now();
        return it->second.server;
    }

    // Adds a session unless the limit is reached.
    bool Reserve(const std::string& id, std::shared_ptr<ConnectionServer> server) {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        if (sessions.size() >= options.max_sessions) return false;
        sessions[id] = SessionEntry{std::move(server), Clock::now()};
        return true;
    }

    void Touch(const std::string& id) {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        auto it = sessions.find(id);
        if (it != sessions.end()) it->second.last_used = Clock::now();
    }

    void EraseSession(const std::string& id) {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        sessions.erase(id);
    }
};

HttpTransport::HttpTransport(HttpTransportOptions options, ConnectionFactory factory,
                             std::shared_ptr<Logger> logger)
    : impl_(std::make_unique<Impl>()) {
    impl_->options = std::move(options);
    impl_->factory = std::move(factory);
    impl_->logger = logger ? std::move(logger) : MakeNullLogger();
}

HttpTransport::~HttpTransport() = default;

std::size_t HttpTransport::SessionCount() const {
    std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
    return impl_->sessions.size();
}

int HttpTransport::BoundPort() const {
    return impl_->bound_port.load();
}

bool HttpTransport::IsListening() const {
    return impl_->listening.load();
}

HttpExchange HttpTransport::HandlePost(const std::string& session_id,
                                       const std::string& body) {
    if (impl_->stopping) {
        return JsonStatus(503, "Server is shutting down");
    }
    EvictIdle();

    std::string id = session_id;
    std::shared_ptr<ConnectionServer> server;
    bool created = false;

    if (id.empty()) {
        if (!IsInitializeRequest(body)) {
            return JsonStatus(400, std::string(kSessionHeader) + " header required");
        }
        server = std::shared_ptr<ConnectionServer>(impl_->factory());
        if (!server) {
            return JsonStatus(500, "Session could not be created");
        }
        id = GenerateSessionId();
        if (!impl_->Reserve(id, server)) {
            return JsonStatus(503, "Maximum sessions reached");
        }
        created = true;
    } else {
        server = impl_->FindSession(id);
        if (!server) {
            return JsonStatus(404, "Invalid or expired session");
        }
    }

    auto response = server->HandleMessage(body);

    if (created) {
        if (server->CurrentState() == ProtocolState::Uninitialized) {
            // initialize was rejected; release the slot.
            impl_->EraseSession(id);
            HttpExchange exchange;
            exchange.body = response.value_or("");
            return exchange;
        }
        impl_->logger->Info(kComponent, "Session " + id + " opened");
    }

    if (server->IsDone()) {
        impl_->EraseSession(id);
        impl_->logger->Info(kComponent, "Session " + id + " ended in state " +
                                            ToString(server->CurrentState()));
    } else {
        impl_->Touch(id);
    }

    HttpExchange exchange;
    exchange.session_id = id;
    if (response) {
        exchange.status = 200;
        exchange.body = std::move(*response);
    } else {
        exchange.status = 202;
        exchange.content_type.clear();
    }
    return exchange;
}

HttpExchange HttpTransport::HandleDelete(const std::string& session_id) {
    if (session_id.empty()) {
        return JsonStatus(400, std::string(kSessionHeader) + " header required");
    }
    std::shared_ptr<ConnectionServer> server;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        auto it = impl_->sessions.find(session_id);
        if (it == impl_->sessions.end()) {
            return JsonStatus(404, "Invalid or expired session");
        }
        server = std::move(it->second.server);
        impl_->sessions.erase(it);
    }
    server->Drain();
    impl_->logger->Info(kComponent, "Session " + session_id + " closed by client");

    HttpExchange exchange;
    exchange.status = 204;
    exchange.content_type.clear();
    return exchange;
}

std::size_t HttpTransport::EvictIdle() {
    const auto idle_timeout = impl_->options.session_idle_timeout;
    if (idle_timeout <= std::chrono::milliseconds::zero()) {
        return 0;
    }
    const auto cutoff = Impl::Clock::now() - idle_timeout;

    std::vector<std::pair<std::string, std::shared_ptr<ConnectionServer>>> evicted;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        for (auto it = impl_->sessions.begin(); it != impl_->sessions.end();) {
            const auto& entry = it->second;
            if (entry.last_used < cutoff && entry.server->ActiveRequests() == 0) {
                evicted.emplace_back(it->first, entry.server);
                it = impl_->sessions.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& [id, server] : evicted) {
        server->Drain();
        impl_->logger->Info(kComponent, "Session " + id + " expired after " +
                                            std::to_string(idle_timeout.count()) +
                                            " ms idle");
    }
    return evicted.size();
}

Result<void, Error> HttpTransport::Serve(const CancellationToken& token) {
    httplib::Server svr;
    svr.set_payload_max_length(impl_->options.max_payload_bytes);
    svr.set_read_timeout(30, 0);
    svr.set_write_timeout(30, 0);

    auto apply = [](const HttpExchange& exchange, httplib::Response& res) {
        res.status = exchange.status;
        if (!exchange.session_id.empty()) {
            res.set_header(kSessionHeader, exchange.session_id);
        }
        if (!exchange.body.empty()) {
            res.set_content(exchange.body, exchange.content_type.c_str());
        }
    };

    svr.Post(impl_->options.path,
             [this, apply](const httplib::Request& req, httplib::Response& res) {
                 apply(HandlePost(req.get_header_value(kSessionHeader), req.body), res);
             });
    svr.Delete(impl_->options.path,
               [this, apply](const httplib::Request& req, httplib::Response& res) {
                   apply(HandleDelete(req.get_header_value(kSessionHeader)), res);
               });
    svr.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(nlohmann::json{{"status", "ok"}}.dump(), "application/json");
    });

    const auto& host = impl_->options.host;
    int port = impl_->options.port;
    if (port == 0) {
        port = svr.bind_to_any_port(host);
        if (port < 0) {
            return Result<void, Error>::Err(Error{
                "HttpListen", "Cannot bind an ephemeral port on " + host,
                ErrorCategory::Transport});
        }
    } else if (!svr.bind_to_port(host, port)) {
        return Result<void, Error>::Err(Error{
            "HttpListen", "Cannot bind " + host + ":" + std::to_string(port),
            ErrorCategory::Transport});
    }
    impl_->bound_port = port;

    std::atomic<bool> listener_done{false};
    std::thread listener([&svr, &listener_done] {
        svr.listen_after_bind();
        listener_done = true;
    });
    while (!svr.is_running() && !listener_done) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    impl_->listening = svr.is_running();
    impl_->logger->Info(kComponent, "Listening on http://" + host + ":" +
                                        std::to_string(port) + impl_->options.path);

    while (!token.WaitFor(kStopPollInterval)) {
        if (listener_done) {
            break;
        }
        EvictIdle();
    }

    // Refuse new work, let accepted requests finish, then stop listening.
    impl_->stopping = true;
    svr.stop();

    std::map<std::string, Impl::SessionEntry> sessions;
    {
        std::lock_guard<std::mutex> lock(impl_->sessions_mutex);
        sessions.swap(impl_->sessions);
    }
    for (auto& [id, entry] : sessions) {
        entry.server->Drain();
    }
    listener.join();
    impl_->listening = false;
    impl_->logger->Info(kComponent, "HTTP transport stopped, " +
                                        std::to_string(sessions.size()) + " session(s) closed");

    if (!token.IsCancelled()) {
        return Result<void, Error>::Err(
            Error{"HttpListen", "HTTP server stopped unexpectedly", ErrorCategory::Transport});
    }
    return Result<void, Error>::Ok();
}

} // namespace cowgnition
