#include "../nimbridge.h"
#include "api_server.h"
#include "../thread_queue.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

using json = nlohmann::json;

namespace {

// Create OpenAI-compatible error response
json create_error_response(int status_code, const std::string& message) {
    std::string error_type;
    switch (status_code) {
        case 400:
            error_type = "invalid_request_error";
            break;
        case 413:
            error_type = "request_too_large";
            break;
        case 500:
            error_type = "server_error";
            break;
        default:
            error_type = "api_error";
    }

    return json{
        {"error", {
            {"message", message},
            {"type", error_type},
            {"code", status_code}
        }}
    };
}

/// Sink bridging a transcoder worker thread and the httplib connection.
/// The worker decides between a JSON reply and an event stream; frames of a
/// stream travel through a closable queue to the content provider.
class HttpSink : public ResponseSink {
public:
    enum Mode { PENDING, JSON_REPLY, STREAM };

    void send_json(int status, const json& body) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (mode != PENDING) {
            LOG_WARN("Response already committed, dropping JSON reply");
            return;
        }
        mode = JSON_REPLY;
        reply_status = status;
        reply_body = body.dump(-1, ' ', false, json::error_handler_t::replace);
        cv.notify_all();
    }

    bool begin_stream() override {
        std::lock_guard<std::mutex> lock(mutex);
        if (cancelled_) {
            return false;
        }
        mode = STREAM;
        cv.notify_all();
        return true;
    }

    bool write(const std::string& data) override {
        if (cancelled_) {
            return false;
        }
        return frames.push(data);
    }

    void close() override {
        frames.close();
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        cv.notify_all();
    }

    bool cancelled() const override {
        return cancelled_.load();
    }

    /// Client went away
    void cancel() {
        cancelled_ = true;
        frames.close();
    }

    /// Wait up to @p timeout for the worker to commit to a reply shape (or finish without one)
    /// @return false on timeout
    bool wait_for_decision(std::chrono::milliseconds timeout, Mode& decided) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_for(lock, timeout, [this] { return mode != PENDING || closed; })) {
            return false;
        }
        decided = mode;
        return true;
    }

    ThreadQueue<std::string> frames;
    int reply_status = 500;
    std::string reply_body;

private:
    std::mutex mutex;
    std::condition_variable cv;
    Mode mode = PENDING;
    bool closed = false;
    std::atomic<bool> cancelled_{false};
};

} // namespace

APIServer::APIServer(const Config& config, Upstream& upstream)
    : Server(config, "nimbridge"), transcoder(config, upstream) {
}

APIServer::~APIServer() {
}

void APIServer::add_status_info(json& status) {
    status["upstream"] = config.api_base;
    status["token_budget"] = config.token_budget;
}

void APIServer::register_endpoints() {
    // POST /v1/chat/completions - transcoded chat completions
    tcp_server.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
        handle_chat_completions(req, res);
    });

    // GET /v1/models - public model ids
    tcp_server.Get("/v1/models", [this](const httplib::Request&, httplib::Response& res) {
        json data = json::array();
        int64_t created = nimbridge::get_current_timestamp();
        for (const auto& id : config.public_models()) {
            data.push_back({
                {"id", id},
                {"object", "model"},
                {"created", created},
                {"owned_by", "nimbridge"}
            });
        }
        json response = {
            {"object", "list"},
            {"data", data}
        };
        res.set_content(response.dump(), "application/json");
    });
}

void APIServer::handle_chat_completions(const httplib::Request& req, httplib::Response& res) {
    requests_processed++;

    ChatRequest request;
    try {
        request = ChatRequest::from_json(json::parse(req.body));
    } catch (const json::parse_error&) {
        res.status = 400;
        res.set_content(create_error_response(400, "Invalid JSON").dump(), "application/json");
        return;
    } catch (const RequestError& e) {
        res.status = e.status;
        res.set_content(create_error_response(e.status, e.what()).dump(), "application/json");
        return;
    }

    auto sink = std::make_shared<HttpSink>();
    auto worker = std::make_shared<std::thread>([this, sink, request]() {
        try {
            transcoder.handle(request, *sink);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Exception in /v1/chat/completions: ") + e.what());
            sink->send_json(500, create_error_response(500, e.what()));
            sink->close();
        }
    });

    // The upstream may take a while before the first byte; watch the client meanwhile
    HttpSink::Mode mode = HttpSink::PENDING;
    while (!sink->wait_for_decision(std::chrono::seconds(1), mode)) {
        if (!sink->cancelled() && req.is_connection_closed()) {
            LOG_INFO("Client disconnected before the reply started, aborting upstream call");
            sink->cancel();
        }
    }

    if (mode != HttpSink::STREAM) {
        worker->join();
        res.status = sink->reply_status;
        if (sink->reply_body.empty()) {
            sink->reply_body = create_error_response(500, "No response produced").dump();
        }
        res.set_content(sink->reply_body, "application/json");
        return;
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");

    res.set_chunked_content_provider(
        "text/event-stream",
        [sink](size_t /*offset*/, httplib::DataSink& out) {
            // Poll so a silent client disconnect is noticed while the upstream is idle
            std::optional<std::string> frame;
            while (!(frame = sink->frames.wait_for_and_pop(std::chrono::seconds(1)))) {
                if (sink->frames.drained()) {
                    out.done();
                    return true;
                }
                if (!out.is_writable()) {
                    sink->cancel();
                    return false;
                }
            }
            if (!out.write(frame->data(), frame->size())) {
                sink->cancel();
                return false;
            }
            return true;
        },
        [sink, worker](bool success) {
            if (!success) {
                sink->cancel();
            }
            if (worker->joinable()) {
                worker->join();
            }
        });
}
