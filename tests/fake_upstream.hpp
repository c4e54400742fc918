#pragma once

#include "upstream/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gateway_test {

inline gateway::FetchOutcome MakeOutcome(int status, const std::string& content_type, const std::string& body) {
    gateway::FetchOutcome out;
    out.status = status;
    if (!content_type.empty()) out.headers.emplace("Content-Type", content_type);
    out.body = body;
    return out;
}

// Scripted upstream: buffered sends pop queued outcomes, streams replay a
// fixed head and chunk list.
class FakeTransport : public gateway::IUpstreamTransport {
public:
    struct SendStep {
        std::optional<gateway::FetchOutcome> outcome;
        std::string error;
    };

    struct StreamScript {
        bool fail_before_head = false;
        gateway::ResponseHead head;
        std::vector<std::string> chunks;
        std::string error_after_chunks;
        // After the head and chunks, wait like a silent upstream until the
        // cancel hook fires.
        bool block_after_chunks = false;
    };

    FakeTransport() = default;
    explicit FakeTransport(gateway::TransportTimeouts timeouts) : timeouts_(timeouts) {}

    const gateway::TransportTimeouts& Timeouts() const {
        return timeouts_;
    }

    void QueueOutcome(gateway::FetchOutcome outcome) {
        std::lock_guard<std::mutex> lock(mu_);
        sends_.push_back(SendStep{std::move(outcome), {}});
    }

    void QueueTransportError(const std::string& error) {
        std::lock_guard<std::mutex> lock(mu_);
        sends_.push_back(SendStep{std::nullopt, error});
    }

    void SetStream(StreamScript script) {
        std::lock_guard<std::mutex> lock(mu_);
        stream_ = std::move(script);
    }

    std::optional<gateway::FetchOutcome> Send(const gateway::UpstreamRequest& req, std::string* err) override {
        std::lock_guard<std::mutex> lock(mu_);
        requests_.push_back(req);
        if (sends_.empty()) {
            if (err) *err = "no scripted response";
            return std::nullopt;
        }
        auto step = sends_.front();
        sends_.pop_front();
        if (!step.outcome && err) *err = step.error;
        return step.outcome;
    }

    bool Stream(const gateway::UpstreamRequest& req,
                const gateway::HeadHandler& on_head,
                const gateway::ChunkHandler& on_chunk,
                gateway::CancelToken* cancel,
                std::string* err) override {
        StreamScript script;
        {
            std::lock_guard<std::mutex> lock(mu_);
            requests_.push_back(req);
            script = stream_;
        }
        if (script.fail_before_head) {
            if (err) *err = script.error_after_chunks;
            return false;
        }
        if (!on_head(script.head)) return true;
        for (const auto& chunk : script.chunks) {
            if (!on_chunk(chunk.data(), chunk.size())) {
                std::lock_guard<std::mutex> lock(mu_);
                stream_cancelled_ = true;
                return true;
            }
            std::lock_guard<std::mutex> lock(mu_);
            chunks_delivered_++;
        }
        if (script.block_after_chunks) {
            auto fire = [this] {
                std::lock_guard<std::mutex> lock(mu_);
                hook_fired_ = true;
                hook_cv_.notify_all();
            };
            if (!cancel || !cancel->Bind(fire)) {
                fire();
                return true;
            }
            {
                std::unique_lock<std::mutex> lock(mu_);
                hook_cv_.wait(lock, [&] { return hook_fired_; });
            }
            cancel->Unbind();
            return true;
        }
        if (!script.error_after_chunks.empty()) {
            if (err) *err = script.error_after_chunks;
            return false;
        }
        return true;
    }

    bool CancelHookFired() const {
        std::lock_guard<std::mutex> lock(mu_);
        return hook_fired_;
    }

    size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_.size();
    }

    std::vector<gateway::UpstreamRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_;
    }

    size_t ChunksDelivered() const {
        std::lock_guard<std::mutex> lock(mu_);
        return chunks_delivered_;
    }

    bool StreamCancelled() const {
        std::lock_guard<std::mutex> lock(mu_);
        return stream_cancelled_;
    }

private:
    mutable std::mutex mu_;
    std::deque<SendStep> sends_;
    StreamScript stream_;
    std::vector<gateway::UpstreamRequest> requests_;
    size_t chunks_delivered_ = 0;
    bool stream_cancelled_ = false;
    bool hook_fired_ = false;
    std::condition_variable hook_cv_;
    gateway::TransportTimeouts timeouts_;
};

struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> delays;

    void operator()(std::chrono::milliseconds delay) {
        delays.push_back(delay);
    }
};

}  // namespace gateway_test
