// tests/test_helpers.h
#ifndef CANVASFLOW_TESTS_TEST_HELPERS_H
#define CANVASFLOW_TESTS_TEST_HELPERS_H

#include "core/types/graph.h"
#include "core/types/execution.h"
#include "modules/dispatch/generation_dispatcher.h"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace canvasflow::testing {

inline Block make_block(const std::string& id, const std::string& number,
                        const std::string& prompt = "", BlockKind kind = BlockKind::TEXT) {
    Block block;
    block.id = id;
    block.number = number;
    block.kind = kind;
    block.prompt_template = prompt;
    return block;
}

inline Connection connect(const std::string& from, const std::string& to, std::string id = "") {
    if (id.empty()) id = from + "->" + to;
    return Connection{id, from, to};
}

// outline(A01) -> draft(A02), cover(B01) -> summary(A03)
inline Graph fan_out_graph() {
    Graph graph;
    graph.blocks = {
        make_block("outline", "A01", "Outline a story"),
        make_block("draft", "A02", "Expand [A01]"),
        make_block("cover", "B01", "Illustrate {A01}", BlockKind::IMAGE),
        make_block("summary", "A03", "Summarize [A02] with cover [B01]")
    };
    graph.connections = {
        connect("outline", "draft", "c1"),
        connect("outline", "cover", "c2"),
        connect("draft", "summary", "c3"),
        connect("cover", "summary", "c4")
    };
    return graph;
}

// b1(A01) -> b2(A02) -> ... -> bn
inline Graph chain_graph(size_t n) {
    Graph graph;
    for (size_t i = 1; i <= n; ++i) {
        std::string number = (i < 10 ? "A0" : "A") + std::to_string(i);
        std::string prompt = i == 1 ? "Start" : "Continue [A0" + std::to_string(i - 1) + "]";
        if (i > 10) prompt = "Continue";
        graph.blocks.push_back(make_block("b" + std::to_string(i), number, prompt));
        if (i > 1) {
            graph.connections.push_back(connect("b" + std::to_string(i - 1), "b" + std::to_string(i)));
        }
    }
    return graph;
}

// One-shot rendezvous: the dispatcher thread parks in wait() until release()
class Gate {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
    }
    bool wait_entered(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }
    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool released_ = false;
};

struct Script {
    int failures_before_success = 0; // throw this many times first
    bool always_fail = false;
    int delay_ms = 0;
    std::string error = "boom";
    Gate* gate = nullptr;
    std::string output; // replaces "<NUMBER>" when set
};

// Answers "<NUMBER>" for every block unless scripted otherwise, and records
// every request it sees.
class ScriptedDispatcher : public GenerationDispatcher {
public:
    void script(const BlockNumber& number, Script s) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[number] = s;
    }

    std::string generate(const GenerationRequest& request, const ExecutionOptions&) override {
        Script s;
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(request);
            attempt = ++attempts_[request.block_number];
            auto it = scripts_.find(request.block_number);
            if (it != scripts_.end()) s = it->second;
            in_flight_++;
            max_in_flight_ = std::max(max_in_flight_, in_flight_);
        }
        auto leave = [this] {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_--;
        };

        if (s.gate) s.gate->wait();
        if (s.delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(s.delay_ms));

        if (s.always_fail || attempt <= s.failures_before_success) {
            leave();
            throw std::runtime_error(s.error);
        }
        leave();
        if (!s.output.empty()) return s.output;
        return "<" + request.block_number + ">";
    }

    std::vector<GenerationRequest> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    int attempts(const BlockNumber& number) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = attempts_.find(number);
        return it == attempts_.end() ? 0 : it->second;
    }

    std::string prompt_of(const BlockNumber& number) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = calls_.rbegin(); it != calls_.rend(); ++it) {
            if (it->block_number == number) return it->prompt;
        }
        return {};
    }

    int max_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_in_flight_;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<BlockNumber, Script> scripts_;
    std::unordered_map<BlockNumber, int> attempts_;
    std::vector<GenerationRequest> calls_;
    int in_flight_ = 0;
    int max_in_flight_ = 0;
};

// Polls until `pred` holds or the timeout expires
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

inline const BlockResult* find_result(const ExecutionResult& result, const BlockNumber& number) {
    for (const auto& r : result.results) {
        if (r.block_number == number) return &r;
    }
    return nullptr;
}

} // namespace canvasflow::testing

#endif // CANVASFLOW_TESTS_TEST_HELPERS_H
