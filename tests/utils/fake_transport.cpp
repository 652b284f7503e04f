#include "fake_transport.hpp"

#include <algorithm>
#include <thread>

namespace test_utils {

namespace {

// Sleeps in small steps; true when the exchange asked to abort meanwhile.
bool waitOrAbort(std::chrono::milliseconds duration, const http::TransportCallbacks& cb) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    do {
        if (cb.shouldAbort && cb.shouldAbort())
            return true;
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    } while (true);
}

struct InFlight {
    std::atomic<int>& counter;
    explicit InFlight(std::atomic<int>& c) : counter(c) { ++counter; }
    ~InFlight() { --counter; }
};

}  // namespace

void FakeTransport::setResponse(const std::string& url, FakeResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[url] = std::move(response);
}

void FakeTransport::setDefaultResponse(FakeResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_response_ = std::move(response);
}

std::vector<http::WireRequest> FakeTransport::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

FakeResponse FakeTransport::lookup(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = responses_.find(url);
    return it != responses_.end() ? it->second : default_response_;
}

http::TransportOutcome FakeTransport::perform(const http::WireRequest& request,
                                              const http::TransportCallbacks& caller_callbacks) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
    }
    ++calls_;
    InFlight guard(in_flight_);
    int current = in_flight_.load();
    int seen = max_in_flight_.load();
    while (current > seen && !max_in_flight_.compare_exchange_weak(seen, current)) {
    }

    const FakeResponse response = lookup(request.url);
    http::TransportOutcome outcome;

    http::TransportCallbacks callbacks = caller_callbacks;
    if (response.ignore_abort)
        callbacks.shouldAbort = nullptr;

    if (waitOrAbort(response.delay_before_head, callbacks)) {
        outcome.aborted = true;
        return outcome;
    }

    if (!response.error.empty()) {
        outcome.error = response.error;
        return outcome;
    }

    http::ResponseHead head;
    head.status_code = response.status_code;
    head.reason = response.reason;
    head.headers = response.headers;
    if (callbacks.onResponseHead)
        callbacks.onResponseHead(head);

    const std::size_t step = std::max<std::size_t>(1, response.write_size);
    for (std::size_t offset = 0; offset < response.body.size(); offset += step) {
        if (callbacks.shouldAbort && callbacks.shouldAbort()) {
            outcome.aborted = true;
            return outcome;
        }
        std::size_t n = std::min(step, response.body.size() - offset);
        if (callbacks.onData && !callbacks.onData(std::string_view(response.body).substr(offset, n))) {
            outcome.aborted = true;
            return outcome;
        }
        if (response.delay_per_write.count() > 0 && waitOrAbort(response.delay_per_write, callbacks)) {
            outcome.aborted = true;
            return outcome;
        }
    }

    if (response.hang_after_body) {
        // Bounded so a broken test cannot wedge the suite
        if (waitOrAbort(std::chrono::seconds(10), callbacks)) {
            outcome.aborted = true;
            return outcome;
        }
        outcome.error = "fake transport hang expired";
        return outcome;
    }

    outcome.ok = true;
    return outcome;
}

std::string makeBody(std::size_t bytes) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::string body(bytes, 'x');
    for (std::size_t i = 0; i < bytes; ++i)
        body[i] = alphabet[i % (sizeof(alphabet) - 1)];
    return body;
}

FakeResponse jsonResponse(const std::string& body, int status) {
    FakeResponse r;
    r.status_code = status;
    r.reason = status == 200 ? "OK" : "Error";
    r.headers = {{"Content-Type", "application/json; charset=utf-8"}};
    r.body = body;
    return r;
}

}  // namespace test_utils
