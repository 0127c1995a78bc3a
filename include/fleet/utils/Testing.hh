#pragma once

// Test doubles shared by the unit tests.

#include "fleet/core/Event.hh"
#include "fleet/core/Handler.hh"
#include "fleet/utils/ErrorHandling.hh"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fleet::Testing {

// Context key under which recording handlers append their names.
inline constexpr const char* kTraceKey = "trace";

inline void record(Event& event, const std::string& name) {
    event.context().update<std::vector<std::string>>(kTraceKey,
                                                     [&name](std::vector<std::string>& trace) { trace.push_back(name); });
}

inline std::vector<std::string> trace(const Event& event) {
    return event.context().getOr<std::vector<std::string>>(kTraceKey, {});
}

// Records its name, then reports the configured outcome.
class RecordingHandler : public Handler {
  public:
    explicit RecordingHandler(std::string name, bool succeed = true, std::string message = "")
        : name_(std::move(name)), succeed_(succeed), message_(std::move(message)) {}

    std::string getName() const override { return name_; }

    HandlerResult execute(Event& event) override {
        record(event, name_);
        return succeed_ ? HandlerResult::ok(message_) : HandlerResult::failure(message_);
    }

  private:
    std::string name_;
    bool succeed_;
    std::string message_;
};

// Records its name, then throws an exception of type E.
template <typename E = HandlerError> class ThrowingHandler : public Handler {
  public:
    ThrowingHandler(std::string name, std::string message) : name_(std::move(name)), message_(std::move(message)) {}

    std::string getName() const override { return name_; }

    HandlerResult execute(Event& event) override {
        record(event, name_);
        throw E(message_);
    }

  private:
    std::string name_;
    std::string message_;
};

// Records its name, then queues the handlers produced by `follow`.
class EnqueueingHandler : public Handler {
  public:
    using FollowFn = std::function<std::vector<std::unique_ptr<Handler>>()>;

    EnqueueingHandler(std::string name, FollowFn follow) : name_(std::move(name)), follow_(std::move(follow)) {}

    std::string getName() const override { return name_; }

    HandlerResult execute(Event& event) override {
        record(event, name_);
        for (auto& handler : follow_()) {
            event.enqueue(std::move(handler));
        }
        return HandlerResult::ok();
    }

  private:
    std::string name_;
    FollowFn follow_;
};

inline HandlerConstructor recording(const std::string& name, bool succeed = true, const std::string& message = "") {
    return [name, succeed, message]() -> std::unique_ptr<Handler> {
        return std::make_unique<RecordingHandler>(name, succeed, message);
    };
}

} // namespace fleet::Testing
