#pragma once

#include "fleet/core/Context.hh"
#include "fleet/core/Dispatcher.hh"
#include "fleet/core/HandlerFactory.hh"
#include "fleet/core/HandlerTask.hh"
#include "fleet/core/Output.hh"
#include "fleet/core/Registry.hh"
#include "fleet/core/Site.hh"
#include "fleet/core/Types.hh"

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet {

enum class Bucket {
    Incomplete,
    Complete,
    Failed
};

std::string_view bucketToString(Bucket bucket);

// Throws HandlerIncompatibleException for anything but
// "incomplete", "complete" or "failed".
Bucket parseBucket(std::string_view name);

struct HandlerSnapshot {
    std::string id;
    std::string className;
    HandlerState state = HandlerState::Pending;
    std::optional<Timestamp> started;
    std::optional<Timestamp> completed;
    std::string message;
    bool success = false;

    bool operator==(const HandlerSnapshot&) const = default;
};

struct EventSnapshot {
    std::string type;
    std::vector<HandlerSnapshot> incomplete;
    std::vector<HandlerSnapshot> complete;
    std::vector<HandlerSnapshot> failed;

    const std::vector<HandlerSnapshot>& bucket(Bucket which) const;
    std::vector<std::string> names(Bucket which) const;

    bool operator==(const EventSnapshot&) const = default;
};

// One triggered event: its type, the shared context, an optional target site,
// the registry snapshot it was built from, and three ordered handler buckets.
//
// Usage:
//   auto event = Event::create("site_duplication_scrub", Context{{"site_id", int64_t{42}}});
//   auto summary = event->run();
//   if (!summary.ok()) report(event->debug());
class Event {
  public:
    Event(std::string type, Registry registry, std::shared_ptr<const HandlerFactory> factory, Context context = {},
          std::optional<Site> site = std::nullopt);

    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    // Builds an event wired to the process-wide Platform: its registry,
    // handler factory and dispatch policy.
    static std::unique_ptr<Event> create(std::string type, Context context = {},
                                         std::shared_ptr<OutputSink> output = nullptr,
                                         std::optional<Site> site = std::nullopt);

    const std::string& getType() const;
    Context& context();
    const Context& context() const;
    const std::optional<Site>& site() const;
    const Registry& registry() const;

    const Dispatcher& getDispatcher() const;
    void setDispatcher(Dispatcher dispatcher);

    const std::shared_ptr<OutputSink>& getOutput() const;
    void setOutput(std::shared_ptr<OutputSink> output);

    // Writes to the output sink; dropped when none is attached.
    void output(std::string_view line) const;

    // Instantiates every registry descriptor matching this event's type and
    // appends them to incomplete in registry order. All descriptors are
    // resolved before any is queued, so a resolution failure queues nothing.
    // Calling it twice queues the handlers twice.
    std::size_t loadHandlers();

    // The task only moves out of `task` on success.
    void pushHandler(std::unique_ptr<HandlerTask>&& task, std::string_view bucket = "incomplete");
    void pushHandler(std::unique_ptr<HandlerTask>&& task, Bucket bucket);

    // Wraps a fresh handler into a task at the tail of incomplete. Returns the task id.
    std::string enqueue(std::unique_ptr<Handler> handler);

    // Removes the oldest task of a bucket; nullptr when the bucket is empty.
    std::unique_ptr<HandlerTask> popHandler(std::string_view bucket = "incomplete");
    std::unique_ptr<HandlerTask> popHandler(Bucket bucket);

    std::size_t count(Bucket bucket) const;
    bool hasFailures() const;

    DispatchSummary run();

    EventSnapshot debug() const;

  private:
    std::deque<std::unique_ptr<HandlerTask>>& bucketFor(Bucket bucket);
    const std::deque<std::unique_ptr<HandlerTask>>& bucketFor(Bucket bucket) const;

    std::string type;
    Registry registrySnapshot;
    std::shared_ptr<const HandlerFactory> factory;
    Context sharedContext;
    std::optional<Site> targetSite;
    Dispatcher dispatcher;
    std::shared_ptr<OutputSink> outputSink;

    mutable std::mutex handlersMutex;
    std::deque<std::unique_ptr<HandlerTask>> incomplete;
    std::deque<std::unique_ptr<HandlerTask>> complete;
    std::deque<std::unique_ptr<HandlerTask>> failed;
};

} // namespace fleet
