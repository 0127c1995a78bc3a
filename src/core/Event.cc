#include "fleet/core/Event.hh"
#include "fleet/core/Log.hh"
#include "fleet/core/Platform.hh"
#include "fleet/utils/ErrorHandling.hh"

#include <utility>

namespace fleet {

namespace {

[[noreturn]] void throwIncompatible(std::string_view name) {
    std::string message = "The handler type \"" + std::string(name) + "\" is incompatible with this event.";
    FLEET_LOG_ERROR("{}", message);
    throw HandlerIncompatibleException(message);
}

HandlerSnapshot snapshotOf(const HandlerTask& task) {
    HandlerSnapshot snapshot;
    snapshot.id = task.getId();
    snapshot.className = task.getName();
    snapshot.state = task.getState();
    snapshot.started = task.started();
    snapshot.completed = task.completed();
    snapshot.message = task.message();
    snapshot.success = task.success();
    return snapshot;
}

} // namespace

std::string_view bucketToString(Bucket bucket) {
    switch (bucket) {
        case Bucket::Incomplete:
            return "incomplete";
        case Bucket::Complete:
            return "complete";
        case Bucket::Failed:
            return "failed";
    }
    return "unknown";
}

Bucket parseBucket(std::string_view name) {
    if (name == "incomplete")
        return Bucket::Incomplete;
    if (name == "complete")
        return Bucket::Complete;
    if (name == "failed")
        return Bucket::Failed;
    throwIncompatible(name);
}

const std::vector<HandlerSnapshot>& EventSnapshot::bucket(Bucket which) const {
    switch (which) {
        case Bucket::Complete:
            return complete;
        case Bucket::Failed:
            return failed;
        case Bucket::Incomplete:
            break;
    }
    return incomplete;
}

std::vector<std::string> EventSnapshot::names(Bucket which) const {
    std::vector<std::string> result;
    for (const auto& entry : bucket(which)) {
        result.push_back(entry.className);
    }
    return result;
}

Event::Event(std::string type, Registry registry, std::shared_ptr<const HandlerFactory> factory, Context context,
             std::optional<Site> site)
    : type(std::move(type)),
      registrySnapshot(std::move(registry)),
      factory(std::move(factory)),
      sharedContext(std::move(context)),
      targetSite(std::move(site)) {
    if (this->type.empty()) {
        throwError("Event type cannot be empty");
    }
    if (!this->factory) {
        throwError("Event '" + this->type + "' requires a handler factory");
    }
}

std::unique_ptr<Event> Event::create(std::string type, Context context, std::shared_ptr<OutputSink> output,
                                     std::optional<Site> site) {
    log::init();
    auto& platform = Platform::instance();

    auto registry = platform.getRegistry();
    if (registry.isError()) {
        throwError("Unable to load handler registry: " + registry.message());
    }

    auto event = std::make_unique<Event>(std::move(type), std::move(registry.value()), platform.getHandlerFactory(),
                                         std::move(context), std::move(site));
    event->setDispatcher(Dispatcher(platform.getConfig().dispatch));
    event->setOutput(std::move(output));
    return event;
}

const std::string& Event::getType() const {
    return type;
}

Context& Event::context() {
    return sharedContext;
}

const Context& Event::context() const {
    return sharedContext;
}

const std::optional<Site>& Event::site() const {
    return targetSite;
}

const Registry& Event::registry() const {
    return registrySnapshot;
}

const Dispatcher& Event::getDispatcher() const {
    return dispatcher;
}

void Event::setDispatcher(Dispatcher dispatcher) {
    this->dispatcher = std::move(dispatcher);
}

const std::shared_ptr<OutputSink>& Event::getOutput() const {
    return outputSink;
}

void Event::setOutput(std::shared_ptr<OutputSink> output) {
    outputSink = std::move(output);
}

void Event::output(std::string_view line) const {
    if (outputSink) {
        outputSink->write(line);
    }
}

std::size_t Event::loadHandlers() {
    auto descriptors = registrySnapshot.lookup(type);

    std::vector<std::unique_ptr<HandlerTask>> loaded;
    loaded.reserve(descriptors.size());
    for (const auto& descriptor : descriptors) {
        loaded.push_back(std::make_unique<HandlerTask>(factory->create(descriptor)));
    }

    {
        std::lock_guard<std::mutex> lock(handlersMutex);
        for (auto& task : loaded) {
            incomplete.push_back(std::move(task));
        }
    }

    FLEET_LOG_DEBUG("Loaded {} handlers for event '{}'", loaded.size(), type);
    return loaded.size();
}

void Event::pushHandler(std::unique_ptr<HandlerTask>&& task, std::string_view bucket) {
    pushHandler(std::move(task), parseBucket(bucket));
}

void Event::pushHandler(std::unique_ptr<HandlerTask>&& task, Bucket bucket) {
    if (!task) {
        std::string message = "Cannot push a null handler onto event '" + type + "'";
        FLEET_LOG_ERROR("{}", message);
        throw HandlerIncompatibleException(message);
    }
    if (bucket == Bucket::Incomplete && !task->isPending()) {
        std::string message = "Handler '" + task->getName() + "' has already run and cannot re-enter the incomplete bucket";
        FLEET_LOG_ERROR("{}", message);
        throw HandlerIncompatibleException(message);
    }

    std::lock_guard<std::mutex> lock(handlersMutex);
    bucketFor(bucket).push_back(std::move(task));
}

std::string Event::enqueue(std::unique_ptr<Handler> handler) {
    if (!handler) {
        std::string message = "Cannot enqueue a null handler onto event '" + type + "'";
        FLEET_LOG_ERROR("{}", message);
        throw HandlerIncompatibleException(message);
    }
    auto task = std::make_unique<HandlerTask>(std::move(handler));
    auto id = task->getId();
    pushHandler(std::move(task), Bucket::Incomplete);
    return id;
}

std::unique_ptr<HandlerTask> Event::popHandler(std::string_view bucket) {
    return popHandler(parseBucket(bucket));
}

std::unique_ptr<HandlerTask> Event::popHandler(Bucket bucket) {
    std::lock_guard<std::mutex> lock(handlersMutex);
    auto& queue = bucketFor(bucket);
    if (queue.empty()) {
        return nullptr;
    }
    auto task = std::move(queue.front());
    queue.pop_front();
    return task;
}

std::size_t Event::count(Bucket bucket) const {
    std::lock_guard<std::mutex> lock(handlersMutex);
    return bucketFor(bucket).size();
}

bool Event::hasFailures() const {
    return count(Bucket::Failed) > 0;
}

DispatchSummary Event::run() {
    loadHandlers();
    return dispatcher.dispatch(*this);
}

EventSnapshot Event::debug() const {
    EventSnapshot snapshot;
    snapshot.type = type;

    std::lock_guard<std::mutex> lock(handlersMutex);
    for (const auto& task : incomplete) {
        snapshot.incomplete.push_back(snapshotOf(*task));
    }
    for (const auto& task : complete) {
        snapshot.complete.push_back(snapshotOf(*task));
    }
    for (const auto& task : failed) {
        snapshot.failed.push_back(snapshotOf(*task));
    }
    return snapshot;
}

std::deque<std::unique_ptr<HandlerTask>>& Event::bucketFor(Bucket bucket) {
    switch (bucket) {
        case Bucket::Complete:
            return complete;
        case Bucket::Failed:
            return failed;
        case Bucket::Incomplete:
            break;
    }
    return incomplete;
}

const std::deque<std::unique_ptr<HandlerTask>>& Event::bucketFor(Bucket bucket) const {
    switch (bucket) {
        case Bucket::Complete:
            return complete;
        case Bucket::Failed:
            return failed;
        case Bucket::Incomplete:
            break;
    }
    return incomplete;
}

} // namespace fleet
