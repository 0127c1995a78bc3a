#include "fleet/handlers/RetryHandler.hh"
#include "fleet/core/Event.hh"
#include "fleet/core/Log.hh"
#include "fleet/utils/ErrorHandling.hh"

namespace fleet {

RetryHandler::RetryHandler(HandlerConstructor constructor, int attempts)
    : constructor_(std::move(constructor)), attempts_(attempts) {
    if (!constructor_) {
        throwError("RetryHandler requires a handler constructor");
    }
    if (attempts_ < 1) {
        throwError("RetryHandler needs at least one attempt");
    }
    auto sample = constructor_();
    if (!sample) {
        throwError("RetryHandler constructor returned null");
    }
    innerName_ = sample->getName();
}

RetryHandler::RetryHandler(Requeue, HandlerConstructor constructor, int attempts, std::string innerName)
    : constructor_(std::move(constructor)), attempts_(attempts), innerName_(std::move(innerName)) {}

std::string RetryHandler::getName() const {
    return "Retry(" + innerName_ + ")";
}

int RetryHandler::attemptsLeft() const {
    return attempts_;
}

HandlerResult RetryHandler::execute(Event& event) {
    auto inner = constructor_();
    if (!inner) {
        return HandlerResult::failure("Handler constructor for '" + innerName_ + "' returned null");
    }

    HandlerResult result;
    try {
        result = inner->execute(event);
    } catch (const HandlerIncompatibleException&) {
        throw;
    } catch (const HandlerResolutionException&) {
        throw;
    } catch (const DispatchLimitException&) {
        throw;
    } catch (const std::exception& e) {
        result = HandlerResult::failure(e.what());
    }

    if (result.success || attempts_ <= 1) {
        return result;
    }

    event.enqueue(std::make_unique<RetryHandler>(Requeue{}, constructor_, attempts_ - 1, innerName_));
    FLEET_LOG_DEBUG("{} failed, queued retry ({} attempts left)", innerName_, attempts_ - 1);
    result.message += " (retry queued, " + std::to_string(attempts_ - 1) + " attempts left)";
    return result;
}

} // namespace fleet
