#include "fleet/core/Event.hh"
#include "fleet/handlers/CallbackHandler.hh"
#include "fleet/utils/ErrorHandling.hh"
#include <gtest/gtest.h>

using namespace fleet;

class CallbackHandlerTest : public ::testing::Test {
  protected:
    std::shared_ptr<HandlerFactory> factory = std::make_shared<HandlerFactory>();
    Event event{"demo", Registry(), factory};
};

TEST_F(CallbackHandlerTest, RejectsMissingPieces) {
    EXPECT_THROW(CallbackHandler("", [](Event&) { return HandlerResult::ok(); }), FleetException);
    EXPECT_THROW(CallbackHandler("Empty", nullptr), FleetException);
}

TEST_F(CallbackHandlerTest, RunsCallbackWithEvent) {
    CallbackHandler handler("Touch", [](Event& e) {
        e.context().set<int>("touched", 1);
        return HandlerResult::ok("touched " + e.getType());
    });

    EXPECT_EQ(handler.getName(), "Touch");
    auto result = handler.execute(event);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "touched demo");
    EXPECT_EQ(event.context().get<int>("touched"), 1);
}

TEST_F(CallbackHandlerTest, FailureReachesFailedBucket) {
    event.enqueue(std::make_unique<CallbackHandler>("Broken", [](Event&) { return HandlerResult::failure("nope"); }));
    auto summary = event.run();

    EXPECT_EQ(summary.failed, 1u);
    auto snapshot = event.debug();
    ASSERT_EQ(snapshot.failed.size(), 1u);
    EXPECT_EQ(snapshot.failed[0].className, "Broken");
    EXPECT_EQ(snapshot.failed[0].message, "nope");
}
