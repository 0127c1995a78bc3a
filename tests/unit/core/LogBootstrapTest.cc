// Runs without TestMain, so nothing calls log::init() up front.

#include "fleet/core/Event.hh"
#include "fleet/core/Log.hh"
#include "fleet/core/Platform.hh"
#include "fleet/utils/Testing.hh"
#include <gtest/gtest.h>

using namespace fleet;
using namespace fleet::Testing;

class LogBootstrapTest : public ::testing::Test {
  protected:
    void SetUp() override { Platform::instance().reset(); }
    void TearDown() override { Platform::instance().reset(); }
};

TEST_F(LogBootstrapTest, CreateRunsWithoutExplicitInit) {
    Registry registry;
    registry.addEvent({"demo", "First", std::nullopt});
    Platform::instance().setRegistry(registry);
    Platform::instance().getHandlerFactory()->registerHandler("First", recording("First"));

    auto output = std::make_shared<BufferOutput>();
    auto event = Event::create("demo", Context{}, output);
    auto summary = event->run();

    EXPECT_EQ(summary.completed, 1u);
    EXPECT_EQ(output->lines(), (std::vector<std::string>{"First: completed"}));
}

TEST_F(LogBootstrapTest, AccessorsNeverReturnNull) {
    EXPECT_NE(log::logger(), nullptr);
    EXPECT_NE(log::dispatchLogger(), nullptr);
    FLEET_LOG_INFO("logging without explicit init");
    FLEET_DISPATCH_LOG_DEBUG("dispatch logging without explicit init");
}

TEST_F(LogBootstrapTest, RepeatedInitKeepsLoggers) {
    auto* root = log::logger();
    auto* dispatch = log::dispatchLogger();

    EXPECT_NO_THROW(log::init());
    EXPECT_NO_THROW(log::init());

    EXPECT_EQ(log::logger(), root);
    EXPECT_EQ(log::dispatchLogger(), dispatch);
}
