#include "fleet/core/Event.hh"
#include "fleet/handlers/FanOutHandler.hh"
#include "fleet/utils/ErrorHandling.hh"
#include "fleet/utils/Testing.hh"
#include <gtest/gtest.h>

using namespace fleet;
using namespace fleet::Testing;

class FanOutHandlerTest : public ::testing::Test {
  protected:
    static std::unique_ptr<Handler> perSite(const std::string& site) {
        return std::make_unique<RecordingHandler>("Deploy(" + site + ")");
    }

    std::shared_ptr<HandlerFactory> factory = std::make_shared<HandlerFactory>();
    Event event{"deploy", Registry(), factory};
};

TEST_F(FanOutHandlerTest, RequiresConstructor) {
    EXPECT_THROW(FanOutHandler("FanOut", "sites", nullptr), FleetException);
}

TEST_F(FanOutHandlerTest, QueuesOneHandlerPerItemBehindExistingWork) {
    event.context().set<std::vector<std::string>>("sites", {"alpha", "beta"});
    event.enqueue(std::make_unique<FanOutHandler>("FanOut", "sites", perSite));
    event.enqueue(std::make_unique<RecordingHandler>("Queued"));

    auto summary = event.run();

    EXPECT_EQ(summary.completed, 4u);
    EXPECT_EQ(trace(event), (std::vector<std::string>{"Queued", "Deploy(alpha)", "Deploy(beta)"}));
    EXPECT_EQ(event.debug().names(Bucket::Complete),
              (std::vector<std::string>{"FanOut", "Queued", "Deploy(alpha)", "Deploy(beta)"}));
    EXPECT_EQ(event.debug().complete[0].message, "Queued 2 handlers");
}

TEST_F(FanOutHandlerTest, EmptyListQueuesNothing) {
    event.context().set<std::vector<std::string>>("sites", {});
    FanOutHandler handler("FanOut", "sites", perSite);

    auto result = handler.execute(event);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Queued 0 handlers");
    EXPECT_EQ(event.count(Bucket::Incomplete), 0u);
}

TEST_F(FanOutHandlerTest, MissingKeyIsFailure) {
    FanOutHandler handler("FanOut", "sites", perSite);
    auto result = handler.execute(event);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("sites"), std::string::npos);
}

TEST_F(FanOutHandlerTest, NullItemHandlerQueuesNothing) {
    event.context().set<std::vector<std::string>>("sites", {"alpha", "broken"});
    FanOutHandler handler("FanOut", "sites", [](const std::string& site) -> std::unique_ptr<Handler> {
        if (site == "broken") {
            return nullptr;
        }
        return perSite(site);
    });

    auto result = handler.execute(event);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(event.count(Bucket::Incomplete), 0u);
}
