#include "stride/core/Event.hh"
#include "stride/core/Spatial.hh"
#include "stride/utils/ErrorHandling.hh"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stride;

class EventTest : public ::testing::Test {
  protected:
    void SetUp() override {
        jumpEvent = std::make_unique<Event>(events::kJump, "MovementController");
        landEvent = std::make_unique<Event>(events::kLand, "MovementController");
    }

    std::unique_ptr<Event> jumpEvent;
    std::unique_ptr<Event> landEvent;
    EventDispatcher dispatcher;
};

TEST_F(EventTest, ConstructorThrowsOnEmptyType) {
    EXPECT_THROW(Event("", "source"), StrideException);
}

TEST_F(EventTest, TypeAndSource) {
    EXPECT_EQ(jumpEvent->getType(), "character.jump");
    EXPECT_EQ(jumpEvent->getSource(), "MovementController");
}

TEST_F(EventTest, SetGetData) {
    jumpEvent->setData<int>("tick", 42);
    jumpEvent->setData<float>("speed", 3.5f);
    jumpEvent->setData<std::string>("surface", "stone");
    jumpEvent->setData<bool>("auto", true);

    EXPECT_EQ(jumpEvent->getData<int>("tick"), 42);
    EXPECT_FLOAT_EQ(jumpEvent->getData<float>("speed"), 3.5f);
    EXPECT_EQ(jumpEvent->getData<std::string>("surface"), "stone");
    EXPECT_TRUE(jumpEvent->getData<bool>("auto"));
    EXPECT_TRUE(jumpEvent->hasData("tick"));
    EXPECT_FALSE(jumpEvent->hasData("missing"));
}

TEST_F(EventTest, GetDataThrowsOnMissingKeyOrWrongType) {
    jumpEvent->setData<int>("tick", 42);
    EXPECT_THROW(jumpEvent->getData<int>("nonexistent"), StrideException);
    EXPECT_THROW(jumpEvent->getData<std::string>("tick"), StrideException);
}

TEST_F(EventTest, AnyDataCarriesVectors) {
    jumpEvent->setAnyData<Vec3f>("momentum", Vec3f(1.0f, 10.0f, 0.0f));

    ASSERT_TRUE(jumpEvent->hasAnyData("momentum"));
    Vec3f momentum = jumpEvent->getAnyData<Vec3f>("momentum");
    EXPECT_FLOAT_EQ(momentum.y, 10.0f);
    EXPECT_THROW(jumpEvent->getAnyData<float>("momentum"), StrideException);
    EXPECT_THROW(jumpEvent->getAnyData<Vec3f>("point"), StrideException);
}

TEST_F(EventTest, HandledFlag) {
    EXPECT_FALSE(jumpEvent->isHandled());
    jumpEvent->setHandled(true);
    EXPECT_TRUE(jumpEvent->isHandled());
    jumpEvent->setHandled(false);
    EXPECT_FALSE(jumpEvent->isHandled());
}

TEST_F(EventTest, AddEventListenerValidatesArguments) {
    EXPECT_THROW(dispatcher.addEventListener("", [](Event&) {}), StrideException);
    EXPECT_THROW(dispatcher.addEventListener(events::kJump, nullptr), StrideException);
}

TEST_F(EventTest, RemoveEventListener) {
    std::string handlerId = dispatcher.addEventListener(events::kJump, [](Event&) {});
    EXPECT_EQ(dispatcher.listenerCount(events::kJump), 1u);
    EXPECT_TRUE(dispatcher.removeEventListener(events::kJump, handlerId));
    EXPECT_FALSE(dispatcher.removeEventListener(events::kJump, handlerId));
    EXPECT_FALSE(dispatcher.removeEventListener("nonexistent", "invalid"));
    EXPECT_EQ(dispatcher.listenerCount(events::kJump), 0u);
}

TEST_F(EventTest, DispatchOnlyReachesMatchingType) {
    int jumps = 0;
    dispatcher.addEventListener(events::kJump, [&jumps](Event&) { jumps++; });

    EXPECT_FALSE(dispatcher.dispatchEvent(*jumpEvent));
    EXPECT_FALSE(dispatcher.dispatchEvent(*landEvent));
    EXPECT_EQ(jumps, 1);
}

TEST_F(EventTest, HandledEventStopsPropagation) {
    int first = 0;
    int second = 0;
    dispatcher.addEventListener(events::kJump, [&first](Event& event) {
        first++;
        event.setHandled(true);
    });
    dispatcher.addEventListener(events::kJump, [&second](Event&) { second++; });

    EXPECT_TRUE(dispatcher.dispatchEvent(*jumpEvent));
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 0);
}

TEST_F(EventTest, PriorityOrdering) {
    std::vector<int> order;

    dispatcher.addEventListener(events::kLand, [&](Event&) { order.push_back(2); }, 10);
    dispatcher.addEventListener(events::kLand, [&](Event&) { order.push_back(0); }, -5);
    dispatcher.addEventListener(events::kLand, [&](Event&) { order.push_back(1); }, 0);
    dispatcher.addEventListener(events::kLand, [&](Event&) { order.push_back(3); }, 10);

    dispatcher.dispatchEvent(*landEvent);

    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order[0], 0);
    EXPECT_EQ(order[1], 1);
    EXPECT_EQ(order[2], 2);
    EXPECT_EQ(order[3], 3); // equal priority keeps insertion order
}

TEST_F(EventTest, ThrowingHandlerDoesNotAbortDispatch) {
    int calls = 0;
    dispatcher.addEventListener(events::kLand, [](Event&) { throw std::runtime_error("listener failure"); });
    dispatcher.addEventListener(events::kLand, [&calls](Event&) { calls++; });

    EXPECT_NO_THROW(dispatcher.dispatchEvent(*landEvent));
    EXPECT_EQ(calls, 1);
}

TEST_F(EventTest, HandlerMayUnsubscribeDuringDispatch) {
    int calls = 0;
    std::string id;
    id = dispatcher.addEventListener(events::kJump, [&](Event&) {
        calls++;
        dispatcher.removeEventListener(events::kJump, id);
    });

    dispatcher.dispatchEvent(*jumpEvent);
    dispatcher.dispatchEvent(*jumpEvent);
    EXPECT_EQ(calls, 1);
}
