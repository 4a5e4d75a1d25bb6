/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "settings/container.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "mock/store/store_mock.hpp"
#include "se/impl/async_dispatcher_impl.hpp"
#include "store/in_memory/in_memory_store.hpp"
#include "testutil/collector.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using prefs::CodecError;
using prefs::InMemoryStore;
using prefs::OptValue;
using prefs::StoreMock;
using prefs::Value;
using prefs::bridge::Completion;
using prefs::config::StoreConfiguration;
using prefs::settings::Attribute;
using prefs::settings::Container;
using testing::_;
using testing::Return;
using testutil::Collector;

namespace {
  struct Point {
    int x = 0;
    int y = 0;
    bool operator==(const Point &) const = default;
  };
}  // namespace

template <>
struct prefs::ValueCodec<Point> {
  static Value encode(const Point &p) {
    return StringArray{std::to_string(p.x), std::to_string(p.y)};
  }
  static outcome::result<Point> decode(const Value &v) {
    OUTCOME_TRY(parts, ValueCodec<StringArray>::decode(v));
    if (parts.size() != 2) {
      return CodecError::TYPE_MISMATCH;
    }
    OUTCOME_TRY(x, ValueCodec<int>::decode(Value{parts[0]}));
    OUTCOME_TRY(y, ValueCodec<int>::decode(Value{parts[1]}));
    return Point{x, y};
  }
};

class ContainerTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
  std::shared_ptr<StoreConfiguration> configuration =
      std::make_shared<StoreConfiguration>(store, "app_");
  std::shared_ptr<Container> container = std::make_shared<Container>(
      configuration,
      std::make_shared<prefs::se::AsyncDispatcher<
          prefs::kDeliveryContextsCount>>(),
      testutil::prepareLoggers());

  const Attribute<int> count{.name = "count", .default_value = 0};
  const Attribute<std::string> theme{.name = "theme",
                                     .default_value = "light"};
  const Attribute<std::optional<std::string>> nickname{.name = "nickname"};
};

TEST_F(ContainerTest, KeysArePrefixed) {
  EXPECT_EQ(container->key(count), "app_count");
  configuration->configure(store, "other.");
  EXPECT_EQ(container->key(count), "other.count");
}

TEST_F(ContainerTest, ReadRegistersDefault) {
  EXPECT_EQ(container->read(theme), "light");
  EXPECT_EQ(store->read("app_theme"), Value{std::string("light")});
  EXPECT_EQ(store->read("app_count"), std::nullopt);
}

TEST_F(ContainerTest, WriteThenRead) {
  ASSERT_OUTCOME_SUCCESS(container->write(count, 42));
  EXPECT_EQ(store->read("app_count"), Value{int64_t{42}});
  EXPECT_EQ(container->read(count), 42);

  ASSERT_OUTCOME_SUCCESS(container->reset(count));
  EXPECT_EQ(container->read(count), 0);
}

TEST_F(ContainerTest, UndecodableValueReadsAsDefault) {
  ASSERT_OUTCOME_SUCCESS(store->write("app_count", std::string("many")));
  EXPECT_EQ(container->read(count), 0);
}

TEST_F(ContainerTest, OptionalAttribute) {
  EXPECT_EQ(container->read(nickname), std::nullopt);

  ASSERT_OUTCOME_SUCCESS(
      container->write(nickname, std::optional<std::string>("neo")));
  EXPECT_EQ(container->read(nickname), "neo");

  ASSERT_OUTCOME_SUCCESS(container->write(nickname, std::nullopt));
  EXPECT_EQ(store->read("app_nickname"), std::nullopt);
}

TEST_F(ContainerTest, CustomCodable) {
  const Attribute<Point> origin{.name = "origin", .default_value = {1, 2}};
  EXPECT_EQ(container->read(origin), (Point{1, 2}));
  ASSERT_OUTCOME_SUCCESS(container->write(origin, Point{3, 4}));
  EXPECT_EQ(container->read(origin), (Point{3, 4}));
}

TEST_F(ContainerTest, DefaultIsRegisteredOncePerStore) {
  auto mock = std::make_shared<StoreMock>();
  configuration->configure(mock, "app_");

  EXPECT_CALL(*mock, registerDefaults(_)).Times(1);
  EXPECT_CALL(*mock, read("app_count")).WillRepeatedly(Return(OptValue{}));
  EXPECT_EQ(container->read(count), 0);
  EXPECT_EQ(container->read(count), 0);
  testing::Mock::VerifyAndClearExpectations(mock.get());

  // a different store gets the default as well
  configuration->configure(store, "app_");
  EXPECT_EQ(container->read(count), 0);
  EXPECT_EQ(store->read("app_count"), Value{int64_t{0}});
}

TEST_F(ContainerTest, StreamStartsWithCurrentValue) {
  ASSERT_OUTCOME_SUCCESS(container->write(count, 3));
  auto values = container->stream(count);

  std::stop_source stop;
  ASSERT_OUTCOME_SUCCESS(first, values.next(stop.get_token()));
  EXPECT_EQ(first, 3);

  ASSERT_OUTCOME_SUCCESS(container->write(count, 4));
  ASSERT_OUTCOME_SUCCESS(container->reset(count));
  ASSERT_OUTCOME_SUCCESS(second, values.next(stop.get_token()));
  EXPECT_EQ(second, 4);
  ASSERT_OUTCOME_SUCCESS(third, values.next(stop.get_token()));
  EXPECT_EQ(third, 0);
}

TEST_F(ContainerTest, StreamFailsOnUndecodableValue) {
  auto values = container->stream(count);
  ASSERT_OUTCOME_SUCCESS(store->write("app_count", std::string("many")));

  std::stop_source stop;
  ASSERT_OUTCOME_SUCCESS(first, values.next(stop.get_token()));
  EXPECT_EQ(first, 0);
  ASSERT_OUTCOME_ERROR(values.next(stop.get_token()),
                       CodecError::TYPE_MISMATCH);
  // the observation ended together with the stream
  EXPECT_EQ(store->observersCount("app_count"), 0u);
}

TEST_F(ContainerTest, DroppingStreamEndsObservation) {
  {
    auto values = container->stream(count);
    EXPECT_EQ(store->observersCount("app_count"), 1u);
  }
  EXPECT_EQ(store->observersCount("app_count"), 0u);
}

TEST_F(ContainerTest, ProjectedStreamSkipsRepeats) {
  const Attribute<Point> origin{.name = "origin", .default_value = {0, 0}};
  auto xs = container->stream(origin, [](const Point &p) { return p.x; });

  ASSERT_OUTCOME_SUCCESS(container->write(origin, Point{0, 1}));
  ASSERT_OUTCOME_SUCCESS(container->write(origin, Point{0, 2}));
  ASSERT_OUTCOME_SUCCESS(container->write(origin, Point{5, 2}));

  std::stop_source stop;
  ASSERT_OUTCOME_SUCCESS(first, xs.next(stop.get_token()));
  EXPECT_EQ(first, 0);
  ASSERT_OUTCOME_SUCCESS(second, xs.next(stop.get_token()));
  EXPECT_EQ(second, 5);
}

/**
 * @given "count" stored as 0 and a publisher of it
 * @when 5 is written, the subscription is cancelled, then 9 is written
 * @then 0 and 5 are delivered, nothing else and no completion
 */
TEST_F(ContainerTest, PublisherCountScenario) {
  ASSERT_OUTCOME_SUCCESS(container->write(count, 0));
  auto publisher = container->publisher(count);
  auto collector = std::make_shared<Collector<int>>();
  auto subscription = publisher.subscribe(collector);
  ASSERT_TRUE(collector->waitValues(1));

  ASSERT_OUTCOME_SUCCESS(container->write(count, 5));
  ASSERT_TRUE(collector->waitValues(2));

  subscription->cancel();
  ASSERT_OUTCOME_SUCCESS(container->write(count, 9));

  EXPECT_FALSE(collector->waitValues(3, 50ms));
  EXPECT_EQ(collector->values(), (std::vector<int>{0, 5}));
  EXPECT_TRUE(collector->completions().empty());

  subscription.reset();
  EXPECT_EQ(store->observersCount("app_count"), 0u);
}

TEST_F(ContainerTest, ProjectedPublisher) {
  auto publisher = container->publisher(
      theme, [](const std::string &t) { return t.size(); });
  auto collector = std::make_shared<Collector<size_t>>();
  auto subscription = publisher.subscribe(collector);

  ASSERT_OUTCOME_SUCCESS(container->write(theme, std::string("night")));
  ASSERT_OUTCOME_SUCCESS(container->write(theme, std::string("light")));
  ASSERT_OUTCOME_SUCCESS(container->write(theme, std::string("dark")));
  ASSERT_TRUE(collector->waitValues(2));
  EXPECT_FALSE(collector->waitValues(3, 50ms));
  EXPECT_EQ(collector->values(), (std::vector<size_t>{5, 4}));
  subscription->cancel();
}

TEST_F(ContainerTest, ObserverUsesKeyAsGiven) {
  std::vector<OptValue> seen;
  ASSERT_OUTCOME_SUCCESS(
      handle,
      container->observer("raw", [&](const OptValue &, const OptValue &v) {
        seen.push_back(v);
      }));
  ASSERT_OUTCOME_SUCCESS(store->write("raw", true));
  EXPECT_THAT(seen, testing::ElementsAre(std::nullopt, Value{true}));
}

TEST_F(ContainerTest, StreamStaysOnItsStore) {
  auto other = std::make_shared<InMemoryStore>();
  auto values = container->stream(count);
  configuration->configure(other, "app_");

  ASSERT_OUTCOME_SUCCESS(other->write("app_count", int64_t{7}));
  ASSERT_OUTCOME_SUCCESS(store->write("app_count", int64_t{1}));

  std::stop_source stop;
  ASSERT_OUTCOME_SUCCESS(first, values.next(stop.get_token()));
  EXPECT_EQ(first, 0);
  ASSERT_OUTCOME_SUCCESS(second, values.next(stop.get_token()));
  EXPECT_EQ(second, 1);
}
