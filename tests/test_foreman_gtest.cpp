// ==============================================================================
// test_foreman_gtest.cpp - Тесты Foreman (GoogleTest)
// ==============================================================================
//
// Покрытие:
// - check-in: сопоставление правил и запуск hunt
// - однократное назначение hunt клиенту
// - истечение правил
// - передача результатов hunt
// - параллельные check-in
//
// ==============================================================================

#include <fleethunt/error.hpp>
#include <fleethunt/foreman.hpp>

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fleethunt::foreman::test {

namespace {

constexpr std::int64_t CLOCK_VALUE = 1336650631137737;

client::ClientRecord make_client(int i, const std::string& name, std::int64_t clock) {
    client::ClientRecord c;
    c.id = "C.1000000000000" + std::to_string(100 + i);
    c.set(client::ATTR_CLIENT_NAME, Value(name));
    c.set(client::ATTR_CLOCK, Value(clock));
    return c;
}

rule::RuleGroup grr_group() {
    return rule::make_group(
        {rule::make_regex_rule(client::ATTR_CLIENT_NAME, "GRR.*"),
         rule::make_integer_rule(client::ATTR_CLOCK, rule::IntegerOperator::GreaterThan,
                                 CLOCK_VALUE)});
}

}  // namespace

class ForemanTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::make_shared<std::atomic<platform::Timestamp>>(1000 * platform::MICROS_PER_SECOND);
        auto now = now_;
        foreman_ = std::make_unique<Foreman>(rules_, assignments_, hunts_, nullptr,
                                             [now] { return now->load(); });
        dispatcher_ = std::make_shared<hunt::QueueDispatcher>();
    }

    std::shared_ptr<hunt::Hunt> create(const std::string& id, std::uint32_t limit = 0) {
        hunt::HuntConfig config;
        config.id = id;
        config.client_limit = limit;
        auto h = foreman_->create_hunt(config, dispatcher_);
        h->add_rule(grr_group());
        return h;
    }

    std::shared_ptr<std::atomic<platform::Timestamp>> now_;
    RuleStore rules_;
    AssignmentStore assignments_;
    hunt::HuntRegistry hunts_;
    std::unique_ptr<Foreman> foreman_;
    std::shared_ptr<hunt::QueueDispatcher> dispatcher_;
};

TEST_F(ForemanTest, CheckIn_MatchingClientStartsRunningHunt) {
    auto h = create("H:00000001");
    h->run();

    EXPECT_EQ(foreman_->on_check_in(make_client(1, "GRR Monitor", CLOCK_VALUE + 1)), 1u);
    EXPECT_EQ(h->started_count(), 1u);
    ASSERT_EQ(dispatcher_->pending(), 1u);
}

TEST_F(ForemanTest, CheckIn_NonMatchingClientsIgnored) {
    auto h = create("H:00000001");
    h->run();

    EXPECT_EQ(foreman_->on_check_in(make_client(1, "Other", CLOCK_VALUE + 1)), 0u);
    EXPECT_EQ(foreman_->on_check_in(make_client(2, "GRR Monitor", CLOCK_VALUE)), 0u);
    EXPECT_EQ(h->started_count(), 0u);
}

TEST_F(ForemanTest, CheckIn_RepeatedCheckInDispatchesOnce) {
    auto h = create("H:00000001");
    h->run();
    const auto c = make_client(1, "GRR Monitor", CLOCK_VALUE + 1);

    EXPECT_EQ(foreman_->on_check_in(c), 1u);
    EXPECT_EQ(foreman_->on_check_in(c), 0u);
    EXPECT_EQ(dispatcher_->pending(), 1u);
}

TEST_F(ForemanTest, CheckIn_TwoRulesOfSameHuntDispatchOnce) {
    auto h = create("H:00000001");
    h->add_rule({rule::make_regex_rule(client::ATTR_CLIENT_NAME, "GRR Monitor")});
    h->run();
    EXPECT_EQ(rules_.size(), 2u);

    EXPECT_EQ(foreman_->on_check_in(make_client(1, "GRR Monitor", CLOCK_VALUE + 1)), 1u);
}

TEST_F(ForemanTest, CheckIn_SeveralHuntsMatch) {
    auto first = create("H:00000001");
    auto second = create("H:00000002");
    first->run();
    second->run();

    EXPECT_EQ(foreman_->on_check_in(make_client(1, "GRR Monitor", CLOCK_VALUE + 1)), 2u);
    EXPECT_EQ(assignments_.size(), 2u);
}

TEST_F(ForemanTest, CheckIn_PausedHuntReceivesNoClients) {
    auto h = create("H:00000001");
    h->run();
    for (int i = 0; i < 5; ++i) {
        foreman_->on_check_in(make_client(i, "GRR Monitor", CLOCK_VALUE + 1));
    }
    h->pause();
    for (int i = 0; i < 10; ++i) {
        foreman_->on_check_in(make_client(i, "GRR Monitor", CLOCK_VALUE + 1));
    }
    EXPECT_EQ(h->started_count(), 5u);

    h->run();
    for (int i = 0; i < 10; ++i) {
        foreman_->on_check_in(make_client(i, "GRR Monitor", CLOCK_VALUE + 1));
    }
    EXPECT_EQ(h->started_count(), 10u);
}

TEST_F(ForemanTest, CheckIn_ClientLimitRespected) {
    auto h = create("H:00000001", 5);
    h->run();
    std::size_t dispatched = 0;
    for (int i = 0; i < 10; ++i) {
        dispatched += foreman_->on_check_in(make_client(i, "GRR Monitor", CLOCK_VALUE + 1));
    }
    EXPECT_EQ(dispatched, 5u);
    EXPECT_EQ(h->started_count(), 5u);
}

TEST_F(ForemanTest, CheckIn_ExpiredRulesArePruned) {
    hunt::HuntConfig config;
    config.id = "H:00000001";
    config.expiry = 60 * platform::MICROS_PER_SECOND;
    auto h = foreman_->create_hunt(config, dispatcher_);
    h->add_rule(grr_group());
    h->run();

    now_->fetch_add(61 * platform::MICROS_PER_SECOND);
    EXPECT_EQ(foreman_->on_check_in(make_client(1, "GRR Monitor", CLOCK_VALUE + 1)), 0u);
    EXPECT_EQ(rules_.size(), 0u);
}

TEST_F(ForemanTest, CheckIn_RuleWithoutRegisteredHuntSkipped) {
    rule::ForemanRule orphan;
    orphan.group = grr_group();
    orphan.action.hunt_id = "H:deadbeef";
    orphan.expires = now_->load() + platform::MICROS_PER_SECOND;
    rules_.add(orphan);

    EXPECT_EQ(foreman_->on_check_in(make_client(1, "GRR Monitor", CLOCK_VALUE + 1)), 0u);
    EXPECT_EQ(assignments_.size(), 0u);
}

TEST_F(ForemanTest, CheckIn_EmptyClientId_Throws) {
    client::ClientRecord c;
    EXPECT_THROW(foreman_->on_check_in(c), ValidationError);
}

TEST_F(ForemanTest, PostResult_RoutesToHunt) {
    auto h = create("H:00000001");
    h->run();
    const auto c = make_client(1, "GRR Monitor", CLOCK_VALUE + 1);
    foreman_->on_check_in(c);

    hunt::TaskResult result;
    result.hunt_id = h->id();
    result.client_id = c.id;
    result.outcome = hunt::Badness{};
    EXPECT_TRUE(foreman_->post_result(result));
    EXPECT_FALSE(foreman_->post_result(result));
    EXPECT_EQ(h->badness_count(), 1u);

    result.hunt_id = "H:unknown";
    EXPECT_FALSE(foreman_->post_result(result));
}

TEST_F(ForemanTest, CreateHunt_DuplicateIdRejected) {
    create("H:00000001");
    hunt::HuntConfig config;
    config.id = "H:00000001";
    EXPECT_THROW(foreman_->create_hunt(config, dispatcher_), ValidationError);
}

TEST_F(ForemanTest, ConcurrentCheckIns_EachClientDispatchedOnce) {
    auto h = create("H:00000001", 30);
    h->run();

    std::vector<client::ClientRecord> clients;
    for (int i = 0; i < 100; ++i) {
        clients.push_back(make_client(i, "GRR Monitor", CLOCK_VALUE + 1));
    }

    std::atomic<std::size_t> dispatched{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (const auto& c : clients) {
                dispatched += foreman_->on_check_in(c);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(dispatched.load(), 30u);
    EXPECT_EQ(dispatcher_->pending(), 30u);
    EXPECT_EQ(assignments_.count(h->id()), 30u);
}

}  // namespace fleethunt::foreman::test
