// ==============================================================================
// test_hunt_gtest.cpp - Тесты Hunt (GoogleTest)
// ==============================================================================
//
// Покрытие:
// - конструирование и лимиты
// - жизненный цикл RUN / PAUSE / MODIFY / STOP и публикация правил
// - dispatch с лимитом клиентов, повторные назначения
// - учёт исходов, журнал ошибок, уведомления, зеркало в AttributeStore
// - ApprovalGate для управляющих действий
//
// ==============================================================================

#include <fleethunt/approval.hpp>
#include <fleethunt/assignment.hpp>
#include <fleethunt/error.hpp>
#include <fleethunt/hunt.hpp>
#include <fleethunt/notification.hpp>
#include <fleethunt/rule_store.hpp>
#include <fleethunt/store.hpp>

#include <atomic>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <rapidjson/document.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fleethunt::hunt::test {

namespace {

constexpr std::int64_t CLOCK_VALUE = 1336650631137737;

std::string client_id(int i) {
    return "C.10000000000000" + std::to_string(10 + i);
}

rule::RuleGroup grr_group() {
    return rule::make_group(
        {rule::make_regex_rule(client::ATTR_CLIENT_NAME, "GRR.*"),
         rule::make_integer_rule(client::ATTR_CLOCK, rule::IntegerOperator::GreaterThan,
                                 CLOCK_VALUE)});
}

/// Dispatcher, который всегда отказывает
class FailingDispatcher : public Dispatcher {
public:
    void start_client(const TaskRequest&) override {
        throw std::runtime_error("queue unavailable");
    }
};

/// Dispatcher, который бросает значение, не производное от std::exception
class RawThrowingDispatcher : public Dispatcher {
public:
    void start_client(const TaskRequest&) override { throw 42; }
};

/// Приёмник уведомлений, который всегда отказывает
class FailingSink : public NotificationSink {
public:
    void publish(const std::string&, const HuntEvent&) override {
        ++calls;
        throw std::runtime_error("sink down");
    }
    int calls = 0;
};

}  // namespace

// ==============================================================================
// Фикстура
// ==============================================================================

class HuntTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::make_shared<std::atomic<Timestamp>>(1000 * platform::MICROS_PER_SECOND);
        dispatcher_ = std::make_shared<QueueDispatcher>();
        bus_.subscribe("TestHuntDone", [this](const HuntEvent&) { ++notifications_; });
    }

    HuntServices services() {
        HuntServices s;
        s.store = &store_;
        s.notifications = &bus_;
        auto now = now_;
        s.clock = [now] { return now->load(); };
        return s;
    }

    std::unique_ptr<Hunt> make_hunt(std::uint32_t limit = 0, HuntServices s = HuntServices(),
                                    bool use_defaults = true) {
        HuntConfig config;
        config.id = "H:00000001";
        config.name = "SampleHunt";
        config.client_limit = limit;
        config.notification_event = "TestHuntDone";
        auto h = std::make_unique<Hunt>(config, dispatcher_, rules_, assignments_,
                                        use_defaults ? services() : std::move(s));
        h->add_rule(grr_group());
        return h;
    }

    void advance(Timestamp micros) { now_->fetch_add(micros); }

    std::shared_ptr<std::atomic<Timestamp>> now_;
    std::shared_ptr<QueueDispatcher> dispatcher_;
    foreman::RuleStore rules_;
    foreman::AssignmentStore assignments_;
    store::MemoryStore store_;
    EventBus bus_;
    std::atomic<int> notifications_{0};
};

// ==============================================================================
// Конструирование
// ==============================================================================

TEST_F(HuntTest, Construct_LimitAboveMaximum_Throws) {
    HuntConfig config;
    config.client_limit = 2000;
    EXPECT_THROW({ Hunt h(config, dispatcher_, rules_, assignments_); }, ValidationError);
}

TEST_F(HuntTest, Construct_NullDispatcherOrZeroExpiry_Throws) {
    HuntConfig config;
    EXPECT_THROW({ Hunt h(config, nullptr, rules_, assignments_); }, ValidationError);
    config.expiry = 0;
    EXPECT_THROW({ Hunt h(config, dispatcher_, rules_, assignments_); }, ValidationError);
}

TEST_F(HuntTest, Construct_GeneratesIdAndDefaults) {
    HuntConfig config;
    Hunt h(config, dispatcher_, rules_, assignments_);
    EXPECT_EQ(h.id().size(), 10u);
    EXPECT_EQ(h.id().rfind("H:", 0), 0u);
    EXPECT_EQ(h.name(), "SampleHunt");
    EXPECT_EQ(h.state(), HuntState::Constructed);
    EXPECT_EQ(h.expiry(), DEFAULT_EXPIRY);
    EXPECT_EQ(rules_.size(), 0u);
}

TEST_F(HuntTest, Construct_RecordsStateInStore) {
    auto h = make_hunt();
    auto state = store_.get(hunt_urn(h->id()), ATTR_STATE);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->as_string(), "CONSTRUCTED");
}

TEST_F(HuntTest, AddRule_InvalidGroup_Throws) {
    auto h = make_hunt();
    EXPECT_THROW(h->add_rule(rule::RuleGroup()), ValidationError);
    EXPECT_EQ(h->rules().size(), 1u);
}

// ==============================================================================
// Жизненный цикл
// ==============================================================================

TEST_F(HuntTest, Run_PublishesRulesWithExpiry) {
    auto h = make_hunt();
    h->run();

    EXPECT_EQ(h->state(), HuntState::Running);
    auto snapshot = rules_.snapshot();
    ASSERT_EQ(snapshot->size(), 1u);
    const auto& r = snapshot->front();
    EXPECT_EQ(r.action.hunt_id, h->id());
    EXPECT_EQ(r.action.hunt_name, "SampleHunt");
    EXPECT_EQ(r.created, now_->load());
    EXPECT_EQ(r.expires, now_->load() + DEFAULT_EXPIRY);
    EXPECT_EQ(store_.get(hunt_urn(h->id()), ATTR_STATE)->as_string(), "RUNNING");
}

TEST_F(HuntTest, Run_Twice_IsNoOp) {
    auto h = make_hunt();
    h->run();
    const Timestamp created = rules_.snapshot()->front().created;
    advance(platform::MICROS_PER_SECOND);
    EXPECT_NO_THROW(h->run());
    EXPECT_EQ(rules_.snapshot()->front().created, created);
}

TEST_F(HuntTest, AddRule_WhileRunning_Republishes) {
    auto h = make_hunt();
    h->run();
    h->add_rule({rule::make_regex_rule(client::ATTR_SYSTEM, "Linux")});
    EXPECT_EQ(rules_.count(h->id()), 2u);
}

TEST_F(HuntTest, TryStart_BeforeRun_NotRunning) {
    auto h = make_hunt();
    EXPECT_EQ(h->try_start_client(client_id(1)), StartResult::NotRunning);
    EXPECT_EQ(dispatcher_->pending(), 0u);
}

TEST_F(HuntTest, Pause_RemovesRulesAndBlocksDispatch) {
    auto h = make_hunt();
    h->run();
    h->pause();

    EXPECT_EQ(h->state(), HuntState::Paused);
    EXPECT_EQ(rules_.count(h->id()), 0u);
    EXPECT_EQ(h->try_start_client(client_id(1)), StartResult::NotRunning);
    EXPECT_NO_THROW(h->pause());
}

TEST_F(HuntTest, Pause_FromConstructed_Throws) {
    auto h = make_hunt();
    EXPECT_THROW(h->pause(), ValidationError);
}

TEST_F(HuntTest, PauseThenRun_DoesNotRestartAssignedClients) {
    auto h = make_hunt();
    h->run();
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(h->try_start_client(client_id(i)), StartResult::Started);
    }
    EXPECT_EQ(dispatcher_->drain().size(), 10u);

    h->pause();
    h->run();
    EXPECT_EQ(rules_.count(h->id()), 1u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(h->try_start_client(client_id(i)), StartResult::AlreadyAssigned);
    }
    EXPECT_EQ(dispatcher_->pending(), 0u);
}

TEST_F(HuntTest, Stop_RemovesOnlyOwnRules) {
    // Чужие правила другого hunt
    HuntConfig other;
    other.id = "H:00000002";
    Hunt foreign(other, dispatcher_, rules_, assignments_);
    foreign.add_rule(grr_group());
    foreign.add_rule({rule::make_regex_rule(client::ATTR_SYSTEM, "Windows")});
    foreign.run();

    auto h = make_hunt();
    h->add_rule({rule::make_regex_rule(client::ATTR_SYSTEM, "Linux")});
    h->run();
    EXPECT_EQ(rules_.size(), 4u);

    h->try_start_client(client_id(1));
    h->stop();

    EXPECT_EQ(h->state(), HuntState::Stopped);
    EXPECT_EQ(rules_.size(), 2u);
    EXPECT_EQ(rules_.count(foreign.id()), 2u);
    EXPECT_EQ(h->outstanding_requests(), 0u);
}

TEST_F(HuntTest, Stop_IsFinal) {
    auto h = make_hunt();
    h->run();
    h->stop();
    EXPECT_NO_THROW(h->stop());
    EXPECT_THROW(h->run(), ValidationError);
    EXPECT_THROW(h->modify(ModifyRequest{10, std::nullopt}), ValidationError);
    EXPECT_THROW(h->add_rule(grr_group()), ValidationError);
    EXPECT_EQ(h->try_start_client(client_id(1)), StartResult::NotRunning);
}

TEST_F(HuntTest, Modify_ExpiryRepublishesRules) {
    auto h = make_hunt();
    h->run();
    advance(platform::MICROS_PER_SECOND);
    h->modify(ModifyRequest{std::nullopt, 3600 * platform::MICROS_PER_SECOND});

    const auto& r = rules_.snapshot()->front();
    EXPECT_EQ(r.created, now_->load());
    EXPECT_EQ(r.expires, now_->load() + 3600 * platform::MICROS_PER_SECOND);
}

TEST_F(HuntTest, Run_HugeExpiry_SaturatesInsteadOfOverflowing) {
    HuntConfig config;
    config.id = "H:00000004";
    config.expiry = platform::parse_duration("106751990d");
    Hunt h(config, dispatcher_, rules_, assignments_, services());
    h.add_rule(grr_group());
    h.run();

    const auto& r = rules_.snapshot()->front();
    EXPECT_EQ(r.expires, std::numeric_limits<Timestamp>::max());
    EXPECT_FALSE(rule::is_expired(r, now_->load()));
    EXPECT_EQ(h.try_start_client(client_id(0)), StartResult::Started);
}

TEST_F(HuntTest, Modify_HugeExpiry_RulesStayActive) {
    auto h = make_hunt();
    h->run();
    h->modify(ModifyRequest{std::nullopt, std::numeric_limits<Timestamp>::max()});

    const auto& r = rules_.snapshot()->front();
    EXPECT_GT(r.expires, r.created);
    EXPECT_FALSE(rule::is_expired(r, now_->load()));
}

TEST_F(HuntTest, Modify_LimitAboveMaximum_Throws) {
    auto h = make_hunt(5);
    EXPECT_THROW(h->modify(ModifyRequest{2000, std::nullopt}), ValidationError);
    EXPECT_THROW(h->modify(ModifyRequest{std::nullopt, 0}), ValidationError);
    EXPECT_EQ(h->client_limit(), 5u);
}

// ==============================================================================
// Dispatch и исходы
// ==============================================================================

TEST_F(HuntTest, Processing_AllClientsReport) {
    auto h = make_hunt();
    h->run();
    for (int i = 0; i < 10; ++i) {
        h->try_start_client(client_id(i));
    }
    auto requests = dispatcher_->drain();
    ASSERT_EQ(requests.size(), 10u);
    EXPECT_EQ(requests.front().hunt_id, h->id());

    for (int i = 0; i < 10; ++i) {
        if (i % 2 == 0) {
            EXPECT_TRUE(h->record_badness(client_id(i)));
        } else {
            EXPECT_TRUE(h->record_success(client_id(i)));
        }
    }

    EXPECT_EQ(h->started_clients().size(), 10u);
    EXPECT_EQ(h->finished_clients().size(), 10u);
    EXPECT_EQ(h->bad_clients().size(), 5u);
    EXPECT_EQ(h->badness_count(), 5u);
    EXPECT_EQ(h->outstanding_requests(), 0u);
    EXPECT_EQ(h->client_status(client_id(0)), ClientStatus::Bad);
    EXPECT_EQ(h->client_status(client_id(1)), ClientStatus::Completed);
}

TEST_F(HuntTest, Processing_HangingClientsStayOutstanding) {
    auto h = make_hunt();
    h->run();
    for (int i = 0; i < 10; ++i) {
        h->try_start_client(client_id(i));
    }
    for (int i = 0; i < 8; ++i) {
        if (i % 2 == 0) {
            h->record_badness(client_id(i));
        } else {
            h->record_success(client_id(i));
        }
    }

    EXPECT_EQ(h->finished_count(), 8u);
    EXPECT_EQ(h->badness_count(), 4u);
    EXPECT_EQ(h->outstanding_requests(), 2u);
    EXPECT_EQ(h->client_status(client_id(9)), ClientStatus::Running);
    EXPECT_EQ(h->client_status("C.unknown"), ClientStatus::Unknown);
}

TEST_F(HuntTest, ClientLimit_CapsStartedClients) {
    auto h = make_hunt(5);
    h->run();
    EXPECT_EQ(rules_.snapshot()->front().action.client_limit, 5u);

    int started = 0;
    for (int i = 0; i < 10; ++i) {
        if (h->try_start_client(client_id(i)) == StartResult::Started) {
            ++started;
        }
    }
    EXPECT_EQ(started, 5);
    EXPECT_EQ(h->try_start_client(client_id(9)), StartResult::LimitReached);

    for (int i = 0; i < 5; ++i) {
        if (i % 2 == 0) {
            h->record_success(client_id(i));
        } else {
            h->record_badness(client_id(i));
        }
    }
    EXPECT_EQ(h->started_count(), 5u);
    EXPECT_EQ(h->finished_count(), 5u);
    EXPECT_EQ(h->badness_count(), 2u);
}

TEST_F(HuntTest, ClientLimit_RaisedLaterAdmitsCappedClients) {
    auto h = make_hunt(2);
    h->run();
    h->try_start_client(client_id(0));
    h->try_start_client(client_id(1));
    EXPECT_EQ(h->try_start_client(client_id(2)), StartResult::LimitReached);
    EXPECT_FALSE(assignments_.contains(h->id(), client_id(2)));

    h->modify(ModifyRequest{3, std::nullopt});
    EXPECT_EQ(h->try_start_client(client_id(2)), StartResult::Started);
    EXPECT_EQ(h->try_start_client(client_id(0)), StartResult::AlreadyAssigned);
}

TEST_F(HuntTest, ClientLimit_ConcurrentStartsNeverExceedLimit) {
    auto h = make_hunt(50);
    h->run();

    std::atomic<int> started{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                if (h->try_start_client(client_id(i)) == StartResult::Started) {
                    ++started;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(started.load(), 50);
    EXPECT_EQ(h->started_count(), 50u);
    EXPECT_EQ(dispatcher_->pending(), 50u);
}

TEST_F(HuntTest, BrokenHunt_ErrorsAreRecorded) {
    auto h = make_hunt();
    h->run();
    for (int i = 0; i < 10; ++i) {
        h->try_start_client(client_id(i));
    }
    for (int i = 0; i < 10; ++i) {
        if (i % 2 == 0) {
            h->record_error(client_id(i), "Task failed", "Traceback...");
        } else {
            h->record_badness(client_id(i));
        }
    }

    EXPECT_EQ(h->errored_count(), 5u);
    EXPECT_EQ(h->errored_clients().size(), 5u);
    EXPECT_EQ(h->finished_count(), 5u);
    EXPECT_EQ(h->badness_count(), 5u);
    EXPECT_EQ(h->outstanding_requests(), 0u);

    auto errors = h->errors();
    ASSERT_EQ(errors.size(), 5u);
    EXPECT_EQ(errors.front().message, "Task failed");
    EXPECT_EQ(errors.front().backtrace, "Traceback...");
    EXPECT_EQ(h->errors(client_id(0)).size(), 1u);
    EXPECT_TRUE(h->errors(client_id(1)).empty());

    // Уведомление на каждый терминальный исход, включая ошибки
    EXPECT_EQ(notifications_.load(), 10);
}

TEST_F(HuntTest, RepeatedOutcome_FirstWins) {
    auto h = make_hunt();
    h->run();
    h->try_start_client(client_id(0));

    EXPECT_TRUE(h->record_success(client_id(0)));
    EXPECT_FALSE(h->record_badness(client_id(0)));
    EXPECT_FALSE(h->record_error(client_id(0), "late"));

    EXPECT_EQ(h->client_status(client_id(0)), ClientStatus::Completed);
    EXPECT_EQ(h->finished_count(), 1u);
    EXPECT_EQ(h->badness_count(), 0u);
    EXPECT_EQ(h->errored_count(), 0u);
    EXPECT_EQ(notifications_.load(), 1);
}

TEST_F(HuntTest, LogClientError_AfterFinish_OnlyJournals) {
    auto h = make_hunt();
    h->run();
    h->try_start_client(client_id(0));
    h->record_success(client_id(0));

    EXPECT_FALSE(h->log_client_error(client_id(0), "post-mortem", "bt"));
    EXPECT_EQ(h->client_status(client_id(0)), ClientStatus::Completed);
    EXPECT_EQ(h->errored_count(), 0u);
    ASSERT_EQ(h->errors(client_id(0)).size(), 1u);

    h->try_start_client(client_id(1));
    EXPECT_TRUE(h->log_client_error(client_id(1), "crash", "bt"));
    EXPECT_EQ(h->client_status(client_id(1)), ClientStatus::Error);
}

TEST_F(HuntTest, DispatchFailure_RecordedAsError) {
    HuntConfig config;
    config.id = "H:00000003";
    Hunt h(config, std::make_shared<FailingDispatcher>(), rules_, assignments_, services());
    h.add_rule(grr_group());
    h.run();

    EXPECT_EQ(h.try_start_client(client_id(0)), StartResult::Started);
    EXPECT_EQ(h.client_status(client_id(0)), ClientStatus::Error);
    auto errors = h.errors(client_id(0));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors.front().message.find("queue unavailable"), std::string::npos);
}

TEST_F(HuntTest, DispatchFailure_NonStandardException_RecordedAsError) {
    HuntConfig config;
    config.id = "H:00000005";
    Hunt h(config, std::make_shared<RawThrowingDispatcher>(), rules_, assignments_, services());
    h.add_rule(grr_group());
    h.run();

    EXPECT_EQ(h.try_start_client(client_id(0)), StartResult::Started);
    EXPECT_EQ(h.client_status(client_id(0)), ClientStatus::Error);
    EXPECT_EQ(h.errored_count(), 1u);
}

TEST_F(HuntTest, ListenerThrowingNonStandardException_DoesNotLoseOutcome) {
    bus_.subscribe("TestHuntDone", [](const HuntEvent&) { throw 7; });
    auto h = make_hunt();
    h->run();
    h->try_start_client(client_id(0));
    h->try_start_client(client_id(1));

    EXPECT_NO_THROW(EXPECT_TRUE(h->record_success(client_id(0))));
    EXPECT_NO_THROW(EXPECT_TRUE(h->record_badness(client_id(1))));
    EXPECT_EQ(h->finished_count(), 2u);
    EXPECT_EQ(notifications_.load(), 2);
}

TEST_F(HuntTest, FailingNotificationSink_DoesNotLoseOutcome) {
    FailingSink sink;
    HuntServices s = services();
    s.notifications = &sink;
    auto h = make_hunt(0, s, false);
    h->run();
    h->try_start_client(client_id(0));

    EXPECT_TRUE(h->record_success(client_id(0)));
    EXPECT_EQ(sink.calls, 1);
    EXPECT_EQ(h->finished_count(), 1u);
}

TEST_F(HuntTest, Outcomes_AreMirroredToStore) {
    auto h = make_hunt();
    h->run();
    for (int i = 0; i < 3; ++i) {
        h->try_start_client(client_id(i));
    }
    h->record_success(client_id(0));
    h->record_badness(client_id(1));
    h->record_error(client_id(2), "boom");

    const std::string urn = hunt_urn(h->id());
    EXPECT_EQ(store_.history(urn, ATTR_CLIENTS).size(), 3u);
    EXPECT_EQ(store_.history(urn, ATTR_FINISHED).size(), 2u);
    ASSERT_EQ(store_.history(urn, ATTR_BADNESS).size(), 1u);
    EXPECT_EQ(store_.history(urn, ATTR_BADNESS).front().value.as_string(), client_id(1));
    ASSERT_EQ(store_.history(urn, ATTR_ERRORS).size(), 1u);
    EXPECT_EQ(store_.history(urn, ATTR_ERRORS).front().value.as_string(), client_id(2));
}

// ==============================================================================
// Результаты задач и журнал
// ==============================================================================

TEST_F(HuntTest, ProcessResult_CollectsUsageStats) {
    auto h = make_hunt();
    h->run();
    for (int i = 0; i < 3; ++i) {
        h->try_start_client(client_id(i));

        TaskResult result;
        result.hunt_id = h->id();
        result.client_id = client_id(i);
        result.task_id = "flow" + std::to_string(i);
        result.outcome = Success{};
        stats::ResourceSample usage;
        usage.user_cpu_time = 1.0 + i;
        usage.system_cpu_time = 0.5;
        usage.network_bytes_sent = 1024;
        result.usage = usage;
        EXPECT_TRUE(h->process_result(result));
    }

    auto snap = h->usage_stats();
    EXPECT_EQ(snap.user_cpu.num, 3u);
    EXPECT_NEAR(snap.user_cpu.mean, 2.0, 1e-9);
    ASSERT_EQ(snap.worst_performers.size(), 3u);
    EXPECT_EQ(snap.worst_performers.front().client_id, client_id(2));
    EXPECT_EQ(snap.worst_performers.front().task_id, "flow2");

    auto per_client = std::get<stats::PerClientUsage>(h->get_resource_usage(std::nullopt, true));
    EXPECT_NEAR(per_client.at(client_id(1)).user, 2.0, 1e-9);
}

TEST_F(HuntTest, ProcessResult_DuplicateResult_CountsUsageOnce) {
    auto h = make_hunt();
    h->run();
    h->try_start_client(client_id(0));

    TaskResult result;
    result.hunt_id = h->id();
    result.client_id = client_id(0);
    result.task_id = "flow0";
    result.outcome = Success{};
    stats::ResourceSample usage;
    usage.user_cpu_time = 2.0;
    usage.system_cpu_time = 1.0;
    result.usage = usage;

    EXPECT_TRUE(h->process_result(result));
    EXPECT_FALSE(h->process_result(result));

    auto snap = h->usage_stats();
    EXPECT_EQ(snap.user_cpu.num, 1u);
    EXPECT_NEAR(snap.user_cpu.mean, 2.0, 1e-9);
    EXPECT_EQ(snap.worst_performers.size(), 1u);
    EXPECT_EQ(h->finished_count(), 1u);
}

TEST_F(HuntTest, ProcessResult_WrongHunt_Throws) {
    auto h = make_hunt();
    TaskResult result;
    result.hunt_id = "H:other";
    result.client_id = client_id(0);
    EXPECT_THROW(h->process_result(result), ValidationError);
}

TEST_F(HuntTest, Logs_OrderedByTimestamp) {
    auto h = make_hunt();
    h->log_result(client_id(1), "second client first");
    advance(10);
    h->log_result(client_id(0), "first client later");

    auto logs = h->logs();
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].message, "second client first");
    EXPECT_EQ(logs[1].client_id, client_id(0));
    EXPECT_EQ(h->logs(client_id(0)).size(), 1u);
}

TEST_F(HuntTest, Summary_JsonHasCounters) {
    auto h = make_hunt(5);
    h->run();
    h->try_start_client(client_id(0));
    h->try_start_client(client_id(1));
    h->record_badness(client_id(0));

    HuntSummary s = h->summary();
    EXPECT_EQ(s.started, 2u);
    EXPECT_EQ(s.finished, 1u);
    EXPECT_EQ(s.outstanding, 1u);

    rapidjson::Document doc;
    const std::string json = s.to_json();
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["id"].GetString(), "H:00000001");
    EXPECT_STREQ(doc["state"].GetString(), "RUNNING");
    EXPECT_EQ(doc["client_limit"].GetUint(), 5u);
    EXPECT_EQ(doc["badness"].GetUint64(), 1u);
    EXPECT_TRUE(doc["user_cpu"]["histogram"].IsArray());
}

// ==============================================================================
// Approval
// ==============================================================================

TEST_F(HuntTest, ApprovalGate_BlocksUnapprovedRun) {
    approval::ApprovalGate gate;
    HuntServices s = services();
    s.approvals = &gate;
    auto h = make_hunt(0, s, false);

    const approval::Token alice{"alice", false};
    EXPECT_THROW(h->run(), AuthorizationError);
    EXPECT_THROW(h->run(&alice), AuthorizationError);
    EXPECT_EQ(rules_.size(), 0u);

    gate.request(h->id(), "alice", "bob", "incident 42");
    EXPECT_THROW(h->run(&alice), AuthorizationError);

    gate.grant(h->id(), "bob", "alice", "incident 42");
    EXPECT_NO_THROW(h->run(&alice));
    EXPECT_EQ(h->state(), HuntState::Running);
}

TEST_F(HuntTest, ApprovalGate_SupervisorOverrides) {
    approval::ApprovalGate gate;
    HuntServices s = services();
    s.approvals = &gate;
    auto h = make_hunt(0, s, false);

    const approval::Token admin{"admin", true};
    EXPECT_NO_THROW(h->run(&admin));
    EXPECT_NO_THROW(h->modify(ModifyRequest{10, std::nullopt}, &admin));
    EXPECT_NO_THROW(h->stop(&admin));
}

TEST_F(HuntTest, ApprovalGate_CoversOnlyApprovedActions) {
    approval::ApprovalGate gate;
    HuntServices s = services();
    s.approvals = &gate;
    auto h = make_hunt(0, s, false);

    gate.request(h->id(), "alice", "bob", "run only", {approval::ProtectedAction::Run});
    gate.grant(h->id(), "bob", "alice", "run only");

    const approval::Token alice{"alice", false};
    EXPECT_NO_THROW(h->run(&alice));
    EXPECT_THROW(h->stop(&alice), AuthorizationError);
    EXPECT_EQ(h->state(), HuntState::Running);
}

// ==============================================================================
// HuntRegistry
// ==============================================================================

TEST_F(HuntTest, Registry_AddFindRemove) {
    HuntRegistry registry;
    std::shared_ptr<Hunt> h = make_hunt();
    registry.add(h);

    EXPECT_EQ(registry.find("H:00000001"), h);
    EXPECT_EQ(registry.find("H:missing"), nullptr);
    EXPECT_THROW(registry.add(h), ValidationError);
    EXPECT_THROW(registry.add(nullptr), ValidationError);
    EXPECT_EQ(registry.all().size(), 1u);
    EXPECT_TRUE(registry.remove("H:00000001"));
    EXPECT_EQ(registry.size(), 0u);
}

}  // namespace fleethunt::hunt::test
