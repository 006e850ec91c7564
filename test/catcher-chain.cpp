#include "interceptor_types.h"
#include "report_catcher.h"
#include "catcher_executor.h"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace ::diag_interceptor;

class report_emitter_mock : public report_emitter {
public:
    MOCK_METHOD(action_mask, default_action, (severity, std::string_view), (const, override));
    MOCK_METHOD(bool, is_emission_enabled, (int, severity, std::string_view), (const, override));
    MOCK_METHOD(std::string, compose_text, (const report_message&), (const, override));
    MOCK_METHOD(void, execute, (const report_message&, const std::string&), (override));
    MOCK_METHOD(id_override_token, override_id, (std::string_view, action_mask, std::ostream*), (override));
    MOCK_METHOD(void, restore_id, (id_override_token), (noexcept, override));
};

action_mask category_action(severity sev) {
    switch (sev) {
    case severity::info: return (action_mask)action::display;
    case severity::warning: return (action_mask)action::display;
    case severity::error: return action::display | action::count;
    case severity::fatal: return action::display | action::exit;
    default: return (action_mask)action::none;
    }
}

class CatcherChain : public ::testing::Test {
protected:
    ::testing::NiceMock<report_emitter_mock> m_emitter;
    catcher_registry m_registry;
    catcher_stats m_stats;
    catcher_executor m_executor{m_registry, m_emitter, m_stats};

    void SetUp() override {
        using namespace ::testing;

        ON_CALL(m_emitter, default_action).WillByDefault(
            [](severity sev, std::string_view) { return category_action(sev); });
        ON_CALL(m_emitter, is_emission_enabled).WillByDefault(Return(true));
        ON_CALL(m_emitter, compose_text).WillByDefault(
            [](const report_message& m) { return m.m_id + ": " + m.m_message; });
    }

    static report_message make_message(severity sev, std::string id = "TEST/ID") {
        report_message m;
        m.m_severity = sev;
        m.m_id = std::move(id);
        m.m_message = "original text";
        m.m_action = category_action(sev);
        m.m_fname = "chain.cpp";
        m.m_line = 42;
        return m;
    }

    report_catcher& add_returning(std::string name, catch_verdict v, int* calls = nullptr) {
        return m_registry.add(std::move(name), [v, calls](catcher_context&) {
            if (calls)
                ++*calls;
            return v;
        });
    }

    void expect_no_counters() {
        for (auto sev : {severity::fatal, severity::error, severity::warning}) {
            EXPECT_EQ(m_stats.get_demoted(sev), 0u) << sev;
            EXPECT_EQ(m_stats.get_caught(sev), 0u) << sev;
        }
    }
};

TEST_F(CatcherChain, EmptyRegistryLeavesReportIntact) {
    auto msg = make_message(severity::error);
    msg.m_attributes.push_back({"count", std::int64_t{3}});
    const auto orig = msg;

    EXPECT_FALSE(m_executor.process(msg));
    EXPECT_EQ(msg, orig);
    expect_no_counters();
}

TEST_F(CatcherChain, CaughtStopsChain) {
    int calls[3] = {};
    add_returning("first", catch_verdict::rethrow, &calls[0]);
    add_returning("second", catch_verdict::caught, &calls[1]);
    add_returning("third", catch_verdict::rethrow, &calls[2]);

    auto msg = make_message(severity::warning);
    EXPECT_TRUE(m_executor.process(msg));

    EXPECT_EQ(calls[0], 1);
    EXPECT_EQ(calls[1], 1);
    EXPECT_EQ(calls[2], 0);
    EXPECT_EQ(m_stats.get_caught(severity::warning), 1u);
    EXPECT_EQ(m_stats.get_demoted(severity::warning), 0u);
}

TEST_F(CatcherChain, IgnoreCatchRunsWholeChain) {
    int calls[3] = {};
    add_returning("first", catch_verdict::caught, &calls[0]);
    add_returning("second", catch_verdict::caught, &calls[1]);
    add_returning("third", catch_verdict::rethrow, &calls[2]);

    m_executor.set_debug_flags((std::uint32_t)catcher_debug::ignore_catch);

    auto msg = make_message(severity::error);
    EXPECT_FALSE(m_executor.process(msg));

    EXPECT_EQ(calls[0], 1);
    EXPECT_EQ(calls[1], 1);
    EXPECT_EQ(calls[2], 1);
    expect_no_counters();
}

TEST_F(CatcherChain, DiscardMutationsRevertsEveryChange) {
    report_object obj{"top"};
    std::vector<report_message> seen;

    m_registry.add("mutator", [&obj](catcher_context& ctx) {
        ctx.set_severity(severity::info);
        ctx.set_id("CHANGED");
        ctx.set_message("changed text");
        ctx.set_verbosity(verbosity_debug);
        ctx.set_context("somewhere");
        ctx.set_action((action_mask)action::none);
        ctx.add_int("n", 1);
        ctx.add_string("s", "v");
        ctx.add_object("o", &obj);
        return catch_verdict::rethrow;
    });
    m_registry.add("observer", [&seen](catcher_context& ctx) {
        seen.push_back(ctx.get_report());
        ctx.set_message("changed again");
        return catch_verdict::caught;
    });

    m_executor.set_debug_flags((std::uint32_t)catcher_debug::discard_mutations);

    auto msg = make_message(severity::fatal);
    const auto orig = msg;

    // The decision stands even though the changes made along with it are dropped
    EXPECT_TRUE(m_executor.process(msg));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], orig);
    EXPECT_EQ(msg, orig);
    EXPECT_EQ(m_stats.get_caught(severity::fatal), 1u);
    EXPECT_EQ(m_stats.get_demoted(severity::fatal), 0u);
}

TEST_F(CatcherChain, MutationsAreVisibleToFollowingCatchers) {
    m_registry.add("writer", [](catcher_context& ctx) {
        ctx.set_id("NEW/ID");
        ctx.set_message("rewritten");
        ctx.add_int("attempt", 2);
        return catch_verdict::rethrow;
    });

    std::string seen_id, seen_text;
    std::size_t seen_attrs = 0;
    m_registry.add("reader", [&](catcher_context& ctx) {
        seen_id = ctx.get_id();
        seen_text = ctx.get_message();
        seen_attrs = ctx.get_attributes().size();
        EXPECT_EQ(ctx.get_fname(), "chain.cpp");
        EXPECT_EQ(ctx.get_line(), 42);
        EXPECT_TRUE(ctx.is_active());
        EXPECT_NE(ctx.get_catcher(), nullptr);
        return catch_verdict::rethrow;
    });

    auto msg = make_message(severity::info);
    EXPECT_FALSE(m_executor.process(msg));

    EXPECT_EQ(seen_id, "NEW/ID");
    EXPECT_EQ(seen_text, "rewritten");
    EXPECT_EQ(seen_attrs, 1u);
    EXPECT_EQ(msg.m_id, "NEW/ID");
    ASSERT_EQ(msg.m_attributes.size(), 1u);
    EXPECT_EQ(msg.m_attributes[0], (message_attribute{"attempt", std::int64_t{2}}));
}

TEST_F(CatcherChain, DemotionIsCountedAndActionFollowsSeverity) {
    m_registry.add("demoter", [](catcher_context& ctx) {
        ctx.set_severity(severity::warning);
        return catch_verdict::rethrow;
    });

    auto msg = make_message(severity::fatal);
    EXPECT_FALSE(m_executor.process(msg));

    EXPECT_EQ(msg.m_severity, severity::warning);
    EXPECT_EQ(msg.m_action, category_action(severity::warning));
    EXPECT_EQ(m_stats.get_demoted(severity::fatal), 1u);
    EXPECT_EQ(m_stats.get_caught(severity::fatal), 0u);
    EXPECT_EQ(m_stats.get_demoted(severity::warning), 0u);
}

TEST_F(CatcherChain, ExplicitActionSurvivesSeverityChange) {
    m_registry.add("demoter", [](catcher_context& ctx) {
        ctx.set_severity(severity::info);
        ctx.set_action((action_mask)action::log);
        return catch_verdict::rethrow;
    });

    auto msg = make_message(severity::error);
    EXPECT_FALSE(m_executor.process(msg));

    EXPECT_EQ(msg.m_action, (action_mask)action::log);
    EXPECT_EQ(m_stats.get_demoted(severity::error), 1u);
}

TEST_F(CatcherChain, CustomActionIsNotRecomputed) {
    m_registry.add("demoter", [](catcher_context& ctx) {
        ctx.set_severity(severity::warning);
        return catch_verdict::rethrow;
    });

    auto msg = make_message(severity::error);
    msg.m_action = action::display | action::log;
    EXPECT_FALSE(m_executor.process(msg));

    EXPECT_EQ(msg.m_action, action::display | action::log);
}

TEST_F(CatcherChain, ActionRecomputationUsesSeverityCategory) {
    using namespace ::testing;

    m_registry.add("promoter", [](catcher_context& ctx) {
        ctx.set_severity(severity::error);
        return catch_verdict::rethrow;
    });

    EXPECT_CALL(m_emitter, default_action(_, Ne(severity_category_key))).Times(0);
    EXPECT_CALL(m_emitter, default_action(severity::warning, Eq(severity_category_key))).Times(1);
    EXPECT_CALL(m_emitter, default_action(severity::error, Eq(severity_category_key))).Times(1);

    auto msg = make_message(severity::warning);
    EXPECT_FALSE(m_executor.process(msg));
    EXPECT_EQ(msg.m_action, category_action(severity::error));
    expect_no_counters();
}

TEST_F(CatcherChain, CaughtIsCountedByOriginalSeverity) {
    m_registry.add("promote and catch", [](catcher_context& ctx) {
        ctx.set_severity(severity::fatal);
        return catch_verdict::caught;
    });

    auto msg = make_message(severity::error);
    EXPECT_TRUE(m_executor.process(msg));

    EXPECT_EQ(m_stats.get_caught(severity::error), 1u);
    EXPECT_EQ(m_stats.get_caught(severity::fatal), 0u);
    EXPECT_EQ(m_stats.get_demoted(severity::error), 0u);
}

TEST_F(CatcherChain, CaughtAfterDemotionCountsBoth) {
    m_registry.add("demote and catch", [](catcher_context& ctx) {
        ctx.set_severity(severity::info);
        return catch_verdict::caught;
    });

    auto msg = make_message(severity::error);
    EXPECT_TRUE(m_executor.process(msg));

    EXPECT_EQ(m_stats.get_caught(severity::error), 1u);
    EXPECT_EQ(m_stats.get_demoted(severity::error), 1u);
}

TEST_F(CatcherChain, InfoReportsAreNotAccounted) {
    add_returning("catcher", catch_verdict::caught);

    auto msg = make_message(severity::info);
    EXPECT_TRUE(m_executor.process(msg));
    expect_no_counters();
}

TEST_F(CatcherChain, DisabledCatcherIsSkipped) {
    int disabled_calls = 0, enabled_calls = 0;

    auto& disabled = m_registry.add("disabled", [&disabled_calls](catcher_context& ctx) {
        ++disabled_calls;
        ctx.set_severity(severity::info);
        return catch_verdict::caught;
    });
    add_returning("enabled", catch_verdict::rethrow, &enabled_calls);
    disabled.set_enabled(false);

    auto msg = make_message(severity::error);
    const auto orig = msg;
    EXPECT_FALSE(m_executor.process(msg));

    EXPECT_EQ(disabled_calls, 0);
    EXPECT_EQ(enabled_calls, 1);
    EXPECT_EQ(msg, orig);
    expect_no_counters();

    // Re-enabling keeps the original position - the catcher is the first one again
    disabled.set_enabled();
    msg = orig;
    EXPECT_TRUE(m_executor.process(msg));
    EXPECT_EQ(disabled_calls, 1);
    EXPECT_EQ(enabled_calls, 1);
}

TEST_F(CatcherChain, NestedReportBypassesChain) {
    int calls = 0;
    bool nested_caught = true;

    m_registry.add("reentering", [this, &calls, &nested_caught](catcher_context&) {
        ++calls;
        auto nested = make_message(severity::error, "NESTED");
        const auto orig = nested;
        nested_caught = m_executor.process(nested);
        EXPECT_EQ(nested, orig);
        return catch_verdict::caught;
    });

    auto msg = make_message(severity::warning);
    EXPECT_TRUE(m_executor.process(msg));

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(nested_caught);
    EXPECT_EQ(m_stats.get_caught(severity::warning), 1u);
    EXPECT_EQ(m_stats.get_caught(severity::error), 0u);
}

TEST_F(CatcherChain, InvalidVerdictIsReportedOnce) {
    using namespace ::testing;

    int next_calls = 0;
    add_returning("broken", static_cast<catch_verdict>(7));
    add_returning("next", catch_verdict::rethrow, &next_calls);

    EXPECT_CALL(m_emitter, execute(
        AllOf(
            Field(&report_message::m_id, std::string{invalid_verdict_id}),
            Field(&report_message::m_severity, severity::error),
            Field(&report_message::m_action, (action_mask)action::display),
            Field(&report_message::m_message, HasSubstr("'broken'"))),
        _)).Times(1);

    auto msg = make_message(severity::warning);
    EXPECT_FALSE(m_executor.process(msg));
    EXPECT_EQ(next_calls, 1);
    expect_no_counters();
}

TEST_F(CatcherChain, CatcherExceptionAbortsPass) {
    int after_calls = 0;
    auto& thrower = m_registry.add("thrower", [](catcher_context& ctx) -> catch_verdict {
        ctx.set_severity(severity::info);
        throw std::runtime_error("catcher failure");
    });
    add_returning("after", catch_verdict::rethrow, &after_calls);
    m_registry.set_trace(true);

    auto msg = make_message(severity::error);
    EXPECT_THROW(m_executor.process(msg), std::runtime_error);
    EXPECT_EQ(after_calls, 0);
    expect_no_counters();
    EXPECT_FALSE(m_executor.context().is_active());
    EXPECT_TRUE(m_registry.is_trace_enabled());

    // The executor is usable after the failure
    thrower.set_enabled(false);
    msg = make_message(severity::error);
    EXPECT_FALSE(m_executor.process(msg));
    EXPECT_EQ(after_calls, 1);
    m_registry.set_trace(false);
}

TEST_F(CatcherChain, RegistryTraceIsSuppressedDuringPass) {
    m_registry.set_trace(true);

    bool trace_in_pass = true;
    m_registry.add("observer", [this, &trace_in_pass](catcher_context&) {
        trace_in_pass = m_registry.is_trace_enabled();
        return catch_verdict::rethrow;
    });

    auto msg = make_message(severity::info);
    m_executor.process(msg);

    EXPECT_FALSE(trace_in_pass);
    EXPECT_TRUE(m_registry.is_trace_enabled());
    m_registry.set_trace(false);
}

TEST_F(CatcherChain, CatchersAreSelectedByOwner) {
    report_object a{"a"}, b{"b"};
    std::vector<std::string> order;

    auto recorder = [&order](std::string name) {
        return [&order, name](catcher_context&) {
            order.push_back(name);
            return catch_verdict::rethrow;
        };
    };

    m_registry.add("for a", recorder("for a"), &a);
    m_registry.add("for all", recorder("for all"));
    m_registry.add("for b", recorder("for b"), &b);

    auto msg = make_message(severity::info);
    msg.m_owner = &b;
    m_executor.process(msg);
    EXPECT_EQ(order, (std::vector<std::string>{"for all", "for b"}));

    order.clear();
    msg.m_owner = &a;
    m_executor.process(msg);
    EXPECT_EQ(order, (std::vector<std::string>{"for a", "for all"}));

    order.clear();
    msg.m_owner = nullptr;
    m_executor.process(msg);
    EXPECT_EQ(order, (std::vector<std::string>{"for all"}));
}

TEST_F(CatcherChain, ContextOutsideOfPass) {
    catcher_context ctx{m_stats};
    EXPECT_FALSE(ctx.is_active());
    EXPECT_THROW(ctx.set_severity(severity::fatal), std::logic_error);
    EXPECT_THROW(ctx.set_action((action_mask)action::log), std::logic_error);
    EXPECT_THROW(ctx.add_int("n", 1), std::logic_error);

    m_registry.add("rewriter", [](catcher_context& ctx) {
        ctx.set_message("committed");
        return catch_verdict::rethrow;
    });

    auto msg = make_message(severity::warning);
    m_executor.process(msg);

    EXPECT_FALSE(m_executor.context().is_active());
    EXPECT_EQ(m_executor.context().get_message(), "committed");
    EXPECT_EQ(m_executor.context().get_severity(), severity::warning);
}

TEST_F(CatcherChain, PassesAreSerializedBetweenThreads) {
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    m_registry.add("slow", [&](catcher_context&) {
        int now = in_flight.fetch_add(1) + 1;
        int prev = max_in_flight.load();
        while (prev < now && ! max_in_flight.compare_exchange_weak(prev, now))
            ;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        in_flight.fetch_sub(1);
        return catch_verdict::caught;
    });

    auto worker = [this] {
        for (int i = 0; i < 20; ++i) {
            auto msg = make_message(severity::warning);
            EXPECT_TRUE(m_executor.process(msg));
        }
    };

    std::thread t1{worker}, t2{worker};
    t1.join();
    t2.join();

    EXPECT_EQ(max_in_flight.load(), 1);
    EXPECT_EQ(m_stats.get_caught(severity::warning), 40u);
}

TEST_F(CatcherChain, SummaryIsRedirectedAndRestored) {
    using namespace ::testing;

    std::ostringstream sink;
    report_emitter::id_override_token token;
    token.m_id = catcher_summary_id;

    {
        InSequence seq;
        EXPECT_CALL(m_emitter, override_id(Eq(catcher_summary_id), (action_mask)action::log,
            static_cast<std::ostream*>(&sink)))
            .WillOnce(Return(token));
        EXPECT_CALL(m_emitter, execute(
            AllOf(
                Field(&report_message::m_id, std::string{catcher_summary_id}),
                Field(&report_message::m_severity, severity::info),
                Field(&report_message::m_message, HasSubstr("Number of caught ERROR reports"))),
            _));
        EXPECT_CALL(m_emitter, restore_id(Field(&report_emitter::id_override_token::m_id,
            std::string{catcher_summary_id})));
    }

    m_executor.summarize(&sink);
}

TEST_F(CatcherChain, SummaryRestoresRedirectionOnFailure) {
    using namespace ::testing;

    std::ostringstream sink;
    EXPECT_CALL(m_emitter, override_id).WillOnce(Return(report_emitter::id_override_token{}));
    EXPECT_CALL(m_emitter, execute).WillOnce(Throw(std::runtime_error("sink failure")));
    EXPECT_CALL(m_emitter, restore_id).Times(1);

    EXPECT_THROW(m_executor.summarize(&sink), std::runtime_error);
}

TEST(CatcherStats, FormatAndReset) {
    catcher_stats stats;
    stats.count_demoted(severity::fatal);
    stats.count_demoted(severity::warning);
    stats.count_demoted(severity::warning);
    stats.count_caught(severity::error);
    stats.count_caught(severity::info);

    EXPECT_EQ(stats.format(),
        "\n--- Report catcher summary ---\n\n"
        "Number of demoted FATAL reports  :    1\n"
        "Number of demoted ERROR reports  :    0\n"
        "Number of demoted WARNING reports:    2\n"
        "Number of caught FATAL reports   :    0\n"
        "Number of caught ERROR reports   :    1\n"
        "Number of caught WARNING reports :    0\n");
    EXPECT_EQ(stats.get_caught(severity::info), 0u);

    stats.reset();
    EXPECT_EQ(stats.get_demoted(severity::fatal), 0u);
    EXPECT_EQ(stats.get_demoted(severity::warning), 0u);
    EXPECT_EQ(stats.get_caught(severity::error), 0u);
}

TEST(CatcherRegistry, LookupByName) {
    catcher_registry reg;
    auto verdict = [](catcher_context&) { return catch_verdict::rethrow; };

    auto& first = reg.add("dup", verdict);
    reg.add("unique", verdict);
    auto& second = reg.add("dup", verdict);

    EXPECT_EQ(reg.size(), 3u);
    EXPECT_EQ(reg.find("dup"), &first);
    EXPECT_EQ(reg.find("missing"), nullptr);
    EXPECT_EQ(reg.find_all("dup"), (std::vector<report_catcher*>{&first, &second}));
    EXPECT_TRUE(reg.find_all("missing").empty());

    EXPECT_THROW(reg.add(std::unique_ptr<report_catcher>{}), std::logic_error);
}

} // anonymous ns
