// Copyright (c) 2024-2025 Grigoryev Vyacheslav Vladimirovich
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of
// this software and associated documentation files (the "Software"), to deal in
// the Software without restriction, including without limitation the rights to
// use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of
// the Software, and to permit persons to whom the Software is furnished to do so,
// subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
// FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR
// COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER
// IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
// CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#pragma once

#include "interceptor_types.h"
#include "report_catcher.h"

#include <cstddef>
#include <cstdint>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

namespace diag_interceptor {

// Counters of reports suppressed (caught) or downgraded (demoted) by catchers. Reports are
// accounted by their severity at the moment they entered the chain. Only warnings and more severe
// reports are accounted.
class catcher_stats {
public:
    catcher_stats() = default;

    catcher_stats(const catcher_stats&) = delete;
    catcher_stats& operator=(const catcher_stats&) = delete;

    void count_demoted(severity original);
    void count_caught(severity original);

    unsigned long get_demoted(severity original) const;
    unsigned long get_caught(severity original) const;

    void reset();

    // A fixed-order text block: demoted fatal, error, warning then caught fatal, error, warning
    std::string format() const;

private:
    static constexpr std::size_t bucket_count = (std::size_t)severity::total_count;

    mutable std::mutex m_mutex;
    unsigned long m_demoted[bucket_count] = {};
    unsigned long m_caught[bucket_count] = {};
};

// The state shared by all the catchers during one chain pass. A catcher sees and changes the report
// being processed only via this object. Mutators are allowed during a pass only, accessors outside
// of a pass return the values the last pass committed.
class catcher_context {
public:
    explicit catcher_context(catcher_stats& stats) noexcept
        : m_stats(stats) {
    }

    catcher_context(const catcher_context&) = delete;
    catcher_context& operator=(const catcher_context&) = delete;

    bool is_active() const noexcept { return m_message != nullptr; }

    // The catcher being called currently, nullptr outside of a pass
    const report_catcher* get_catcher() const noexcept { return m_catcher; }

    severity get_severity() const noexcept { return current().m_severity; }
    int get_verbosity() const noexcept { return current().m_verbosity; }
    const std::string& get_id() const noexcept { return current().m_id; }
    const std::string& get_message() const noexcept { return current().m_message; }
    action_mask get_action() const noexcept { return current().m_action; }
    const std::string& get_context() const noexcept { return current().m_context; }
    const std::string& get_fname() const noexcept { return current().m_fname; }
    int get_line() const noexcept { return current().m_line; }
    const report_object* get_owner() const noexcept { return current().m_owner; }
    const std::vector<message_attribute>& get_attributes() const noexcept {
        return current().m_attributes;
    }
    const report_message& get_report() const noexcept { return current(); }

    void set_severity(severity sev) { writable().m_severity = sev; }
    void set_verbosity(int verbosity) { writable().m_verbosity = verbosity; }
    void set_id(std::string id) { writable().m_id = std::move(id); }
    void set_message(std::string text) { writable().m_message = std::move(text); }
    void set_context(std::string context) { writable().m_context = std::move(context); }

    // An action set explicitly is kept as is even if the catcher changes the severity too
    void set_action(action_mask act) {
        writable().m_action = act;
        m_action_set = true;
    }

    void add_int(std::string name, std::int64_t value) {
        writable().m_attributes.push_back({std::move(name), value});
    }
    void add_string(std::string name, std::string value) {
        writable().m_attributes.push_back({std::move(name), std::move(value)});
    }
    void add_object(std::string name, const report_object* obj) {
        writable().m_attributes.push_back({std::move(name), obj});
    }

    const catcher_stats& stats() const noexcept { return m_stats; }

private:
    friend class catcher_executor;
    class pass_scope;

    catcher_stats& m_stats;
    report_message* m_message = nullptr;
    const report_catcher* m_catcher = nullptr;
    report_message m_last_committed;

    // Present during a pass run with 'discard_mutations' debug flag only
    std::optional<report_message> m_pristine;
    bool m_action_set = false;
    bool m_in_pass = false;

    const report_message& current() const noexcept {
        return m_message ? *m_message : m_last_committed;
    }

    report_message& writable() {
        if (! m_message)
            throw std::logic_error("a report can be changed only by a catcher during a chain pass");
        return *m_message;
    }
};

// Runs reports through the catchers of a registry. One executor serves one emission subsystem
// and owns the only context shared by all the passes. Passes are serialized: a report issued from
// another thread waits while a pass is in progress, but a report issued by a catcher itself (from
// the thread running a pass) bypasses the chain entirely and is considered not caught.
class catcher_executor {
public:
    catcher_executor(catcher_registry& registry, report_emitter& emitter, catcher_stats& stats);

    catcher_executor(const catcher_executor&) = delete;
    catcher_executor& operator=(const catcher_executor&) = delete;

    // Returns true if some catcher caught the report, a caller must not emit it in this case. The
    // report can be changed by catchers in any case. Exceptions thrown by catchers are propagated.
    bool process(report_message& msg);

    // A bitmask of catcher_debug values. It's read at the beginning of every pass.
    void set_debug_flags(std::uint32_t flags) noexcept {
        m_debug_flags.store(flags, std::memory_order_relaxed);
    }
    std::uint32_t get_debug_flags() const noexcept {
        return m_debug_flags.load(std::memory_order_relaxed);
    }

    // Emits the counters as an info report with reserved id directly via the emitter. If 'sink' is
    // provided, the report is logged into it regardless of the configured action and destination
    // for the id; the configuration is restored afterwards.
    void summarize(std::ostream* sink = nullptr);

    const catcher_context& context() const noexcept { return m_context; }
    catcher_stats& stats() noexcept { return m_stats; }

private:
    catcher_registry& m_registry;
    report_emitter& m_emitter;
    catcher_stats& m_stats;

    std::recursive_mutex m_mutex;
    catcher_context m_context;
    std::atomic<std::uint32_t> m_debug_flags{0};

    void report_invalid_verdict(const report_catcher& c, catch_verdict v);
};

} // ns diag_interceptor
