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

#include "catcher_executor.h"
#include "utils.h"

#include <cstdio>
#include <algorithm>
#include <iterator>
#include <sstream>

#define TRACE_EXECUTOR_ERROR() TRACE_ERROR() << "catcher_executor(" << (void*)this << ") "

namespace diag_interceptor {

void catcher_stats::count_demoted(severity original) {
    if (original < severity::warning || original >= severity::total_count)
        return;
    std::lock_guard l{m_mutex};
    ++m_demoted[(std::size_t)original];
}

void catcher_stats::count_caught(severity original) {
    if (original < severity::warning || original >= severity::total_count)
        return;
    std::lock_guard l{m_mutex};
    ++m_caught[(std::size_t)original];
}

unsigned long catcher_stats::get_demoted(severity original) const {
    if (original >= severity::total_count)
        return 0;
    std::lock_guard l{m_mutex};
    return m_demoted[(std::size_t)original];
}

unsigned long catcher_stats::get_caught(severity original) const {
    if (original >= severity::total_count)
        return 0;
    std::lock_guard l{m_mutex};
    return m_caught[(std::size_t)original];
}

void catcher_stats::reset() {
    std::lock_guard l{m_mutex};
    std::fill(std::begin(m_demoted), std::end(m_demoted), 0);
    std::fill(std::begin(m_caught), std::end(m_caught), 0);
}

std::string catcher_stats::format() const {
    unsigned long demoted[bucket_count], caught[bucket_count];
    {
        std::lock_guard l{m_mutex};
        std::copy(std::begin(m_demoted), std::end(m_demoted), demoted);
        std::copy(std::begin(m_caught), std::end(m_caught), caught);
    }

    const struct {
        const char* m_label;
        const unsigned long* m_counters;
        severity m_severity;
    } lines[] = {
        {"Number of demoted FATAL reports  :", demoted, severity::fatal},
        {"Number of demoted ERROR reports  :", demoted, severity::error},
        {"Number of demoted WARNING reports:", demoted, severity::warning},
        {"Number of caught FATAL reports   :", caught, severity::fatal},
        {"Number of caught ERROR reports   :", caught, severity::error},
        {"Number of caught WARNING reports :", caught, severity::warning}
    };

    std::ostringstream os;
    os << "\n--- Report catcher summary ---\n\n";
    for (const auto& l : lines) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%5lu", l.m_counters[(std::size_t)l.m_severity]);
        os << l.m_label << buf << '\n';
    }
    return os.str();
}

// Marks the context as busy by a pass and switches registry tracing off. Everything is restored on
// leaving a pass by any way including exceptions thrown by catchers.
class catcher_context::pass_scope final {
public:
    pass_scope(catcher_context& ctx, catcher_registry& registry) noexcept
        : m_ctx(ctx), m_registry(registry), m_trace_was_on(registry.is_trace_enabled()) {
        m_ctx.m_in_pass = true;
        m_registry.set_trace(false);
    }

    pass_scope(const pass_scope&) = delete;
    pass_scope& operator=(const pass_scope&) = delete;

    ~pass_scope() {
        m_ctx.m_message = nullptr;
        m_ctx.m_catcher = nullptr;
        m_ctx.m_pristine.reset();
        m_ctx.m_action_set = false;
        m_ctx.m_in_pass = false;
        m_registry.set_trace(m_trace_was_on);
    }

private:
    catcher_context& m_ctx;
    catcher_registry& m_registry;
    const bool m_trace_was_on;
};

catcher_executor::catcher_executor(
        catcher_registry& registry, report_emitter& emitter, catcher_stats& stats)
    : m_registry(registry)
    , m_emitter(emitter)
    , m_stats(stats)
    , m_context(stats) {
}

bool catcher_executor::process(report_message& msg) {
    std::lock_guard l{m_mutex};

    // The only way to get here with the context being busy is a report issued by a catcher
    if (m_context.m_in_pass)
        return false;

    catcher_context::pass_scope scope{m_context, m_registry};

    const std::uint32_t flags = get_debug_flags();
    const bool ignore_catch = flags & (std::uint32_t)catcher_debug::ignore_catch;
    const bool discard_mutations = flags & (std::uint32_t)catcher_debug::discard_mutations;

    const severity original_severity = msg.m_severity;
    m_context.m_message = &msg;
    if (discard_mutations)
        m_context.m_pristine = msg;

    bool caught = false;

    // Catchers registered during the pass are not called until the next one
    const std::size_t count = m_registry.size();
    for (std::size_t i = 0; i < count; ++i) {
        const auto& e = m_registry[i];
        if (! catcher_registry::applies_to(e, msg.m_owner) || ! e.m_catcher->is_enabled())
            continue;

        report_catcher& c = *e.m_catcher;
        const severity prev_severity = msg.m_severity;
        m_context.m_action_set = false;
        m_context.m_catcher = &c;

        catch_verdict v = c.on_message(m_context);
        if (v != catch_verdict::rethrow && v != catch_verdict::caught) {
            report_invalid_verdict(c, v);
            v = catch_verdict::rethrow;
        }

        if (discard_mutations)
            msg = *m_context.m_pristine;

        // Keep the action consistent with a new severity unless the catcher chose the action itself
        // or the action differs from the default one of the former severity category already.
        if (! m_context.m_action_set
            && msg.m_severity != prev_severity
            && msg.m_action == m_emitter.default_action(prev_severity, severity_category_key))
            msg.m_action = m_emitter.default_action(msg.m_severity, severity_category_key);

        if (v == catch_verdict::caught && ! ignore_catch) {
            m_stats.count_caught(original_severity);
            caught = true;
            break;
        }
    }

    if (msg.m_severity < original_severity)
        m_stats.count_demoted(original_severity);

    m_context.m_last_committed = msg;
    return caught;
}

void catcher_executor::report_invalid_verdict(const report_catcher& c, catch_verdict v) {
    std::string text = "catcher '" + c.name() + "' returned invalid verdict "
        + std::to_string((unsigned)v) + ", assuming the report is passed on";

    if (! m_emitter.is_emission_enabled(verbosity_none, severity::error, invalid_verdict_id)) {
        TRACE_EXECUTOR_ERROR() << text;
        return;
    }

    // The pass goes on after the violation, so the diagnostic can't count towards quitting
    report_message msg;
    msg.m_severity = severity::error;
    msg.m_id = invalid_verdict_id;
    msg.m_message = std::move(text);
    msg.m_verbosity = verbosity_none;
    msg.m_action = m_emitter.default_action(severity::error, invalid_verdict_id)
        & ~(action::count | action::exit);

    m_emitter.execute(msg, m_emitter.compose_text(msg));
}

void catcher_executor::summarize(std::ostream* sink) {
    auto text = m_stats.format();

    bool emitted = false;
    if (sink) {
        scoped_id_override redirect{m_emitter, catcher_summary_id, (action_mask)action::log, sink};
        emitted = emit_directly(m_emitter, severity::info, catcher_summary_id, std::move(text));
    } else {
        emitted = emit_directly(m_emitter, severity::info, catcher_summary_id, std::move(text));
    }

    if (! emitted)
        TRACE_EXECUTOR_ERROR() << "summary is disabled by the emitter setup for '" << catcher_summary_id << '\'';
}

} // ns diag_interceptor
