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

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string_view>
#include <string>
#include <utility>
#include <functional>

namespace diag_interceptor {

// The emission subsystem: resolves actions for reports, filters them by verbosity and performs
// the actions. Tables can be reconfigured while reports are being emitted from other threads.
class report_server final : public report_emitter {
public:
    typedef std::function<void(const report_message&)> handler_t;

    explicit report_server(std::ostream& display);

    // Action lookup order: severity+id, id, severity
    void set_severity_action(severity sev, action_mask act);
    void set_id_action(std::string_view id, action_mask act);
    void set_severity_id_action(severity sev, std::string_view id, action_mask act);

    // Destinations for 'log' action, the same lookup order as for actions. If nothing is found,
    // a report is logged into the default destination. Reports are not logged anywhere if the
    // default destination is not set.
    void set_default_destination(std::ostream* os);
    void set_severity_destination(severity sev, std::ostream* os);
    void set_id_destination(std::string_view id, std::ostream* os);

    void set_verbosity_level(int level);
    int get_verbosity_level() const;

    // When a number of reports with 'count' action reaches the limit, the last one is handled as
    // having 'exit' action. Zero means no limit.
    void set_max_quit_count(unsigned count);
    unsigned get_max_quit_count() const;
    unsigned get_quit_count() const;
    void reset_quit_count();

    // Called for reports having 'call_hook' and 'stop' actions correspondingly
    void set_hook(handler_t hook);
    void set_stop_handler(handler_t handler);

    // Numbers of reports executed by this server
    unsigned long get_severity_count(severity sev) const;
    unsigned long get_id_count(std::string_view id) const;

    // report_emitter
    action_mask default_action(severity sev, std::string_view id) const override;
    bool is_emission_enabled(int verbosity, severity sev, std::string_view id) const override;
    std::string compose_text(const report_message& msg) const override;
    void execute(const report_message& msg, const std::string& composed_text) override;
    id_override_token override_id(std::string_view id, action_mask act, std::ostream* dest) override;
    void restore_id(id_override_token token) noexcept override;

private:
    static constexpr std::size_t severity_count = (std::size_t)severity::total_count;

    mutable std::mutex m_mutex;
    std::mutex m_output_mutex;
    std::ostream& m_display;

    action_mask m_severity_actions[severity_count];
    std::map<std::string, action_mask, std::less<>> m_id_actions;
    std::map<std::pair<severity, std::string>, action_mask> m_severity_id_actions;
    // Installed by override_id, win over any other action setup
    std::map<std::string, action_mask, std::less<>> m_forced_actions;

    std::ostream* m_default_destination = nullptr;
    std::ostream* m_severity_destinations[severity_count] = {};
    std::map<std::string, std::ostream*, std::less<>> m_id_destinations;

    int m_verbosity_level = verbosity_medium;
    unsigned m_max_quit_count = 0;
    unsigned m_quit_count = 0;

    handler_t m_hook;
    handler_t m_stop_handler;

    unsigned long m_severity_counts[severity_count] = {};
    std::map<std::string, unsigned long, std::less<>> m_id_counts;

    action_mask lookup_action(severity sev, std::string_view id) const;
    std::ostream* lookup_destination(severity sev, std::string_view id) const;
};

} // ns diag_interceptor
