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

#include "report_server.h"
#include "utils.h"

#include <ostream>
#include <sstream>

namespace diag_interceptor {

report_server::report_server(std::ostream& display)
    : m_display(display) {
    m_severity_actions[(std::size_t)severity::info] = (action_mask)action::display;
    m_severity_actions[(std::size_t)severity::warning] = (action_mask)action::display;
    m_severity_actions[(std::size_t)severity::error] = action::display | action::count;
    m_severity_actions[(std::size_t)severity::fatal] = action::display | action::exit;
}

void report_server::set_severity_action(severity sev, action_mask act) {
    if (sev >= severity::total_count)
        throw std::invalid_argument("invalid severity value");
    std::lock_guard l{m_mutex};
    m_severity_actions[(std::size_t)sev] = act;
}

void report_server::set_id_action(std::string_view id, action_mask act) {
    std::lock_guard l{m_mutex};
    m_id_actions.insert_or_assign(std::string{id}, act);
}

void report_server::set_severity_id_action(severity sev, std::string_view id, action_mask act) {
    std::lock_guard l{m_mutex};
    m_severity_id_actions.insert_or_assign(std::make_pair(sev, std::string{id}), act);
}

void report_server::set_default_destination(std::ostream* os) {
    std::lock_guard l{m_mutex};
    m_default_destination = os;
}

void report_server::set_severity_destination(severity sev, std::ostream* os) {
    if (sev >= severity::total_count)
        throw std::invalid_argument("invalid severity value");
    std::lock_guard l{m_mutex};
    m_severity_destinations[(std::size_t)sev] = os;
}

void report_server::set_id_destination(std::string_view id, std::ostream* os) {
    std::lock_guard l{m_mutex};
    if (os)
        m_id_destinations.insert_or_assign(std::string{id}, os);
    else if (auto it = m_id_destinations.find(id); it != m_id_destinations.end())
        m_id_destinations.erase(it);
}

void report_server::set_verbosity_level(int level) {
    std::lock_guard l{m_mutex};
    m_verbosity_level = level;
}

int report_server::get_verbosity_level() const {
    std::lock_guard l{m_mutex};
    return m_verbosity_level;
}

void report_server::set_max_quit_count(unsigned count) {
    std::lock_guard l{m_mutex};
    m_max_quit_count = count;
}

unsigned report_server::get_max_quit_count() const {
    std::lock_guard l{m_mutex};
    return m_max_quit_count;
}

unsigned report_server::get_quit_count() const {
    std::lock_guard l{m_mutex};
    return m_quit_count;
}

void report_server::reset_quit_count() {
    std::lock_guard l{m_mutex};
    m_quit_count = 0;
}

void report_server::set_hook(handler_t hook) {
    std::lock_guard l{m_mutex};
    m_hook = std::move(hook);
}

void report_server::set_stop_handler(handler_t handler) {
    std::lock_guard l{m_mutex};
    m_stop_handler = std::move(handler);
}

unsigned long report_server::get_severity_count(severity sev) const {
    if (sev >= severity::total_count)
        return 0;
    std::lock_guard l{m_mutex};
    return m_severity_counts[(std::size_t)sev];
}

unsigned long report_server::get_id_count(std::string_view id) const {
    std::lock_guard l{m_mutex};
    auto it = m_id_counts.find(id);
    return it != m_id_counts.end() ? it->second : 0;
}

action_mask report_server::lookup_action(severity sev, std::string_view id) const {
    if (auto it = m_forced_actions.find(id); it != m_forced_actions.end())
        return it->second;
    if (! m_severity_id_actions.empty())
        if (auto it = m_severity_id_actions.find(std::make_pair(sev, std::string{id})); it != m_severity_id_actions.end())
            return it->second;
    if (auto it = m_id_actions.find(id); it != m_id_actions.end())
        return it->second;
    return m_severity_actions[(std::size_t)sev];
}

std::ostream* report_server::lookup_destination(severity sev, std::string_view id) const {
    if (auto it = m_id_destinations.find(id); it != m_id_destinations.end())
        return it->second;
    if (auto os = m_severity_destinations[(std::size_t)sev])
        return os;
    return m_default_destination;
}

action_mask report_server::default_action(severity sev, std::string_view id) const {
    if (sev >= severity::total_count)
        throw std::invalid_argument("invalid severity value");
    std::lock_guard l{m_mutex};
    return lookup_action(sev, id);
}

bool report_server::is_emission_enabled(int verbosity, severity sev, std::string_view id) const {
    if (sev >= severity::total_count)
        return false;
    std::lock_guard l{m_mutex};
    return verbosity <= m_verbosity_level
        && lookup_action(sev, id) != (action_mask)action::none;
}

std::string report_server::compose_text(const report_message& msg) const {
    std::ostringstream os;
    os << msg.m_severity;
    if (! msg.m_fname.empty()) {
        os << ' ' << msg.m_fname;
        if (msg.m_line > 0)
            os << '(' << msg.m_line << ')';
    }
    if (msg.m_owner)
        os << " @ " << msg.m_owner->name();
    if (! msg.m_context.empty())
        os << " (" << msg.m_context << ')';
    os << " [" << msg.m_id << "] " << msg.m_message;
    for (const auto& a : msg.m_attributes)
        os << ' ' << a;
    return os.str();
}

void report_server::execute(const report_message& msg, const std::string& composed_text) {
    const action_mask act = msg.m_action;
    std::ostream* destination = nullptr;
    bool quit_limit_reached = false;
    unsigned quit_limit = 0;
    handler_t hook, stop_handler;

    if (msg.m_severity >= severity::total_count)
        throw std::invalid_argument("invalid severity value in report '" + msg.m_id + '\'');

    {
        std::lock_guard l{m_mutex};

        ++m_severity_counts[(std::size_t)msg.m_severity];
        if (auto it = m_id_counts.find(msg.m_id); it != m_id_counts.end())
            ++it->second;
        else
            m_id_counts.emplace(msg.m_id, 1);

        if (has_action(act, action::log))
            destination = lookup_destination(msg.m_severity, msg.m_id);

        if (has_action(act, action::count)) {
            ++m_quit_count;
            if (m_max_quit_count && m_quit_count >= m_max_quit_count) {
                quit_limit_reached = true;
                quit_limit = m_max_quit_count;
            }
        }

        if (has_action(act, action::call_hook))
            hook = m_hook;
        if (has_action(act, action::stop))
            stop_handler = m_stop_handler;
    }

    if (has_action(act, action::display) || destination) {
        std::lock_guard l{m_output_mutex};
        if (has_action(act, action::display))
            m_display << composed_text << std::endl;
        if (destination)
            *destination << composed_text << std::endl;
    }

    if (hook)
        hook(msg);
    if (stop_handler)
        stop_handler(msg);

    if (has_action(act, action::exit))
        throw report_exit(msg.m_severity, msg.m_id, composed_text);
    if (quit_limit_reached)
        throw report_exit(msg.m_severity, msg.m_id,
            "quit count limit of " + std::to_string(quit_limit) + " reached: " + composed_text);
}

report_emitter::id_override_token report_server::override_id(
        std::string_view id, action_mask act, std::ostream* dest) {
    id_override_token token;
    token.m_id = id;

    std::lock_guard l{m_mutex};

    if (auto it = m_forced_actions.find(id); it != m_forced_actions.end()) {
        token.m_prev_action = it->second;
        it->second = act;
    } else {
        m_forced_actions.emplace(std::string{id}, act);
    }

    if (dest) {
        token.m_destination_changed = true;
        if (auto it = m_id_destinations.find(id); it != m_id_destinations.end()) {
            token.m_prev_destination = it->second;
            it->second = dest;
        } else {
            m_id_destinations.emplace(std::string{id}, dest);
        }
    }

    return token;
}

void report_server::restore_id(id_override_token token) noexcept {
    std::lock_guard l{m_mutex};

    // Only assignments and erasures here - nothing can throw
    if (auto it = m_forced_actions.find(token.m_id); it != m_forced_actions.end()) {
        if (token.m_prev_action)
            it->second = *token.m_prev_action;
        else
            m_forced_actions.erase(it);
    }

    if (! token.m_destination_changed)
        return;

    if (auto it = m_id_destinations.find(token.m_id); it != m_id_destinations.end()) {
        if (token.m_prev_destination)
            it->second = *token.m_prev_destination;
        else
            m_id_destinations.erase(it);
    }
}

} // ns diag_interceptor
