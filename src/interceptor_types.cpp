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

#include "interceptor_types.h"
#include "utils.h"

#include <algorithm>

namespace diag_interceptor {

namespace {

struct action_name {
    action m_action;
    const char* m_name;
};

constexpr action_name g_action_names[] = {
    {action::display, "DISPLAY"},
    {action::log, "LOG"},
    {action::count, "COUNT"},
    {action::exit, "EXIT"},
    {action::call_hook, "CALL_HOOK"},
    {action::stop, "STOP"}
};

static_assert(sizeof(g_action_names)/sizeof(g_action_names[0]) == (std::size_t)action_bit::total_count);

} // anonymous ns

std::optional<severity> severity_from_str(std::string_view s) {
    s = utils::trim(s);
    if (s.size() > 5 && utils::iequals(s.substr(0, 5), "DIAG_"))
        s.remove_prefix(5);

    for (auto v : {severity::info, severity::warning, severity::error, severity::fatal})
        if (utils::iequals(s, severity_to_str(v)))
            return v;
    return std::nullopt;
}

std::string action_mask_to_str(action_mask mask) {
    std::string res;
    for (const auto& an : g_action_names)
        if (has_action(mask, an.m_action)) {
            if (! res.empty())
                res += '|';
            res += an.m_name;
        }
    return res.empty() ? "NONE" : res;
}

action_mask action_mask_from_str(std::string_view s) {
    action_mask res = 0;
    bool empty = true;

    for (auto part : utils::string_splitter(s, "|,")) {
        part = utils::trim(part);
        if (part.empty())
            continue;
        empty = false;

        if (utils::starts_with(part, "DIAG_") || utils::starts_with(part, "diag_"))
            part.remove_prefix(5);

        if (utils::iequals(part, "NONE") || utils::iequals(part, "NO_ACTION"))
            continue;

        auto it = std::find_if(std::begin(g_action_names), std::end(g_action_names),
            [part](const action_name& an) { return utils::iequals(part, an.m_name); });
        if (it == std::end(g_action_names))
            throw std::invalid_argument("unknown action '" + std::string{part} + '\'');
        res |= (action_mask)it->m_action;
    }

    if (empty)
        throw std::invalid_argument("empty action specification");
    return res;
}

bool operator==(const message_attribute& l, const message_attribute& r) {
    return l.m_name == r.m_name && l.m_value == r.m_value;
}

bool operator==(const report_message& l, const report_message& r) {
    return l.m_severity == r.m_severity
        && l.m_id == r.m_id
        && l.m_message == r.m_message
        && l.m_verbosity == r.m_verbosity
        && l.m_action == r.m_action
        && l.m_context == r.m_context
        && l.m_fname == r.m_fname
        && l.m_line == r.m_line
        && l.m_owner == r.m_owner
        && l.m_attributes == r.m_attributes;
}

bool emit_directly(report_emitter& emitter, severity sev, std::string_view id,
        std::string text, int verbosity) {
    if (! emitter.is_emission_enabled(verbosity, sev, id))
        return false;

    report_message msg;
    msg.m_severity = sev;
    msg.m_id = id;
    msg.m_message = std::move(text);
    msg.m_verbosity = verbosity;
    msg.m_action = emitter.default_action(sev, id);

    emitter.execute(msg, emitter.compose_text(msg));
    return true;
}

} // ns diag_interceptor
