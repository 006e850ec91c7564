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

#include "report_config.h"
#include "reporter.h"
#include "utils.h"

#include <exception>
#include <stdexcept>

namespace diag_interceptor {

namespace {

int parse_verbosity(std::string_view v) {
    static const struct {
        const char* m_name;
        int m_level;
    } names[] = {
        {"NONE", verbosity_none},
        {"LOW", verbosity_low},
        {"MEDIUM", verbosity_medium},
        {"HIGH", verbosity_high},
        {"FULL", verbosity_full},
        {"DEBUG", verbosity_debug}
    };

    for (const auto& n : names)
        if (utils::iequals(v, n.m_name))
            return n.m_level;
    return utils::to_number<int>(v);
}

bool parse_switch(std::string_view v) {
    if (utils::iequals(v, "on") || utils::iequals(v, "true") || utils::iequals(v, "yes") || v == "1")
        return true;
    if (utils::iequals(v, "off") || utils::iequals(v, "false") || utils::iequals(v, "no") || v == "0")
        return false;
    throw std::invalid_argument("'" + std::string{v} + "' is not a switch value");
}

void parse_line(report_config& cfg, std::string_view key, std::string_view value) {
    static constexpr std::string_view id_action_prefix = "action.id.";
    static constexpr std::string_view action_prefix = "action.";

    if (key == "verbosity") {
        cfg.m_verbosity = parse_verbosity(value);
    } else if (key == "max_quit_count") {
        cfg.m_max_quit_count = utils::to_number<unsigned>(value);
    } else if (key == "catcher_debug") {
        auto flags = utils::to_number<unsigned>(value, 0);
        if (flags & ~((unsigned)catcher_debug::ignore_catch | (unsigned)catcher_debug::discard_mutations))
            throw std::invalid_argument("unknown catcher debug flags in " + std::string{value});
        cfg.m_catcher_debug = flags;
    } else if (key == "trace_catchers") {
        cfg.m_trace_catchers = parse_switch(value);
    } else if (utils::starts_with(key, id_action_prefix)) {
        auto id = key.substr(id_action_prefix.size());
        if (id.empty())
            throw std::invalid_argument("empty report id");
        cfg.m_id_actions.emplace_back(std::string{id}, action_mask_from_str(value));
    } else if (utils::starts_with(key, action_prefix)) {
        auto sev = severity_from_str(key.substr(action_prefix.size()));
        if (! sev)
            throw std::invalid_argument("unknown severity '" + std::string{key.substr(action_prefix.size())} + '\'');
        cfg.m_severity_actions.emplace_back(*sev, action_mask_from_str(value));
    } else {
        throw std::invalid_argument("unknown key '" + std::string{key} + '\'');
    }
}

} // anonymous ns

report_config parse_report_config(std::string_view text) {
    report_config cfg;
    unsigned line_no = 0;

    // Empty lines are skipped by the splitter, so line numbers are counted by hand
    std::string_view::size_type pos = 0;
    while (pos <= text.size()) {
        auto eol = text.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = text.size();
        auto line = utils::trim(text.substr(pos, eol - pos));
        pos = eol + 1;
        ++line_no;

        if (line.empty() || line.front() == '#')
            continue;

        auto eq = line.find('=');
        if (eq == std::string_view::npos)
            throw std::invalid_argument("config line " + std::to_string(line_no) + ": '=' expected");

        try {
            parse_line(cfg, utils::trim(line.substr(0, eq)), utils::trim(line.substr(eq + 1)));
        } catch (const std::exception&) {
            std::throw_with_nested(std::invalid_argument(
                "config line " + std::to_string(line_no) + ": unable to parse '" + std::string{line} + '\''));
        }
    }

    return cfg;
}

report_config load_report_config(const char* path) {
    auto content = utils::read_whole_file(path);
    return parse_report_config({content.data(), content.size()});
}

void apply_config(const report_config& cfg, reporter& rep) {
    if (cfg.m_verbosity)
        rep.server().set_verbosity_level(*cfg.m_verbosity);
    if (cfg.m_max_quit_count)
        rep.server().set_max_quit_count(*cfg.m_max_quit_count);
    if (cfg.m_catcher_debug)
        rep.executor().set_debug_flags(*cfg.m_catcher_debug);
    if (cfg.m_trace_catchers)
        rep.catchers().set_trace(*cfg.m_trace_catchers);
    for (const auto& [sev, act] : cfg.m_severity_actions)
        rep.server().set_severity_action(sev, act);
    for (const auto& [id, act] : cfg.m_id_actions)
        rep.server().set_id_action(id, act);
}

} // ns diag_interceptor
