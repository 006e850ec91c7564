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

#include "reporter.h"

namespace diag_interceptor {

reporter::reporter(std::ostream& display)
    : m_server(display)
    , m_executor(m_registry, m_server, m_stats) {
}

bool reporter::report(severity sev, std::string_view id, std::string text, int verbosity,
        const char* fname, int line, std::string context, const report_object* owner) {
    if (! m_server.is_emission_enabled(verbosity, sev, id))
        return false;

    report_message msg;
    msg.m_severity = sev;
    msg.m_id = id;
    msg.m_message = std::move(text);
    msg.m_verbosity = verbosity;
    msg.m_action = m_server.default_action(sev, id);
    msg.m_context = std::move(context);
    msg.m_fname = fname ? fname : "";
    msg.m_line = line;
    msg.m_owner = owner;

    if (m_executor.process(msg))
        return false;

    // A catcher could leave nothing to do with the report
    if (msg.m_action == (action_mask)action::none)
        return false;

    m_server.execute(msg, m_server.compose_text(msg));
    return true;
}

} // ns diag_interceptor
