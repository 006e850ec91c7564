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
#include "catcher_executor.h"
#include "report_server.h"

#include <iosfwd>
#include <string_view>
#include <string>
#include <utility>

namespace diag_interceptor {

// The entry point for issuing reports. Bundles an emission subsystem with a catcher chain: every
// report enabled by the server passes the chain and is emitted only if no catcher caught it.
class reporter {
public:
    explicit reporter(std::ostream& display);

    reporter(const reporter&) = delete;
    reporter& operator=(const reporter&) = delete;

    report_server& server() noexcept { return m_server; }
    catcher_registry& catchers() noexcept { return m_registry; }
    catcher_stats& stats() noexcept { return m_stats; }
    catcher_executor& executor() noexcept { return m_executor; }

    // Returns true if the report has been emitted. Can throw report_exit if the final action
    // demands it or any exception thrown by a catcher.
    bool report(severity sev, std::string_view id, std::string text,
        int verbosity = verbosity_medium,
        const char* fname = "", int line = 0,
        std::string context = {}, const report_object* owner = nullptr);

    bool info(std::string_view id, std::string text, int verbosity = verbosity_medium) {
        return report(severity::info, id, std::move(text), verbosity);
    }
    bool warning(std::string_view id, std::string text) {
        return report(severity::warning, id, std::move(text), verbosity_none);
    }
    bool error(std::string_view id, std::string text) {
        return report(severity::error, id, std::move(text), verbosity_none);
    }
    bool fatal(std::string_view id, std::string text) {
        return report(severity::fatal, id, std::move(text), verbosity_none);
    }

    void summarize(std::ostream* sink = nullptr) { m_executor.summarize(sink); }

private:
    report_server m_server;
    catcher_registry m_registry;
    catcher_stats m_stats;
    catcher_executor m_executor;
};

} // ns diag_interceptor

#define DIAG_INFO(rep, id, text, verbosity) \
    (rep).report(::diag_interceptor::severity::info, (id), (text), (verbosity), __FILE__, __LINE__)
#define DIAG_WARNING(rep, id, text) \
    (rep).report(::diag_interceptor::severity::warning, (id), (text), \
        ::diag_interceptor::verbosity_none, __FILE__, __LINE__)
#define DIAG_ERROR(rep, id, text) \
    (rep).report(::diag_interceptor::severity::error, (id), (text), \
        ::diag_interceptor::verbosity_none, __FILE__, __LINE__)
#define DIAG_FATAL(rep, id, text) \
    (rep).report(::diag_interceptor::severity::fatal, (id), (text), \
        ::diag_interceptor::verbosity_none, __FILE__, __LINE__)
