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

#include "report_catcher.h"
#include "utils.h"

#include <stdexcept>

#define TRACE_REGISTRY() TRACE_INFO() << "catcher_registry(" << (void*)this << ") "

namespace diag_interceptor {

report_catcher& catcher_registry::add(std::unique_ptr<report_catcher> c, const report_object* owner) {
    if (! c)
        throw std::logic_error("unable to register an empty catcher");

    auto& ref = *c;
    m_entries.push_back({owner, std::move(c)});

    if (is_trace_enabled())
        TRACE_REGISTRY() << "adds catcher '" << ref.name() << "' at position " << m_entries.size() - 1
            << " for " << (owner ? "'" + owner->name() + "'" : std::string{"all report objects"});
    return ref;
}

report_catcher* catcher_registry::find(std::string_view name) const {
    report_catcher* found = nullptr;
    std::size_t matches = 0;

    for (const auto& e : m_entries)
        if (e.m_catcher->name() == name) {
            if (! found)
                found = e.m_catcher.get();
            ++matches;
        }

    if (matches > 1 && is_trace_enabled())
        TRACE_REGISTRY() << "ambiguous catcher name '" << name << "', " << matches
            << " catchers have it, the first one is used";
    return found;
}

std::vector<report_catcher*> catcher_registry::find_all(std::string_view name) const {
    std::vector<report_catcher*> res;
    for (const auto& e : m_entries)
        if (e.m_catcher->name() == name)
            res.push_back(e.m_catcher.get());
    return res;
}

} // ns diag_interceptor
