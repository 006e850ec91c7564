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

#include <cstdint>
#include <optional>
#include <string_view>
#include <string>
#include <utility>
#include <vector>

namespace diag_interceptor {

class reporter;

// Settings of a reporter read from a text of "key = value" lines. Only keys present in the text
// are applied, everything else stays as it's configured already.
//
//   verbosity = 300 | LOW | MEDIUM | HIGH | FULL | DEBUG | NONE
//   max_quit_count = 10
//   catcher_debug = 3                  (bit 0 - ignore catch, bit 1 - discard mutations)
//   trace_catchers = on
//   action.ERROR = DISPLAY|COUNT
//   action.id.SOME/ID = NONE
//
// Lines starting with '#' are comments.
struct report_config {
    std::optional<int> m_verbosity;
    std::optional<unsigned> m_max_quit_count;
    std::optional<std::uint32_t> m_catcher_debug;
    std::optional<bool> m_trace_catchers;
    std::vector<std::pair<severity, action_mask>> m_severity_actions;
    std::vector<std::pair<std::string, action_mask>> m_id_actions;
};

// Throws std::invalid_argument with a line number on any malformed line
report_config parse_report_config(std::string_view text);
report_config load_report_config(const char* path);

void apply_config(const report_config& cfg, reporter& rep);

} // ns diag_interceptor
