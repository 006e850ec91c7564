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
#include <atomic>
#include <memory>
#include <string_view>
#include <string>
#include <vector>
#include <functional>

namespace diag_interceptor {

class catcher_context;

// A pluggable observer of reports. It's called for every report passing the chain while it's
// enabled and can inspect and change the report via provided context. Returning 'caught' stops the
// report propagation - no following catcher sees it and it's not emitted.
class report_catcher {
public:
    explicit report_catcher(std::string name)
        : m_name(std::move(name)) {
    }

    report_catcher(const report_catcher&) = delete;
    report_catcher& operator=(const report_catcher&) = delete;

    virtual ~report_catcher() = default;

    const std::string& name() const noexcept { return m_name; }

    // Enabling or disabling never changes the position of the catcher in a registry
    bool is_enabled() const noexcept { return m_enabled.load(std::memory_order_relaxed); }
    void set_enabled(bool enab = true) noexcept { m_enabled.store(enab, std::memory_order_relaxed); }

    // The context is valid only during this call. No reference to it or to the message behind it
    // should be kept.
    virtual catch_verdict on_message(catcher_context& ctx) = 0;

private:
    const std::string m_name;
    std::atomic<bool> m_enabled{true};
};

// Adapter for catchers implemented by a callable object
class function_catcher final : public report_catcher {
public:
    typedef std::function<catch_verdict(catcher_context&)> fn_t;

    function_catcher(std::string name, fn_t fn)
        : report_catcher(std::move(name)), m_fn(std::move(fn)) {
    }

    catch_verdict on_message(catcher_context& ctx) override { return m_fn(ctx); }

private:
    fn_t m_fn;
};

// An ordered list of catchers. Catchers are not expected to be numerous, so a linear scan is used
// both for selecting catchers applicable to a report object and for name lookups. The registry
// owns its catchers for its whole life, there is no removal - a catcher can be disabled instead.
//
// The registry is not synchronized: all the registrations should be done before reports are issued
// from a few threads simultaneously.
class catcher_registry {
public:
    struct entry {
        const report_object* m_owner;   // nullptr means any owner
        std::unique_ptr<report_catcher> m_catcher;
    };

    catcher_registry() = default;

    catcher_registry(const catcher_registry&) = delete;
    catcher_registry& operator=(const catcher_registry&) = delete;

    // Appends a catcher to the end of the chain. It's applied to reports issued by 'owner' only or
    // to all reports if 'owner' is nullptr.
    report_catcher& add(std::unique_ptr<report_catcher> c, const report_object* owner = nullptr);

    template <class T, class ... Args>
    T& emplace(const report_object* owner, Args&& ... args) {
        auto p = std::make_unique<T>(std::forward<Args>(args)...);
        auto& ref = *p;
        add(std::move(p), owner);
        return ref;
    }

    report_catcher& add(std::string name, function_catcher::fn_t fn, const report_object* owner = nullptr) {
        return emplace<function_catcher>(owner, std::move(name), std::move(fn));
    }

    // Names are not required to be unique. The first registered catcher having the name is
    // returned, nullptr if there is none.
    report_catcher* find(std::string_view name) const;

    // All the catchers having the name in registration order
    std::vector<report_catcher*> find_all(std::string_view name) const;

    std::size_t size() const noexcept { return m_entries.size(); }
    bool empty() const noexcept { return m_entries.empty(); }

    const entry& operator[](std::size_t i) const noexcept { return m_entries[i]; }

    static bool applies_to(const entry& e, const report_object* owner) noexcept {
        return ! e.m_owner || e.m_owner == owner;
    }

    // Tracing of registrations and lookups. The catcher chain executor switches it off for the time
    // catchers are running.
    void set_trace(bool on) noexcept { m_trace.store(on, std::memory_order_relaxed); }
    bool is_trace_enabled() const noexcept { return m_trace.load(std::memory_order_relaxed); }

private:
    std::vector<entry> m_entries;
    std::atomic<bool> m_trace{false};
};

} // ns diag_interceptor
