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

// This file declares only types required for external users of the interceptor library. Should be
// considered as the only public header of it along with the catcher and reporter headers. No
// internals should leak via this header.

#include <cstdint>
#include <iosfwd>
#include <utility>
#include <stdexcept>
#include <string_view>
#include <string>
#include <vector>
#include <variant>
#include <optional>

namespace diag_interceptor {

// Ordered by seriousness: a greater value is more severe
enum class severity : std::uint8_t {
    info = 0, warning, error, fatal, total_count
};

inline const char* severity_to_str(severity v) {
    switch (v) {
    case severity::info: return "INFO";
    case severity::warning: return "WARNING";
    case severity::error: return "ERROR";
    case severity::fatal: return "FATAL";
    default: return "???";
    }
}

// Case insensitive, accepts an optional "DIAG_" prefix
std::optional<severity> severity_from_str(std::string_view s);

template <class S>
S& operator<<(S& os, severity v) {
    os << severity_to_str(v);
    return os;
}

enum class action_bit : std::uint8_t {
    display = 0, log, count, exit, call_hook, stop, total_count
};

enum class action : std::uint32_t {
    none = 0,
    display = 1 << (int)action_bit::display,
    log = 1 << (int)action_bit::log,
    count = 1 << (int)action_bit::count,
    exit = 1 << (int)action_bit::exit,
    call_hook = 1 << (int)action_bit::call_hook,
    stop = 1 << (int)action_bit::stop
};

// Actions are combinable, so the mask is kept as a plain integer in all the interfaces
typedef std::uint32_t action_mask;

constexpr action_mask operator|(action l, action r) noexcept {
    return (action_mask)l | (action_mask)r;
}

constexpr action_mask operator|(action_mask l, action r) noexcept {
    return l | (action_mask)r;
}

constexpr bool has_action(action_mask mask, action a) noexcept {
    return (mask & (action_mask)a) != 0;
}

// Renders a mask like "DISPLAY|COUNT" or "NONE"
std::string action_mask_to_str(action_mask mask);

// Parses names separated by '|' or ',' (case insensitive). Throws std::invalid_argument on an
// unknown name.
action_mask action_mask_from_str(std::string_view s);

// Verbosity levels, a message with a verbosity above the configured threshold is not emitted
enum verbosity_level : int {
    verbosity_none = 0,
    verbosity_low = 100,
    verbosity_medium = 200,
    verbosity_high = 300,
    verbosity_full = 400,
    verbosity_debug = 500
};

// Anything which issues reports. Catchers may be bound to a particular report object, otherwise
// they apply to every report object. Report objects are owned by a client and must outlive every
// message and catcher binding referencing them.
class report_object {
public:
    explicit report_object(std::string name)
        : m_name(std::move(name)) {
    }

    report_object(const report_object&) = delete;
    report_object& operator=(const report_object&) = delete;

    virtual ~report_object() = default;

    const std::string& name() const noexcept { return m_name; }

private:
    std::string m_name;
};

// A named value attached to a message by a catcher or by an issuer
struct message_attribute {
    typedef std::variant<std::int64_t, std::string, const report_object*> value_t;

    std::string m_name;
    value_t m_value;
};

bool operator==(const message_attribute& l, const message_attribute& r);
inline bool operator!=(const message_attribute& l, const message_attribute& r) { return !(l == r); }

template <class S>
S& operator<<(S& os, const message_attribute& a) {
    os << a.m_name << '=';
    if (auto pi = std::get_if<std::int64_t>(&a.m_value))
        os << *pi;
    else if (auto ps = std::get_if<std::string>(&a.m_value))
        os << '"' << *ps << '"';
    else if (auto po = std::get_if<const report_object*>(&a.m_value))
        os << (*po ? (*po)->name().c_str() : "<null>");
    return os;
}

// A report being evaluated. It's created per each emission request and lives only while the
// catcher chain runs over it and the emit/drop decision is made. Catchers don't touch it directly,
// only via catcher_context.
struct report_message {
    severity m_severity = severity::info;
    std::string m_id;
    std::string m_message;
    int m_verbosity = verbosity_medium;
    action_mask m_action = (action_mask)action::none;
    std::string m_context;
    std::string m_fname;
    int m_line = 0;
    const report_object* m_owner = nullptr;
    std::vector<message_attribute> m_attributes;
};

bool operator==(const report_message& l, const report_message& r);
inline bool operator!=(const report_message& l, const report_message& r) { return !(l == r); }

// A decision of one catcher
enum class catch_verdict : std::uint8_t { rethrow, caught };

// Debug flags of the catcher chain executor, intended for test harnesses
enum class catcher_debug : std::uint32_t {
    ignore_catch = 1 << 0,          // a caught verdict doesn't stop the chain and isn't counted
    discard_mutations = 1 << 1      // every change made by a catcher is reverted after its call
};

// Reserved ids of diagnostics the catcher chain issues on its own
inline constexpr std::string_view invalid_verdict_id = "CATCHER/INVALID_VERDICT";
inline constexpr std::string_view catcher_summary_id = "CATCHER/SUMMARY";

// A key which never matches a real message id. Looking up a default action by this key yields the
// default action of a severity category regardless of any per-id override.
inline constexpr std::string_view severity_category_key = "*@&*^*^*#";

// Thrown when a message having 'exit' action is executed
class report_exit : public std::runtime_error {
public:
    report_exit(severity sev, std::string id, const std::string& what)
        : std::runtime_error(what), m_severity(sev), m_id(std::move(id)) {
    }

    severity get_severity() const noexcept { return m_severity; }
    const std::string& get_id() const noexcept { return m_id; }

private:
    severity m_severity;
    std::string m_id;
};

// An emission subsystem as it's seen from the catcher chain. The chain resolves default actions
// through it and emits its own diagnostics directly through it without interception.
struct report_emitter {
    virtual ~report_emitter() = default;

    virtual action_mask default_action(severity sev, std::string_view id) const = 0;
    virtual bool is_emission_enabled(int verbosity, severity sev, std::string_view id) const = 0;
    virtual std::string compose_text(const report_message& msg) const = 0;

    // Performs the actions stored in the message. Can throw report_exit.
    virtual void execute(const report_message& msg, const std::string& composed_text) = 0;

    // Forces an action and a log destination for one id until the returned token is restored
    struct id_override_token {
        std::string m_id;
        std::optional<action_mask> m_prev_action;
        std::optional<std::ostream*> m_prev_destination;
        bool m_destination_changed = false;
    };

    virtual id_override_token override_id(std::string_view id, action_mask act, std::ostream* dest) = 0;
    virtual void restore_id(id_override_token token) noexcept = 0;
};

// Forces an action and a log destination for one id while the object is alive. The previous
// setup is restored on destruction regardless of what happened in between.
class scoped_id_override {
public:
    scoped_id_override(report_emitter& emitter, std::string_view id, action_mask act, std::ostream* dest)
        : m_emitter(emitter), m_token(emitter.override_id(id, act, dest)) {
    }

    scoped_id_override(const scoped_id_override&) = delete;
    scoped_id_override& operator=(const scoped_id_override&) = delete;

    ~scoped_id_override() { m_emitter.restore_id(std::move(m_token)); }

private:
    report_emitter& m_emitter;
    report_emitter::id_override_token m_token;
};

// Builds and emits one message bypassing any interception. Returns false if the emitter has the
// message disabled.
bool emit_directly(report_emitter& emitter, severity sev, std::string_view id,
    std::string text, int verbosity = verbosity_none);

} // ns diag_interceptor
