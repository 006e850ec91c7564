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

// The module contains auxiliary tools needed for the whole library implementation. It's not assumed
// to be exported somehow to the library's clients.

#include <cstdint>
#include <utility>
#include <stdexcept>
#include <string_view>
#include <string>
#include <vector>
#include <mutex>
#include <ostream>
#include <iomanip>
#include <exception>

#include <type_traits>
#include <iterator>

namespace diag_interceptor::utils {

// Opens a file by provided path and reads all its content
std::vector<char> read_whole_file(const char* path, int atdir_fd = -1);

class string_splitter {
public:
    class iterator {
    public:
        typedef std::string_view value_type;
        typedef const std::string_view& reference;
        typedef const std::string_view* pointer;
        typedef std::intptr_t difference_type;
        typedef std::forward_iterator_tag iterator_category;

        iterator(std::string_view input, std::string_view delims) noexcept
            : m_input(input), m_delims(delims) {
            advance(/*reset*/ true);
        }

        iterator() = default;

        reference operator*() const noexcept {
            return m_part;
        }

        pointer operator->() const noexcept {
            return &m_part;
        }

        bool operator==(const iterator& r) const noexcept {
            return m_pos == r.m_pos;
        }

        bool operator!=(const iterator& r) const noexcept {
            return m_pos != r.m_pos;
        }

        iterator& operator++() noexcept {
            advance();
            return *this;
        }

        iterator operator++(int) noexcept {
            auto t = *this;
            advance();
            return t;
        }

    private:
        std::string_view m_input;
        std::string_view m_delims;
        std::string_view m_part;
        std::string_view::size_type m_pos = std::string_view::npos;

        void advance(bool reset = false) noexcept {
            auto b = reset ? 0 : m_pos + m_part.size();

            m_pos = m_input.find_first_not_of(m_delims, b);
            if (m_pos != std::string_view::npos) {
                auto e = m_input.find_first_of(m_delims, m_pos);
                if (e != std::string_view::npos)
                    m_part = std::string_view{m_input.data() + m_pos, e - m_pos};
                else
                    m_part = std::string_view{m_input.data() + m_pos, m_input.size() - m_pos};
            }
        }
    };

    string_splitter(std::string_view input, std::string_view delims) noexcept
        : m_input(input), m_delims(delims) {
    }

    iterator begin() const noexcept { return {m_input, m_delims}; }
    iterator end() const noexcept { return {}; }

    bool empty() const noexcept { return iterator{m_input, m_delims} == iterator{}; }

private:
    std::string_view m_input;
    std::string_view m_delims;
};

namespace details {

template <class ... T> struct is_one_of;

template <class T1, class T2>
struct is_one_of<T1, T2> : std::is_same<T1, T2> {};

template <class T1, class T2, class T3, class ... T>
struct is_one_of<T1, T2, T3, T...>
    : std::bool_constant<is_one_of<T1, T2>::value || is_one_of<T1, T3, T...>::value> {};

template <class T>
struct is_for_strtol
    : std::bool_constant<
        is_one_of<T, signed char, signed short, signed int, signed long>::value
            || (std::is_signed_v<char> && std::is_same_v<T, char>)> {};

template <class T>
struct is_for_strtoul
    : std::bool_constant<
        is_one_of<T, unsigned char, unsigned short, unsigned int, unsigned long>::value
            || (! std::is_signed_v<char> && std::is_same_v<T, char>)> {};

} // ns details

enum class num_conv_result : char {
    ok, overflow, garbage
};

std::string_view trim_left(std::string_view str);
std::string_view trim_right(std::string_view str);
inline std::string_view trim(std::string_view str) {
    return trim_left(trim_right(str));
}

inline bool starts_with(std::string_view s, std::string_view part) {
    return s.size() >= part.size() && s.substr(0, part.size()) == part;
}

// ASCII-only case insensitive comparison, enough for keywords in configuration files
bool iequals(std::string_view a, std::string_view b) noexcept;

template <class T>
num_conv_result to_number_ref(std::string_view str, T& val, int base = 10,
    std::enable_if_t<details::is_for_strtol<T>::value, void>* = nullptr);

template <class T>
num_conv_result to_number_ref(std::string_view str, T& val, int base = 10,
    std::enable_if_t<details::is_for_strtoul<T>::value, void>* = nullptr);

template <class T>
T to_number(std::string_view str, int base = 10) {
    T val;
    switch (to_number_ref(str, val, base)) {
    case num_conv_result::ok:
        break;
    case num_conv_result::overflow:
        throw std::range_error("unable to convert \"" + std::string{str} + "\" to a number - overflow");
    case num_conv_result::garbage:
        throw std::range_error("unable to convert \"" + std::string{str} + "\" to a number - "
            "some unconvertable characters here");
    };
    return val;
}

// Allows to output any data into specified ostream under lock
class sync_logger {
    // While there is a live object of this type, no other thread can
    // output anything using the sync_logger object
    struct step_out {
        std::unique_lock<std::mutex> m_l;
        std::ostream& m_os;
        bool m_add_endl;

        template <class T>
        step_out&& operator<<(T&& obj) && {
            m_os << std::forward<T>(obj);
            return std::move(*this);
        }
        step_out&& operator<<(std::ostream& (*func)(std::ostream&)) && {
            m_os << func;
            return std::move(*this);
        }
        ~step_out() {
            if (m_add_endl)
                m_os << std::endl;
        }
    };

public:
    sync_logger(std::ostream& os) : m_os(os) {
        std::ios_base::sync_with_stdio(false);
        os.tie(nullptr);
    }

    // Prefixes an output with steady clock's seconds and milliseconds
    step_out operator()(bool add_endl = true);

private:
    std::mutex m_mutex;
    std::ostream& m_os;
};

extern sync_logger g_sync_logger;

#define TRACE_INFO() ::diag_interceptor::utils::g_sync_logger()
#define TRACE_ERROR() ::diag_interceptor::utils::g_sync_logger()

template <class T>
struct dump_exc_with_nested {
    const T& m_obj;

    explicit dump_exc_with_nested(const T& obj)
        : m_obj(obj) {
    }

    template <class S> void dump(S& os) {
        os << m_obj.what();
    }

    void rethrow() {
        std::rethrow_if_nested(m_obj);
    }
};

template <class S, class T>
S& operator<<(S& os, dump_exc_with_nested<T> d) {
    d.dump(os);
    try {
        d.rethrow();
    } catch (const std::exception& nested) {
        os << "; " << dump_exc_with_nested{nested};
    } catch (...) {
        os << "[unknown exception type]";
    }
    return os;
}

} // ns diag_interceptor::utils
