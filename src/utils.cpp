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

#include "utils.h"

#include <cerrno>
#include <cctype>
#include <cstring>
#include <cstdlib>
#include <climits>
#include <limits>
#include <exception>
#include <system_error>
#include <algorithm>

#include <time.h>
#include <unistd.h>
#include <fcntl.h>

#include <sys/types.h>
#include <sys/stat.h>

#include <iostream>

namespace diag_interceptor::utils {

namespace {

// Trivial file descriptor RAII-holder, the only place which needs it is a whole file reading
class fd_holder {
public:
    explicit fd_holder(int fd = -1) noexcept
        : m_fd(fd) {
    }

    fd_holder(const fd_holder&) = delete;
    fd_holder& operator=(const fd_holder&) = delete;

    ~fd_holder() {
        if (m_fd >= 0)
            ::close(m_fd);
    }

    explicit operator bool() const noexcept { return m_fd >= 0; }
    int handle() const noexcept { return m_fd; }

private:
    int m_fd;
};

} // anonymous ns

// Prefixes an output with steady clock's seconds and milliseconds
sync_logger::step_out sync_logger::operator()(bool add_endl) {
    ::timespec ts;
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    std::unique_lock l{m_mutex};
    m_os << std::dec << ts.tv_sec << '.' << std::setw(3) << std::setfill('0') << ts.tv_nsec / 1'000'000L
        << " [" << ::gettid() << "] ";
    return {std::move(l), m_os, add_endl};
}

sync_logger g_sync_logger{std::cout};

std::vector<char> read_whole_file(const char* path, int atdir_fd) {
    fd_holder fd{atdir_fd >= 0
        ? ::openat(atdir_fd, path, O_CLOEXEC | O_RDONLY)
        : ::open(path, O_CLOEXEC | O_RDONLY)};

    if (! fd)
        throw std::system_error(errno, std::generic_category(),
            "unable open file '" + std::string{path} + "' for whole "
            "reading");

    std::vector<char> buffer(16 * 1024);
    size_t total = 0;

    while (true) {
        auto read_bytes = ::read(fd.handle(), buffer.data() + total, buffer.size() - total);
        if (read_bytes < 0) {
            if (errno == EAGAIN || errno == EINTR)
                continue;

            throw std::system_error(errno, std::generic_category(),
                "unable to read file '" + std::string{path} + '\'');
        }

        total += (size_t)read_bytes;
        if (read_bytes == 0) {
            buffer.resize(total);
            return buffer;
        }

        if (total == buffer.size())
            buffer.resize(buffer.size() * 2);
    }
}

std::string_view trim_left(std::string_view str) {
    while (! str.empty() && std::isspace(static_cast<unsigned char>(*str.begin())))
        str.remove_prefix(1);
    return str;
}

std::string_view trim_right(std::string_view str) {
    while (! str.empty() && std::isspace(static_cast<unsigned char>(*str.rbegin())))
        str.remove_suffix(1);
    return str;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
            return std::tolower(static_cast<unsigned char>(l))
                == std::tolower(static_cast<unsigned char>(r));
        });
}

template <class T>
num_conv_result to_number_ref(std::string_view str, T& val, int base,
        std::enable_if_t<details::is_for_strtol<T>::value, void>*) {

    char* eptr;
    char buffer[std::numeric_limits<T>::digits10 + 3];

    // Original strto(u)l swallows spaces at the beginning - let's preserve this behavior
    // assuming that we need to prepare local buffer and it has no undetermined size for
    // these spaces
    str = trim(str);

    if (str.empty())
        return num_conv_result::garbage;
    if (str.size() >= sizeof(buffer))
        return num_conv_result::overflow;

    str.copy(buffer, str.size());
    buffer[str.size()] = '\0';
    errno = 0;
    long l_val = ::strtol(buffer, &eptr, base);
    if (errno == ERANGE)
        return num_conv_result::overflow;
    if (eptr != buffer + str.size())
        return num_conv_result::garbage;

    if constexpr (std::is_same_v<T, long>) {
        val = l_val;
        return num_conv_result::ok;
    } else {
        if (l_val < static_cast<long>(std::numeric_limits<T>::min()) ||
            l_val > static_cast<long>(std::numeric_limits<T>::max()))
            return num_conv_result::overflow;
        val = static_cast<T>(l_val);
        return num_conv_result::ok;
    }
}

template <class T>
num_conv_result to_number_ref(std::string_view str, T& val, int base,
        std::enable_if_t<details::is_for_strtoul<T>::value, void>*) {

    char* eptr;
    char buffer[std::numeric_limits<T>::digits10 + 3];

    str = trim(str);

    if (str.empty() || *str.begin() == '-')
        return num_conv_result::garbage;

    if (str.size() >= sizeof(buffer))
        return num_conv_result::overflow;

    str.copy(buffer, str.size());
    buffer[str.size()] = '\0';
    errno = 0;
    unsigned long l_val = ::strtoul(buffer, &eptr, base);
    if (errno == ERANGE)
        return num_conv_result::overflow;
    if (eptr != buffer + str.size())
        return num_conv_result::garbage;

    if constexpr (std::is_same_v<T, unsigned long>) {
        val = l_val;
        return num_conv_result::ok;
    } else {
        if (l_val > static_cast<unsigned long>(std::numeric_limits<T>::max()))
            return num_conv_result::overflow;
        val = static_cast<T>(l_val);
        return num_conv_result::ok;
    }
}

template num_conv_result to_number_ref<char>(std::string_view, char&, int, void*);
template num_conv_result to_number_ref<signed char>(std::string_view, signed char&, int, void*);
template num_conv_result to_number_ref<unsigned char>(std::string_view, unsigned char&, int, void*);
template num_conv_result to_number_ref<signed short>(std::string_view, signed short&, int, void*);
template num_conv_result to_number_ref<unsigned short>(std::string_view, unsigned short&, int, void*);
template num_conv_result to_number_ref<signed int>(std::string_view, signed int&, int, void*);
template num_conv_result to_number_ref<unsigned int>(std::string_view, unsigned int&, int, void*);
template num_conv_result to_number_ref<signed long>(std::string_view, signed long&, int, void*);
template num_conv_result to_number_ref<unsigned long>(std::string_view, unsigned long&, int, void*);

} // ns diag_interceptor::utils
