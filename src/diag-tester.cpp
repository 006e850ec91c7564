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
#include "catcher_executor.h"
#include "report_config.h"
#include "reporter.h"
#include "utils.h"

#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <vector>

#include <getopt.h>

namespace di = diag_interceptor;

namespace {

// Lowers severity of reports with the given id by one step: fatal -> error -> warning -> info
class demoting_catcher final : public di::report_catcher {
public:
    explicit demoting_catcher(std::string id)
        : report_catcher("demote " + id), m_id(std::move(id)) {
    }

    di::catch_verdict on_message(di::catcher_context& ctx) override {
        if (ctx.get_id() == m_id && ctx.get_severity() > di::severity::info) {
            ctx.set_severity(static_cast<di::severity>((int)ctx.get_severity() - 1));
            ctx.add_string("demoted_by", name());
        }
        return di::catch_verdict::rethrow;
    }

private:
    const std::string m_id;
};

struct tester_params {
    const char* m_config_path = nullptr;
    const char* m_summary_path = nullptr;
    std::vector<std::string> m_demote_ids;
    std::vector<std::string> m_catch_ids;
    std::uint32_t m_debug_flags = 0;
    bool m_debug_flags_set = false;
    bool m_trace = false;
};

int run_reports(const tester_params& params) {
    di::reporter rep{std::cout};

    if (params.m_config_path)
        di::apply_config(di::load_report_config(params.m_config_path), rep);
    if (params.m_debug_flags_set)
        rep.executor().set_debug_flags(params.m_debug_flags);
    if (params.m_trace)
        rep.catchers().set_trace(true);

    for (const auto& id : params.m_demote_ids)
        rep.catchers().emplace<demoting_catcher>(nullptr, id);

    for (const auto& id : params.m_catch_ids)
        rep.catchers().add("catch " + id, [id](di::catcher_context& ctx) {
            return ctx.get_id() == id ? di::catch_verdict::caught : di::catch_verdict::rethrow;
        });

    std::cout << "reading reports from stdin as 'SEVERITY ID text' lines, "
        << rep.catchers().size() << " catchers installed" << std::endl;

    int rc = 0;
    std::string line;
    unsigned line_no = 0;

    try {
        while (getline(std::cin, line)) {
            ++line_no;
            std::istringstream iss{line};

            std::string sev_str, id;
            iss >> sev_str >> id;
            if (sev_str.empty() || sev_str[0] == '#')
                continue;

            auto sev = di::severity_from_str(sev_str);
            if (! sev || id.empty()) {
                std::cerr << "line " << line_no << ": malformed report, skipped" << std::endl;
                continue;
            }

            std::string text;
            getline(iss, text);
            rep.report(*sev, id, std::string{di::utils::trim(text)},
                di::verbosity_none, "<stdin>", (int)line_no);
        }
    } catch (const di::report_exit& e) {
        std::cerr << "exit requested by " << e.get_severity() << " report '" << e.get_id() << '\'' << std::endl;
        rc = 2;
    }

    if (params.m_summary_path) {
        std::ofstream os{params.m_summary_path};
        if (! os)
            throw std::runtime_error("unable to open summary file '" + std::string{params.m_summary_path} + '\'');
        rep.summarize(&os);
    } else {
        rep.summarize();
    }

    return rc;
}

void usage(const char* this_binary) {
    if (auto p = strrchr(this_binary, '/'))
        this_binary = p + 1;

    std::cout <<
        "This '" << this_binary << "' is an utility for testing a diag-interceptor library.\n"
        "\n"
        "Usage: " << this_binary << " [OPTIONS] < REPORTS\n"
        "\n"
        "Options:\n"
        "  -h, --help          - this help message\n"
        "  -c FILE             - reporter configuration file\n"
        "  -d ID, --demote ID  - install a catcher lowering severity of reports with ID\n"
        "  -k ID, --catch ID   - install a catcher suppressing reports with ID\n"
        "  -D N                - catcher debug flags (1 - ignore catch, 2 - discard mutations)\n"
        "  -s FILE             - write the catcher summary into FILE instead of stdout\n"
        "  --trace             - trace catcher registrations"
        << std::endl;
}

} // anonymous ns

int main(int argc, char* argv[]) {
    try {
        const struct option long_opts[] = {
            {"help", 0, nullptr, 'h'},
            {"demote", 1, nullptr, 'd'},
            {"catch", 1, nullptr, 'k'},
            {"trace", 0, nullptr, 1},
            {}};

        tester_params params;
        int opt;

        while ((opt = ::getopt_long(argc, argv, "hc:d:k:D:s:", long_opts, nullptr)) != -1) {
            switch (opt) {
            case 'h':
                usage(argv[0]); return 0;
            case 'c':
                params.m_config_path = optarg; break;
            case 'd':
                params.m_demote_ids.emplace_back(optarg); break;
            case 'k':
                params.m_catch_ids.emplace_back(optarg); break;
            case 'D':
                params.m_debug_flags = di::utils::to_number<unsigned>(optarg, 0);
                params.m_debug_flags_set = true;
                break;
            case 's':
                params.m_summary_path = optarg; break;
            case 1:
                params.m_trace = true; break;
            default:
                return 1;
            }
        }

        return run_reports(params);
    } catch (const std::exception& ex) {
        std::cerr << "unexpected error: " << di::utils::dump_exc_with_nested(ex) << std::endl;
        return 1;
    }
}
