#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"


namespace fluxring::examples::cli {

// -------------------------------------------------------------
// Profile path validator (empty = built-in defaults)
// -------------------------------------------------------------
inline auto json_path_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty() || (value.size() > 5 && value.compare(value.size() - 5, 5, ".json") == 0)) {
            return {};
        }
        return "Profile must be a .json file";
    },
    "JSON profile validator"
);

struct PipelineParams {
    std::string profile;
    std::int64_t count      = 1000;
    std::int64_t fail_every = 0;
    std::string log_level   = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Profile    : " << (profile.empty() ? "<defaults>" : profile) << "\n"
           << "  Count      : " << count << "\n"
           << "  Fail every : " << fail_every << "\n"
           << "  Log Level  : " << log_level << "\n";
    }
};

[[nodiscard]]
inline PipelineParams configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    PipelineParams params{};

    app.add_option("-p,--profile", params.profile, "Pipeline profile (JSON)")->check(json_path_validator);
    app.add_option("-n,--count", params.count, "Number of values produced by the source")
        ->check(CLI::PositiveNumber)->default_val(params.count);
    app.add_option("-f,--fail-every", params.fail_every, "Inject an upstream error after every N values (0 = never)")
        ->check(CLI::NonNegativeNumber)->default_val(params.fail_every);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->default_val(params.log_level);

    app.footer(
        "Source -> retry -> ring buffer processor -> buffer -> sink.\n"
        "Demand flows right to left; windows are printed as they arrive."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace fluxring::examples::cli
