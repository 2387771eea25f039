// HTTP load generator (C++23)

#include <cstdlib>
#include <string_view>

#include <fmt/core.h>

#include "hb/app.hpp"
#include "hb/cli.hpp"
#include "hb/logging.hpp"
#include "hb/options.hpp"

int main(int argc, char **argv)
{
    hb::Options opt;
    if (!hb::parse_args(argc, argv, opt))
    {
        // --help is not an error
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view a = argv[i];
            if (a == "-h" || a == "--help") return EXIT_SUCCESS;
        }
        return EXIT_FAILURE;
    }

    if (!hb::init_logging(opt.log_level))
    {
        fmt::print(stderr, "unknown log level: {}\n", opt.log_level);
        return EXIT_FAILURE;
    }

    return hb::run_app(opt);
}
