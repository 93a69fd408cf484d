#include <iostream>
#include <string>
#include "cli/arg_parser.hpp"
#include "cli/ssm_cli.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "platform/signals.hpp"
#include "ssh/name_lookup.hpp"

#ifndef SSM_VERSION
#define SSM_VERSION "0.0.0"
#endif

int main(int argc, char** argv) {
    try {
        auto parsed = parse_args(argc, argv);
        if (parsed.is_err()) {
            std::cerr << usage_line();
            std::cerr << theme::fail(parsed.error);
            return EXIT_USAGE;
        }

        const CliArgs& args = parsed.value;
        if (args.help) {
            std::cout << help_text();
            return 0;
        }
        if (args.version) {
            std::cout << theme::bold("ssm") << theme::dim(" version " SSM_VERSION) << "\n";
            return 0;
        }

        auto config = Config::load([](const std::string& msg) {
            std::cerr << theme::warn(msg);
        });
        if (config.is_err()) {
            std::cerr << theme::fail(config.error);
            return 1;
        }

        // getaddrinfo can block for a long time and can't be cancelled
        platform::exit_quietly_on_interrupt(EXIT_INTERRUPTED);

        SystemNameLookup lookup;
        SsmCli cli(config.value.settings(), lookup);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
