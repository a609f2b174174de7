/**
 * @file maintbranch.cpp
 * @brief CLI entry point creating maintenance branches from release tags.
 */

#include <iostream>

#include "cancellation.hpp"
#include "cli_commands.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return Zero on success or when printing help/version, 130 when
 *         interrupted, otherwise the maintbranch::ExitCode of the failed step.
 */
#ifndef MAINTBRANCH_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0], std::cout);
            return 0;
        }
        if (opts.print_version) {
            std::cout << MAINTBRANCH_VERSION << "\n";
            return 0;
        }
        cli::configure_logging(opts.logging);
        maintbranch::CancellationToken token;
        maintbranch::install_signal_cancellation(&token);
        int rc = cli::run_maintenance(opts, token);
        maintbranch::install_signal_cancellation(nullptr);
        shutdown_logger();
        return rc;
    } catch (const maintbranch::MaintenanceError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return maintbranch::to_int(e.exit_code());
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
#endif // MAINTBRANCH_NO_MAIN
