#include "core/cli.hpp"
#include "app.hpp"

#include <iostream>
#include <signal.h>

int main(int argc, char* argv[]) {
    // A host that stops reading must not kill us mid-write
    signal(SIGPIPE, SIG_IGN);

    CliOptions options = CLI::parse(argc, argv);

    int cli_result = CLI::run(options);
    if (cli_result != -1) {
        // handled by CLI (help, version, internal refresh)
        return cli_result;
    }

    App app(options);
    return app.run(std::cin, std::cout);
}
