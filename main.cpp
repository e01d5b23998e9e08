#include <NestSamp/CLI.h>
#include <NestSamp/NestApp.h>

int main(int argc, const char* argv[]) {
    const NEST::CLIArgs args = NEST::parse_args(argc, argv);
    if (args.steps.empty()) { return 0; } // help requested

    NEST::NestApp app;
    return NEST::run(&app, args) ? 0 : 1;
}
