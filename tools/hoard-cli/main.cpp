#include <spdlog/spdlog.h>
#include <hoard/cli/hoard_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Set up logging with conservative default; HoardCLI::run() adjusts based on flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        hoard::cli::HoardCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
