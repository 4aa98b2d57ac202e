#include "dayinit/cli.hpp"
#include "dayinit/error.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        dayinit::startup_config cfg{};
        if (auto cli_result = dayinit::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return dayinit::cli::run(cfg, std::cout);
    } catch (const dayinit::scaffold_error& e) {
        std::cerr << "error: " << e.what() << '\n';
        return dayinit::exit_code_for(e.kind());
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
