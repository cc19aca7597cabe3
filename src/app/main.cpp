/**
 * @file main.cpp
 * @brief Точка входа CLI Geomech
 */

#include "run_command.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        geomech::app::RunCommandOptions options;
        try {
            options = geomech::app::parseRunArguments(args);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n\n" << geomech::app::usageText();
            return 1;
        }

        if (options.show_help) {
            std::cout << geomech::app::usageText();
            return 0;
        }
        if (options.show_version) {
            std::cout << "geomech " << GEOMECH_VERSION << " (" << GEOMECH_BUILD_TYPE << ")" << std::endl;
            return 0;
        }

        auto result = options.detect_only
            ? geomech::app::runDetectColumns(options, std::cout, std::cerr)
            : geomech::app::runCommand(options, std::cout, std::cerr);
        return result.exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
