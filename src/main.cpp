#include <iostream>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "common/options.hpp"
#include "linter/linter.hpp"

using namespace schemalint;

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "schemalint";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    try {
        LintOptions options = parse_options(args);
        if (options.show_help) {
            std::cout << usage(program);
            return 0;
        }
        Linter linter(std::move(options));
        linter.run(std::cout);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n" << usage(program);
        return exit_code_for(e);
    } catch (const LintError& e) {
        // exactly one diagnostic: the first violation
        std::cerr << e.what() << std::endl;
        return exit_code_for(e);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
