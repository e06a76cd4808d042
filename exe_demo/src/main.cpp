#include <boost/program_options.hpp>
#include <iostream>
#include <largest/logging/core.hpp>
#include <string>

#include "demo.hpp"

namespace po = boost::program_options;
namespace lg = largest::logging;

void print_help(const po::options_description &desc) {
    std::cout << "usage: exe [options]\n\n" << desc << std::endl;
    std::cout << "\nEXAMPLES:\n";
    std::cout << "  # Print the demonstration results:\n";
    std::cout << "    ./exe\n\n";
    std::cout << "  # Also trace every call to standard error:\n";
    std::cout << "    ./exe --log-level=debug\n\n";
    std::cout << "  # Trace every call to a file instead:\n";
    std::cout << "    ./exe --log-level=debug --log-file=demo.log\n";
}

int main(int argc, char *argv[]) {
    lg::init(lg::level::error, lg::sink_type::console);
    try {
        po::options_description desc("Options");
        desc.add_options()("help", "show help")(
            "log-level,l", po::value<std::string>()->default_value("error"),
            "set log level (trace, debug, info, error)")(
            "log-file,f", po::value<std::string>()->default_value(""),
            "write logs to this file instead of standard error");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            print_help(desc);
            return 0;
        }

        lg::level lvl = lg::parse_level(vm["log-level"].as<std::string>());
        std::string log_file = vm["log-file"].as<std::string>();
        if (log_file.empty()) {
            lg::init(lvl, lg::sink_type::console);
        } else {
            lg::init(lvl, lg::sink_type::file, log_file);
        }

        lg::write(lg::level::info, "[INFO]: Running demonstration");
        largest::demo::run(std::cout);
        lg::write(lg::level::info, "[INFO]: Done");
    } catch (const std::exception &e) {
        lg::write(lg::level::error, e.what());
        return 1;
    }

    return 0;
}
