#include "cli_common.hpp"
#include <common/logging.hpp>
#include <string>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Repairs analytical frame models so that members crossing in plan share nodes.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  connect   Split lines at their intersections and record lineage\n";
    std::cerr << "  govern    Write governing solver sections back onto original members\n";
    std::cerr << "\n";
    std::cerr << "Run '" << program_name << " <command> --help' for command options.\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  FRAMESPLICE_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "connect") {
        return framesplice::cli::command_connect(argc, argv);
    } else if (command == "govern") {
        return framesplice::cli::command_govern(argc, argv);
    } else if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    framesplice::logging::get_logger()->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
