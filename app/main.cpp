#include "commands/extract.hpp"
#include "commands/inspect.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  listing-parser extract [args]\n"
        << "  listing-parser inspect [args] \"<title>\"\n"
        << "  listing-parser help\n";
    return 1;
}

static int print_extract_help() {
    std::cerr
        << "usage:\n"
        << "  listing-parser extract --in <path> [options]\n"
        << "\n"
        << "input/output:\n"
        << "  --in <path>                  (required) .jsonl, .json or one title per line\n"
        << "  --out <path>                 default: - (stdout), one JSON object per line\n"
        << "\n"
        << "extraction:\n"
        << "  --lexicon <path>             optional JSON lexicon overrides\n"
        << "  --no_fallback                do not retry region rules on the extracted address\n"
        << "  --min_building_len <n>       default: 3\n";
    return 0;
}

static int print_inspect_help() {
    std::cerr
        << "usage:\n"
        << "  listing-parser inspect [options] \"<title>\"\n"
        << "\n"
        << "options:\n"
        << "  --title <str>                title (alternative to the positional argument)\n"
        << "  --lexicon <path>             optional JSON lexicon overrides\n"
        << "  --out <path>                 optional: mirror console output to a file\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "extract" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_extract_help();
    if (cmd == "inspect" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_inspect_help();

    if (cmd == "extract") return cmd_extract(argc - 1, argv + 1);
    if (cmd == "inspect") return cmd_inspect(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
