// ==========================
// latin_cli: cyclic Latin square generator
// ==========================
// Parses: -n <order> | -s <a,b,c>  [--verify] [--cube]
// Builds the cyclic Latin square over 1..n or over the given labels and
// prints it. --verify re-checks the rows/columns, --cube prints the
// incidence cube summary.
// ==========================

#include "algo/CyclicGenerator.hpp"   // generate(), generateCyclic()
#include "algo/Validator.hpp"         // isLatinSquare()
#include "square/IncidenceCube.hpp"   // IncidenceCube
#include <getopt.h>                   // getopt_long for command-line parsing
#include <cstdlib>                    // std::strtol, std::exit
#include <iostream>                   // I/O
#include <sstream>                    // std::istringstream to split labels
#include <string>                     // std::string
#include <vector>                     // std::vector

using namespace latinsq;

namespace {

struct Options {
    long order = -1;                  // -n
    std::string symbols;              // -s / --symbols
    bool haveSymbols = false;
    bool verify = false;              // --verify
    bool cube = false;                // --cube
};

void usage(const char* prog) {                                    // print usage and exit
    std::cerr << "Usage: " << prog
              << " (-n <order> | -s <a,b,c>) [--verify] [--cube]\n";
    std::exit(1);
}

std::vector<std::string> splitLabels(const std::string& csv) {   // "a,b,c" -> {a,b,c}
    std::vector<std::string> out;
    std::istringstream in(csv);
    for (std::string item; std::getline(in, item, ','); )
        out.push_back(item);
    return out;
}

template <typename Symbol>
void report(const LatinSquare<Symbol>& square, const Options& opts) {
    std::cout << "Generated " << square.label() << "\n\n";
    std::cout << square << "\n";

    if (opts.verify) {
        std::cout << "\nrows and columns are permutations: "
                  << (isLatinSquare(square) ? "yes" : "NO") << "\n";
    }
    if (opts.cube) {
        IncidenceCube cube = IncidenceCube::fromSquare(square);
        std::cout << "\n" << cube.label()
                  << ", proper: " << (cube.isProper() ? "yes" : "NO") << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {                                // entry point
    Options opts;
    int li = 0;
    option lo[] = {{"symbols", required_argument, nullptr, 's'},
                   {"verify",  no_argument,       nullptr, 'V'},
                   {"cube",    no_argument,       nullptr, 'C'},
                   {nullptr, 0, nullptr, 0}};                     // long options

    for (int opt; (opt = getopt_long(argc, argv, "n:s:", lo, &li)) != -1; ) { // parse flags
        if (opt == 'n') {
            char* end = nullptr;
            opts.order = std::strtol(optarg, &end, 10);           // order
            if (end == optarg || *end != '\0') usage(argv[0]);
        }
        else if (opt == 's') { opts.symbols = optarg; opts.haveSymbols = true; }
        else if (opt == 'V') opts.verify = true;
        else if (opt == 'C') opts.cube = true;
        else usage(argv[0]);                                       // invalid flag
    }

    if (optind != argc) usage(argv[0]);                           // stray arguments
    if ((opts.order >= 0) == opts.haveSymbols) usage(argv[0]);    // exactly one source of symbols

    try {
        if (opts.haveSymbols)
            report(generate(splitLabels(opts.symbols)), opts);
        else
            report(generateCyclic(static_cast<std::size_t>(opts.order)), opts);
    } catch (const InvalidInputError& e) {
        std::cerr << InvalidInputError::kindName(e.kind()) << ": " << e.what() << "\n";
        return 2;
    }

    return 0;                                                     // success
}
