#include "polymer/Ensemble.h"
#include "polymer/Statistics.h"
#include "io/Snapshot.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cstdlib>
#include <string>

static void printHelp() {
    std::cerr << "Polymer Sampler Commands:\n"
              << "  plain N L          # N Rosenbluth chains grown towards length L\n"
              << "  complete N L       # sample until N chains reach length L\n"
              << "  perm N c L         # PERM run: N seeds, bias factor c, length L\n"
              << "  free N L           # N free random walks of length L\n"
              << "  averages           # weighted <R^2> and <Rg^2> per length (last run)\n"
              << "  rounds             # PERM round statistics as CSV\n"
              << "  chain I            # JSON of chain I (active chains first)\n"
              << "  metrics            # ensemble population summary\n"
              << "  reset [seed]       # drop all chains, reseed the engine\n"
              << "  help               # this text\n"
              << "  quit               # exit\n"
              << "\nOptions: --seed=S --origin=X,Y --verbose, or SAW_SEED env var\n";
}

static bool parseOrigin(const std::string& text, Site& origin) {
    const auto comma = text.find(',');
    if (comma == std::string::npos) return false;
    try {
        origin.x = std::stoi(text.substr(0, comma));
        origin.y = std::stoi(text.substr(comma + 1));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

static EnsembleMatrices g_lastMatrices;
static bool g_haveMatrices = false;

int main(int argc, char** argv) {
    EnsembleConfig cfg;

    if (const char* envSeed = std::getenv("SAW_SEED")) {
        cfg.seed = std::strtoull(envSeed, nullptr, 10);
    }

    const char* scriptArg = nullptr;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--seed=", 0) == 0) {
            cfg.seed = std::strtoull(arg.substr(7).c_str(), nullptr, 10);
        } else if (arg.rfind("--origin=", 0) == 0) {
            if (!parseOrigin(arg.substr(9), cfg.origin)) {
                std::cerr << "Invalid origin: " << arg.substr(9) << " (expected X,Y)\n";
                return 1;
            }
        } else if (arg == "--verbose" || arg == "-v") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        } else if (arg.size() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else {
            scriptArg = argv[i];
            break;
        }
    }

    Ensemble ensemble(cfg);

    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd) || cmd[0] == '#') {
            continue;
        }

        try {
            if (cmd == "plain" || cmd == "complete" || cmd == "free") {
                int n = 100;
                int len = 20;
                iss >> n >> len;
                if (cmd == "plain") {
                    g_lastMatrices = ensemble.generatePlain(n, len);
                } else if (cmd == "complete") {
                    g_lastMatrices = ensemble.generateComplete(n, len);
                } else {
                    g_lastMatrices = ensemble.generateFreeWalks(n, len);
                }
                g_haveMatrices = true;
                std::cout << cmd << ": " << g_lastMatrices.weight.rows << " rows x "
                          << g_lastMatrices.weight.cols << " lengths\n";
                std::cout.flush();

            } else if (cmd == "perm") {
                int n = 100;
                double cplus = 10.0;
                int len = 50;
                iss >> n >> cplus >> len;
                g_lastMatrices = ensemble.runPerm(n, cplus, len);
                g_haveMatrices = true;
                const auto& res = ensemble.lastPermResult();
                std::cout << "perm: " << permStatusName(res.status)
                          << ", length " << res.achievedLength << "/" << len
                          << ", rounds " << res.roundsRun
                          << ", chains " << ensemble.activeChains().size() << " active + "
                          << ensemble.discardedChains().size() << " discarded\n";
                std::cout.flush();

            } else if (cmd == "averages") {
                if (!g_haveMatrices) {
                    std::cout << "No samples yet. Run 'plain', 'complete', 'perm' or 'free' first.\n";
                    continue;
                }
                const auto r2 = weightedAverage(g_lastMatrices.endToEnd, g_lastMatrices.weight);
                const auto rg = weightedAverage(g_lastMatrices.gyration, g_lastMatrices.weight);
                std::cout << std::setprecision(6);
                logAverages(r2, rg, std::cout);
                std::cout.flush();

            } else if (cmd == "rounds") {
                logRoundStats(ensemble.roundHistory(), std::cout);
                std::cout.flush();

            } else if (cmd == "chain") {
                std::size_t idx = 0;
                iss >> idx;
                std::cout << chainToJson(ensemble.chainAt(idx)) << "\n";
                std::cout.flush();

            } else if (cmd == "metrics") {
                auto m = ensemble.computeMetrics();
                std::cout << "Chains: " << m.totalChains
                          << " (active " << m.activeChains
                          << ", discarded " << m.discardedChains << ")\n"
                          << "Pruned: " << m.prunedChains
                          << " (dead ends " << m.deadEnds << ")\n"
                          << "Mean length: " << std::fixed << std::setprecision(2) << m.meanLength << "\n"
                          << "Max length: " << m.maxLength << "\n";
                std::cout << std::defaultfloat;
                std::cout.flush();

            } else if (cmd == "reset") {
                std::uint64_t seed = cfg.seed;
                if (iss >> seed) {
                    cfg.seed = seed;
                }
                ensemble.reset(cfg);
                g_haveMatrices = false;
                std::cout << "Reset with seed " << cfg.seed << "\n";
                std::cout.flush();

            } else if (cmd == "help") {
                printHelp();

            } else if (cmd == "quit" || cmd == "exit") {
                break;

            } else {
                std::cerr << "Unknown command: " << cmd << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
        }
    }

    return 0;
}
