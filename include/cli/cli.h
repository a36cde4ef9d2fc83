#pragma once

#include "core/types.h"
#include <string>
#include <vector>

namespace cryptotrade {
namespace cli {

// Process exit codes: 0 success, 1 bad usage or input, 2 the ledger refused.
static constexpr int EXIT_USAGE = 1;
static constexpr int EXIT_FAILED = 2;

struct CliOptions {
    std::string configPath;
    std::string dbPath;
    std::string pricesPath;
    std::string logLevel;
    bool json = false;
    bool showHelp = false;
    bool showVersion = false;
    std::vector<std::string> args;
};

// Options stop at the first command word, so "sell alice BTC/USDT -1" keeps -1 as an argument.
bool parseArgs(int argc, char* argv[], CliOptions& opts);

// Reads {"BTC": 50000.0, ...}; symbols are upper-cased.
bool loadPrices(const std::string& path, core::PriceMap& out, std::string& err);

int runCli(int argc, char* argv[]);

}
}
