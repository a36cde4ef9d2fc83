#include <gtest/gtest.h>
#include "cli/cli.h"
#include "core/game.h"
#include "test_support.h"
#include <nlohmann/json.hpp>
#include <fstream>

using namespace cryptotrade;
using namespace cryptotrade::cli;
using json = nlohmann::json;

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = test::makeTempDir("cli");
        db = (dir / "ledger.db").string();
    }

    void TearDown() override {
        utils::Logger::enableConsole(true);
        utils::Logger::setLevel(utils::LogLevel::WARN);
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    int run(std::vector<std::string> args) {
        args.insert(args.begin(), "cryptotrade");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);
        return runCli(static_cast<int>(args.size()), argv.data());
    }

    json runJson(std::vector<std::string> args, int& rc) {
        args.insert(args.begin(), {"-d", db, "-j"});
        testing::internal::CaptureStdout();
        rc = run(args);
        return json::parse(testing::internal::GetCapturedStdout(), nullptr, false);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = (dir / name).string();
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir;
    std::string db;
};

TEST_F(CliTest, OptionsStopAtTheCommandWord) {
    std::vector<std::string> args = {"cryptotrade", "-j", "--db", "x.db", "-l", "debug",
                                     "sell", "alice", "BTC/USDT", "-1"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    CliOptions opts;
    ASSERT_TRUE(parseArgs(static_cast<int>(args.size()), argv.data(), opts));
    EXPECT_TRUE(opts.json);
    EXPECT_EQ(opts.dbPath, "x.db");
    EXPECT_EQ(opts.logLevel, "debug");
    EXPECT_EQ(opts.args, (std::vector<std::string>{"sell", "alice", "BTC/USDT", "-1"}));

    std::vector<std::string> bad = {"cryptotrade", "--bogus", "audit"};
    std::vector<char*> badArgv;
    for (auto& a : bad) badArgv.push_back(a.data());
    badArgv.push_back(nullptr);
    CliOptions other;
    EXPECT_FALSE(parseArgs(static_cast<int>(bad.size()), badArgv.data(), other));
}

TEST_F(CliTest, LoadsPriceSnapshot) {
    core::PriceMap prices;
    std::string err;
    ASSERT_TRUE(loadPrices(writeFile("prices.json", R"({"btc": 50000, "ETH": 2500.5})"), prices, err)) << err;
    EXPECT_DOUBLE_EQ(prices.at("BTC"), 50000.0);
    EXPECT_DOUBLE_EQ(prices.at("ETH"), 2500.5);

    core::PriceMap ignored;
    EXPECT_FALSE(loadPrices((dir / "missing.json").string(), ignored, err));
    EXPECT_NE(err.find("cannot open"), std::string::npos);
    EXPECT_FALSE(loadPrices(writeFile("list.json", "[1, 2]"), ignored, err));
    EXPECT_FALSE(loadPrices(writeFile("broken.json", "{\"BTC\": "), ignored, err));
    EXPECT_FALSE(loadPrices(writeFile("text.json", R"({"BTC": "high"})"), ignored, err));
    EXPECT_NE(err.find("BTC"), std::string::npos);
}

TEST_F(CliTest, UsageErrorsExitWithOne) {
    EXPECT_EQ(run({}), EXIT_USAGE);
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_EQ(run({"-d", db, "frobnicate"}), EXIT_USAGE);
    EXPECT_EQ(run({"-d", db, "-p", (dir / "missing.json").string(), "audit"}), EXIT_USAGE);
    EXPECT_EQ(run({"-d", db, "-l", "chatty", "audit"}), EXIT_USAGE);
    EXPECT_EQ(run({"-d", db, "buy", "alice", "BTCUSDT", "0.1"}), EXIT_USAGE);
    EXPECT_EQ(run({"-d", db, "buy", "alice", "BTC/USDT", "lots"}), EXIT_USAGE);
}

TEST_F(CliTest, LedgerRefusalsExitWithTwo) {
    int rc = -1;
    json missing = runJson({"wallets", "alice"}, rc);
    EXPECT_EQ(rc, EXIT_FAILED);
    EXPECT_FALSE(missing["ok"].get<bool>());
    EXPECT_EQ(missing["error"]["code"], "NotFound");

    json login = runJson({"login", "alice", "Alice"}, rc);
    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(login["ok"].get<bool>());

    json noPrice = runJson({"buy", "alice", "BTC/USDT", "0.1"}, rc);
    EXPECT_EQ(rc, EXIT_FAILED);
    EXPECT_EQ(noPrice["error"]["code"], "PriceUnavailable");

    std::string prices = writeFile("prices.json", R"({"BTC": 50000})");
    json bought = runJson({"-p", prices, "buy", "alice", "BTC/USDT", "0.1"}, rc);
    EXPECT_EQ(rc, 0);
    EXPECT_EQ(bought["fee"], "5.00000000");

    json bonus = runJson({"bonus", "alice"}, rc);
    EXPECT_EQ(rc, 0);
    json again = runJson({"bonus", "alice"}, rc);
    EXPECT_EQ(rc, EXIT_FAILED);
    EXPECT_EQ(again["error"]["code"], "TooEarly");
    EXPECT_GT(again["error"]["retry_after"].get<uint64_t>(), 0u);

    json audit = runJson({"audit"}, rc);
    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(audit["journal_mismatches"].empty());

    utils::StorageConfig storage;
    storage.databasePath = db;
    core::TradingGame game(storage, utils::GameConfig());
    ASSERT_TRUE(game.open().ok());
    auto account = game.accounts().findByExternalId("alice");
    ASSERT_TRUE(account.ok());
    auto usdt = game.store().getWallet(account.value().id, "USDT");
    ASSERT_TRUE(usdt.ok());
    EXPECT_EQ(usdt.value().balance, core::toAmount(10000 - 5005 + 50));
    game.close();
}
