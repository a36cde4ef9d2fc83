#include <gtest/gtest.h>
#include "utils/config.h"
#include "utils/utils.h"
#include "core/ledger.h"
#include "test_support.h"
#include <sqlite3.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace cryptotrade;
using namespace cryptotrade::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = test::makeTempDir("config");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
        unsetenv("CRYPTOTRADE_GAME_FEE_RATE");
        unsetenv("CRYPTOTRADE_STORAGE_DATABASE");
        unsetenv("CRYPTOTRADE_DB");
    }

    std::filesystem::path testDir;
};

TEST_F(ConfigTest, DefaultsMatchGameConfig) {
    Config cfg;
    GameConfig game = cfg.getGameConfig();
    GameConfig defaults;
    EXPECT_EQ(game.supportedCurrencies, defaults.supportedCurrencies);
    EXPECT_EQ(game.supportedCurrencies.size(), 16u);
    EXPECT_EQ(game.baseCurrency, "USDT");
    EXPECT_DOUBLE_EQ(game.initialBalance, 10000.0);
    EXPECT_DOUBLE_EQ(game.feeRate, 0.001);
    EXPECT_DOUBLE_EQ(game.bonusAmount, 50.0);
    EXPECT_EQ(game.bonusCooldownSeconds, 86400u);
    EXPECT_TRUE(game.validate().ok());

    LogConfig log = cfg.getLogConfig();
    EXPECT_EQ(log.level, "info");
    EXPECT_TRUE(log.console);
    EXPECT_TRUE(log.file.empty());
}

TEST_F(ConfigTest, LoadParsesKeyValueFile) {
    auto path = testDir / "cryptotrade.conf";
    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "game.currencies = USDT, BTC ,ETH\n";
        out << "game.initial_balance=250\n";
        out << "game.bonus_cooldown=60\n";
        out << "storage.database=" << (testDir / "x.db").string() << "\n";
        out << "storage.pool_size=0\n";
        out << "log.console=off\n";
    }

    Config cfg;
    ASSERT_TRUE(cfg.load(path.string()));
    EXPECT_EQ(cfg.getConfigPath(), path.string());

    GameConfig game = cfg.getGameConfig();
    EXPECT_EQ(game.supportedCurrencies, (std::vector<std::string>{"USDT", "BTC", "ETH"}));
    EXPECT_DOUBLE_EQ(game.initialBalance, 250.0);
    EXPECT_EQ(game.bonusCooldownSeconds, 60u);

    StorageConfig storage = cfg.getStorageConfig();
    EXPECT_EQ(storage.databasePath, (testDir / "x.db").string());
    EXPECT_EQ(storage.poolSize, 1u);
    EXPECT_FALSE(cfg.getLogConfig().console);

    EXPECT_FALSE(cfg.load((testDir / "missing.conf").string()));
}

TEST_F(ConfigTest, SaveAndReload) {
    Config cfg;
    GameConfig game;
    game.supportedCurrencies = {"USDT", "SOL"};
    game.feeRate = 0.0025;
    cfg.setGameConfig(game);
    auto path = (testDir / "saved.conf").string();
    ASSERT_TRUE(cfg.save(path));

    Config reloaded;
    reloaded.clear();
    ASSERT_TRUE(reloaded.load(path));
    GameConfig back = reloaded.getGameConfig();
    EXPECT_EQ(back.supportedCurrencies, game.supportedCurrencies);
    EXPECT_DOUBLE_EQ(back.feeRate, 0.0025);
    EXPECT_EQ(reloaded.keys("game.").size(), cfg.keys("game.").size());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("CRYPTOTRADE_GAME_FEE_RATE", "0.01", 1);
    setenv("CRYPTOTRADE_STORAGE_DATABASE", "/tmp/ignored.db", 1);
    setenv("CRYPTOTRADE_DB", "/tmp/override.db", 1);

    Config cfg;
    EXPECT_GE(cfg.applyEnvironment(), 3u);
    EXPECT_DOUBLE_EQ(cfg.getGameConfig().feeRate, 0.01);
    EXPECT_EQ(cfg.getStorageConfig().databasePath, "/tmp/override.db");
}

TEST_F(ConfigTest, TypedGettersFallBack) {
    Config cfg;
    cfg.set("x.number", "not-a-number");
    EXPECT_EQ(cfg.getInt("x.number", 7), 7);
    EXPECT_DOUBLE_EQ(cfg.getDouble("x.number", 1.5), 1.5);
    EXPECT_EQ(cfg.getString("x.absent", "dflt"), "dflt");

    std::string changed;
    cfg.onChange([&](const std::string& key) { changed = key; });
    cfg.set("x.flag", true);
    EXPECT_EQ(changed, "x.flag");
    EXPECT_TRUE(cfg.getBool("x.flag"));
    cfg.remove("x.flag");
    EXPECT_FALSE(cfg.has("x.flag"));
}

TEST_F(ConfigTest, ListsAndDataDir) {
    Config cfg;
    cfg.setList("game.currencies", {"USDT", "BTC"});
    EXPECT_EQ(cfg.getString("game.currencies"), "USDT,BTC");
    cfg.set("x.list", " a , ,b ");
    EXPECT_EQ(cfg.getList("x.list"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(cfg.getList("x.absent").empty());

    EXPECT_FALSE(cfg.getDataDir().empty());
    EXPECT_EQ(cfg.getStorageConfig().databasePath, cfg.getDataDir() + "/cryptotrade.db");
}

TEST_F(ConfigTest, LogRotationSettings) {
    Config cfg;
    LogConfig defaults = cfg.getLogConfig();
    EXPECT_EQ(defaults.maxFileSize, 10u * 1024 * 1024);
    EXPECT_EQ(defaults.maxFiles, 5u);

    cfg.set("log.max_file_size", static_cast<int64_t>(4096));
    cfg.set("log.max_files", 0);
    LogConfig log = cfg.getLogConfig();
    EXPECT_EQ(log.maxFileSize, 4096u);
    EXPECT_EQ(log.maxFiles, 1u);
}

TEST(GameConfigTest, ValidateRejectsBadSettings) {
    GameConfig base;
    base.supportedCurrencies = {"USDT", "BTC"};
    ASSERT_TRUE(base.validate().ok());

    GameConfig c = base;
    c.baseCurrency = "EUR";
    EXPECT_EQ(c.validate().code(), ErrorCode::INVALID_CONFIG);

    c = base;
    c.supportedCurrencies = {"USDT", "BTC", "BTC"};
    EXPECT_EQ(c.validate().code(), ErrorCode::INVALID_CONFIG);

    c = base;
    c.supportedCurrencies = {"USDT", "BTC/ETH"};
    EXPECT_EQ(c.validate().code(), ErrorCode::INVALID_CONFIG);

    c = base;
    c.supportedCurrencies.clear();
    EXPECT_EQ(c.validate().code(), ErrorCode::INVALID_CONFIG);

    c = base;
    c.initialBalance = -1.0;
    EXPECT_EQ(c.validate().code(), ErrorCode::INVALID_CONFIG);

    c = base;
    c.feeRate = 1.0;
    EXPECT_EQ(c.validate().code(), ErrorCode::INVALID_CONFIG);

    c = base;
    c.bonusCooldownSeconds = 0;
    EXPECT_EQ(c.validate().code(), ErrorCode::INVALID_CONFIG);

    c = base;
    c.feeRate = 0.0;
    c.initialBalance = 0.0;
    EXPECT_TRUE(c.validate().ok());
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = test::makeTempDir("logger");
        Logger::enableConsole(false);
    }

    void TearDown() override {
        Logger::shutdown();
        Logger::setMaxFileSize(10 * 1024 * 1024);
        Logger::setMaxFiles(5);
        Logger::enableConsole(true);
        Logger::setLevel(LogLevel::WARN);
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path dir;
};

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parseLevel("Off", level));
    EXPECT_EQ(level, LogLevel::OFF);
    EXPECT_FALSE(Logger::parseLevel("verbose", level));
    EXPECT_FALSE(Logger::parseLevel("d\xC3\xA9" "bug", level));
}

TEST_F(LoggerTest, WritesCategorizedLinesAboveLevel) {
    auto path = dir / "ledger.log";
    Logger::init(path.string());
    Logger::setLevel(LogLevel::INFO);

    uint64_t errorsBefore = Logger::getErrorCount();
    LOG_CAT(DEBUG, "market", "filtered out");
    LOG_CAT(INFO, "escrow", "offer 7 created");
    LOG_CAT(ERROR, "ledger", "journal mismatch");
    Logger::flush();

    EXPECT_EQ(Logger::getErrorCount(), errorsBefore + 1);
    std::string text = readFile(path);
    EXPECT_EQ(text.find("filtered out"), std::string::npos);
    EXPECT_NE(text.find("[INFO ] [escrow] offer 7 created"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] [ledger] journal mismatch"), std::string::npos);
}

TEST_F(LoggerTest, RotatesBySizeAndKeepsConfiguredFiles) {
    auto path = dir / "ledger.log";
    Logger::setMaxFileSize(256);
    Logger::setMaxFiles(2);
    Logger::init(path.string());
    Logger::setLevel(LogLevel::INFO);

    for (int i = 0; i < 40; i++) {
        LOG_CAT(INFO, "ledger", "transfer account " + std::to_string(i) + " USDT 1.00000000");
    }
    Logger::flush();

    std::string base = path.string();
    EXPECT_TRUE(std::filesystem::exists(base));
    EXPECT_TRUE(std::filesystem::exists(base + ".1"));
    EXPECT_TRUE(std::filesystem::exists(base + ".2"));
    EXPECT_FALSE(std::filesystem::exists(base + ".3"));
    EXPECT_NE(readFile(base + ".1").find("transfer account"), std::string::npos);
}

TEST(ErrorHandlingTest, NamesAndRetryability) {
    EXPECT_STREQ(errorName(ErrorCode::INSUFFICIENT_FUNDS), "InsufficientFunds");
    EXPECT_STREQ(errorName(ErrorCode::OFFER_NOT_ACTIVE), "OfferNotActive");
    EXPECT_STREQ(errorName(ErrorCode::TOO_EARLY), "TooEarly");
    EXPECT_STREQ(errorName(ErrorCode::INVARIANT_VIOLATION), "InvariantViolation");

    EXPECT_TRUE(isRetryable(ErrorCode::STORAGE_UNAVAILABLE));
    EXPECT_FALSE(isRetryable(ErrorCode::INSUFFICIENT_FUNDS));
    EXPECT_FALSE(isRetryable(ErrorCode::INVARIANT_VIOLATION));
}

TEST(ErrorHandlingTest, DatabaseErrorsMapToLedgerCodes) {
    Logger::setLevel(LogLevel::FATAL);
    database::DatabaseError busy(SQLITE_BUSY, "database is locked");
    EXPECT_TRUE(busy.transient());
    Error e = core::mapDatabaseError(busy, "txn");
    EXPECT_EQ(e.code, ErrorCode::STORAGE_UNAVAILABLE);
    EXPECT_EQ(e.severity, ErrorSeverity::WARNING);
    EXPECT_EQ(e.context, "txn");

    uint64_t before = ErrorHandler::instance().getErrorCount(ErrorCode::INVARIANT_VIOLATION);
    database::DatabaseError check(SQLITE_CONSTRAINT_CHECK, "CHECK constraint failed: balance >= 0");
    EXPECT_TRUE(check.constraint());
    EXPECT_FALSE(check.transient());
    e = core::mapDatabaseError(check, "txn");
    EXPECT_EQ(e.code, ErrorCode::INVARIANT_VIOLATION);
    EXPECT_EQ(e.severity, ErrorSeverity::CRITICAL);
    EXPECT_EQ(ErrorHandler::instance().getErrorCount(ErrorCode::INVARIANT_VIOLATION), before + 1);

    database::DatabaseError corrupt(SQLITE_CORRUPT, "malformed");
    EXPECT_EQ(core::mapDatabaseError(corrupt, "txn").code, ErrorCode::DATABASE_ERROR);
}

TEST(ErrorHandlingTest, ThrowIfErrorCarriesTheError) {
    EXPECT_NO_THROW(throwIfError(Error()));
    try {
        throwIfError(makeError(ErrorCode::TOO_EARLY, "wait", "bonus"));
        FAIL() << "expected ErrorException";
    } catch (const ErrorException& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::TOO_EARLY);
        EXPECT_EQ(ex.error().context, "bonus");
        EXPECT_STREQ(ex.what(), "wait");
    }
}

TEST(FormatterTest, AmountsAndTables) {
    EXPECT_EQ(Formatter::formatAmount(499500000000), "4995.00000000");
    EXPECT_EQ(Formatter::formatAmount(-5), "-0.00000005");
    EXPECT_EQ(Formatter::formatAmount(1234, 2), "12.34");
    EXPECT_EQ(Formatter::formatValue(10995.004, 2), "10995.00");
    EXPECT_EQ(Formatter::formatDuration(86399), "23h 59m");
    EXPECT_EQ(Formatter::formatDate(0), "1970-01-01");

    TableFormatter table;
    table.setHeaders({"rank", "name"});
    table.addRow({"1", "alice"});
    EXPECT_EQ(table.render(),
              "| rank | name  |\n"
              "|------|-------|\n"
              "| 1    | alice |\n");
}

TEST(FormatterTest, CaseMappingLeavesNonAsciiBytes) {
    EXPECT_EQ(Formatter::toUpper("eth\xC3\xA9"), "ETH\xC3\xA9");
    EXPECT_EQ(Formatter::toLower("\xC3\x89X"), "\xC3\x89x");

    core::TradingPair pair;
    ASSERT_TRUE(core::TradingPair::parse("\xC3\xA9th/usdt", pair));
    EXPECT_EQ(pair.base, "\xC3\xA9TH");
    EXPECT_EQ(pair.quote, "USDT");
}

TEST(TypesTest, ParsePairsAndSides) {
    core::TradingPair pair;
    ASSERT_TRUE(core::TradingPair::parse(" btc / usdt", pair));
    EXPECT_EQ(pair.base, "BTC");
    EXPECT_EQ(pair.quote, "USDT");
    EXPECT_EQ(pair.str(), "BTC/USDT");
    EXPECT_FALSE(core::TradingPair::parse("BTCUSDT", pair));
    EXPECT_FALSE(core::TradingPair::parse("BTC/", pair));

    core::TradeSide side = core::TradeSide::BUY;
    EXPECT_TRUE(core::parseTradeSide("SELL", side));
    EXPECT_EQ(side, core::TradeSide::SELL);
    EXPECT_FALSE(core::parseTradeSide("hold", side));

    core::EntryReason reason = core::EntryReason::ADJUSTMENT;
    EXPECT_TRUE(core::parseEntryReason(core::toString(core::EntryReason::ESCROW_UNLOCK), reason));
    EXPECT_EQ(reason, core::EntryReason::ESCROW_UNLOCK);
}
