#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace cryptotrade {
namespace utils {

struct GameConfig {
    std::vector<std::string> supportedCurrencies = {
        "BTC", "ETH", "OP", "BNB", "SOL", "DOGE", "TRX", "USDT",
        "XRP", "ADA", "NEAR", "LTC", "BCH", "XLM", "LINK", "MATIC"
    };
    std::string baseCurrency = "USDT";
    double initialBalance = 10000.0;
    double feeRate = 0.001;
    double bonusAmount = 50.0;
    uint64_t bonusCooldownSeconds = 24 * 60 * 60;
    
    bool isSupported(const std::string& currency) const;
    Result<void> validate() const;
};

struct StorageConfig {
    std::string databasePath;
    uint32_t busyTimeoutMs = 5000;
    uint32_t poolSize = 4;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

class Config {
public:
    Config();
    ~Config();
    
    bool load(const std::string& path);
    bool save(const std::string& path);
    // Applies CRYPTOTRADE_<SECTION>_<KEY> overrides for every known key.
    size_t applyEnvironment();
    
    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;
    
    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);
    void setList(const std::string& key, const std::vector<std::string>& values);
    
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;
    
    GameConfig getGameConfig() const;
    StorageConfig getStorageConfig() const;
    LogConfig getLogConfig() const;
    
    void setGameConfig(const GameConfig& config);
    
    void onChange(std::function<void(const std::string&)> callback);
    
    // $HOME/.cryptotrade; holds the default ledger database.
    std::string getDataDir() const;
    std::string getConfigPath() const;
    
    void clear();
    
private:
    void loadDefaults();
    
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
