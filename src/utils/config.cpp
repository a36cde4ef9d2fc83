#include "utils/config.h"
#include <unordered_map>
#include <unordered_set>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cmath>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace cryptotrade {
namespace utils {

bool GameConfig::isSupported(const std::string& currency) const {
    return std::find(supportedCurrencies.begin(), supportedCurrencies.end(), currency) !=
           supportedCurrencies.end();
}

Result<void> GameConfig::validate() const {
    if (supportedCurrencies.empty()) {
        return makeError(ErrorCode::INVALID_CONFIG, "no supported currencies configured");
    }
    std::unordered_set<std::string> seen;
    for (const auto& c : supportedCurrencies) {
        if (c.empty() || c.find('/') != std::string::npos) {
            return makeError(ErrorCode::INVALID_CONFIG, "invalid currency symbol '" + c + "'");
        }
        if (!seen.insert(c).second) {
            return makeError(ErrorCode::INVALID_CONFIG, "duplicate currency " + c);
        }
    }
    if (!isSupported(baseCurrency)) {
        return makeError(ErrorCode::INVALID_CONFIG,
                         "base currency " + baseCurrency + " is not a supported currency");
    }
    if (!std::isfinite(initialBalance) || initialBalance < 0.0) {
        return makeError(ErrorCode::INVALID_CONFIG, "initial balance must be >= 0");
    }
    if (!std::isfinite(bonusAmount) || bonusAmount < 0.0) {
        return makeError(ErrorCode::INVALID_CONFIG, "bonus amount must be >= 0");
    }
    if (!std::isfinite(feeRate) || feeRate < 0.0 || feeRate >= 1.0) {
        return makeError(ErrorCode::INVALID_CONFIG, "fee rate must be in [0, 1)");
    }
    if (bonusCooldownSeconds == 0) {
        return makeError(ErrorCode::INVALID_CONFIG, "bonus cooldown must be > 0");
    }
    return {};
}

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.cryptotrade";
    } else {
        impl_->dataDir = ".cryptotrade";
    }
    loadDefaults();
}

Config::~Config() = default;

void Config::loadDefaults() {
    setGameConfig(GameConfig());
    
    set("storage.busy_timeout_ms", 5000);
    set("storage.pool_size", 4);
    
    LogConfig log;
    set("log.level", log.level);
    set("log.console", log.console);
    set("log.max_file_size", static_cast<int64_t>(log.maxFileSize));
    set("log.max_files", static_cast<int>(log.maxFiles));
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;
    
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        
        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            
            key.erase(0, key.find_first_not_of(" \t"));
            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r") + 1);
            
            if (!key.empty()) impl_->data[key] = value;
        }
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;
    
    std::ofstream file(savePath);
    if (!file.is_open()) return false;
    
    file << "# CryptoTrade Configuration\n\n";
    
    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());
    
    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return static_cast<bool>(file);
}

size_t Config::applyEnvironment() {
    size_t applied = 0;
    auto names = keys();
    for (const char* optional : {"storage.database", "log.file"}) {
        if (std::find(names.begin(), names.end(), optional) == names.end()) names.push_back(optional);
    }
    for (const auto& key : names) {
        std::string envName = "CRYPTOTRADE_" + key;
        for (auto& c : envName) {
            if (c == '.') c = '_';
            else c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
        }
        const char* value = std::getenv(envName.c_str());
        if (value) {
            set(key, std::string(value));
            applied++;
        }
    }
    const char* db = std::getenv("CRYPTOTRADE_DB");
    if (db && *db) {
        set("storage.database", std::string(db));
        applied++;
    }
    return applied;
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stod(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;
    
    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data[key] = value;
        cb = impl_->changeCallback;
    }
    if (cb) cb(key);
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value));
}

void Config::set(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss.precision(17);
    oss << value;
    set(key, oss.str());
}

void Config::set(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

void Config::setList(const std::string& key, const std::vector<std::string>& values) {
    std::string joined;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) joined += ",";
        joined += values[i];
    }
    set(key, joined);
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.erase(key);
        cb = impl_->changeCallback;
    }
    if (cb) cb(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.substr(0, prefix.size()) == prefix) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

GameConfig Config::getGameConfig() const {
    GameConfig cfg;
    auto currencies = getList("game.currencies");
    if (!currencies.empty()) cfg.supportedCurrencies = currencies;
    cfg.baseCurrency = getString("game.base_currency", cfg.baseCurrency);
    cfg.initialBalance = getDouble("game.initial_balance", cfg.initialBalance);
    cfg.feeRate = getDouble("game.fee_rate", cfg.feeRate);
    cfg.bonusAmount = getDouble("game.bonus_amount", cfg.bonusAmount);
    cfg.bonusCooldownSeconds = static_cast<uint64_t>(
        getInt64("game.bonus_cooldown", static_cast<int64_t>(cfg.bonusCooldownSeconds)));
    return cfg;
}

StorageConfig Config::getStorageConfig() const {
    StorageConfig cfg;
    cfg.databasePath = getString("storage.database", getDataDir() + "/cryptotrade.db");
    cfg.busyTimeoutMs = static_cast<uint32_t>(getInt("storage.busy_timeout_ms", 5000));
    cfg.poolSize = static_cast<uint32_t>(std::max(1, getInt("storage.pool_size", 4)));
    return cfg;
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", "info");
    cfg.file = getString("log.file", "");
    cfg.console = getBool("log.console", true);
    int64_t maxSize = getInt64("log.max_file_size", static_cast<int64_t>(cfg.maxFileSize));
    if (maxSize > 0) cfg.maxFileSize = static_cast<uint64_t>(maxSize);
    cfg.maxFiles = static_cast<uint32_t>(std::max(1, getInt("log.max_files", static_cast<int>(cfg.maxFiles))));
    return cfg;
}

void Config::setGameConfig(const GameConfig& cfg) {
    setList("game.currencies", cfg.supportedCurrencies);
    set("game.base_currency", cfg.baseCurrency);
    set("game.initial_balance", cfg.initialBalance);
    set("game.fee_rate", cfg.feeRate);
    set("game.bonus_amount", cfg.bonusAmount);
    set("game.bonus_cooldown", static_cast<int64_t>(cfg.bonusCooldownSeconds));
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.clear();
}

}
}
