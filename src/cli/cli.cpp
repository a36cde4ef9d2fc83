#include "cli/cli.h"
#include "core/game.h"
#include "core/oracle.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <nlohmann/json.hpp>
#include <getopt.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace cryptotrade {

namespace cli {

static void printHelp(const char* progName) {
    std::cout << "CryptoTrade v1.0.0 - simulated crypto trading ledger\n\n";
    std::cout << "Usage: " << progName << " [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  login <user> [name]                 Create or open an account\n";
    std::cout << "  wallets <user>                      Show balances\n";
    std::cout << "  buy <user> <pair> <amount>          Market buy, e.g. BTC/USDT 0.1\n";
    std::cout << "  sell <user> <pair> <amount>         Market sell\n";
    std::cout << "  offer-create <user> <cur> <amt> <want-cur> <want-amt>\n";
    std::cout << "                                      Lock funds into a peer offer\n";
    std::cout << "  offers [user]                       Active offers, excluding the user's own\n";
    std::cout << "  my-offers <user> [status]           Offers created by the user\n";
    std::cout << "  offer-accept <user> <offer-id>      Settle an offer\n";
    std::cout << "  offer-cancel <user> <offer-id>      Cancel an offer and unlock funds\n";
    std::cout << "  bonus <user>                        Claim the daily bonus\n";
    std::cout << "  portfolio <user>                    Portfolio value in the base currency\n";
    std::cout << "  snapshot <user>                     Record the portfolio value\n";
    std::cout << "  leaderboard [limit]                 Rank accounts by portfolio value\n";
    std::cout << "  coin-leaderboard <cur> [limit]      Rank accounts by holdings of one currency\n";
    std::cout << "  rank <user>                         Rank and percentile of one account\n";
    std::cout << "  history <user> [pair] [limit]       Executed market orders\n";
    std::cout << "  audit [currency]                    Currency totals and journal check\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -v, --version         Show version\n";
    std::cout << "  -c, --config FILE     Use custom config file\n";
    std::cout << "  -d, --db PATH         Database file\n";
    std::cout << "  -p, --prices FILE     JSON price snapshot, e.g. {\"BTC\": 50000.0}\n";
    std::cout << "  -j, --json            Machine readable output\n";
    std::cout << "  -l, --log-level LVL   Log level (trace/debug/info/warn/error/off)\n";
}

static void printVersion() {
    std::cout << "CryptoTrade v1.0.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"db", required_argument, nullptr, 'd'},
        {"prices", required_argument, nullptr, 'p'},
        {"json", no_argument, nullptr, 'j'},
        {"log-level", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    optind = 0;
    while ((opt = getopt_long(argc, argv, "+hvc:d:p:jl:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                opts.showHelp = true;
                return true;
            case 'v':
                opts.showVersion = true;
                return true;
            case 'c':
                opts.configPath = optarg;
                break;
            case 'd':
                opts.dbPath = optarg;
                break;
            case 'p':
                opts.pricesPath = optarg;
                break;
            case 'j':
                opts.json = true;
                break;
            case 'l':
                opts.logLevel = optarg;
                break;
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; i++) {
        opts.args.push_back(argv[i]);
    }
    return true;
}

bool loadPrices(const std::string& path, core::PriceMap& out, std::string& err) {
    std::ifstream file(path);
    if (!file.is_open()) {
        err = "cannot open " + path;
        return false;
    }
    json parsed = json::parse(file, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        err = path + ": expected a JSON object of currency prices";
        return false;
    }
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        if (!it.value().is_number()) {
            err = path + ": price for " + it.key() + " is not a number";
            return false;
        }
        out[utils::Formatter::toUpper(it.key())] = it.value().get<double>();
    }
    return true;
}

class CommandRunner {
public:
    CommandRunner(core::TradingGame& game, const core::StaticPriceOracle& oracle, bool jsonOut)
        : game_(game), oracle_(oracle), json_(jsonOut) {}

    int run(const std::vector<std::string>& args);

private:
    int usage(const std::string& message);
    int fail(const Error& err);
    int emit(const json& j, const std::string& text);
    bool resolve(const std::string& externalId, core::AccountId& out, Error& err);
    bool parseCount(const std::string& text, size_t& out);

    int cmdLogin(const std::vector<std::string>& args);
    int cmdWallets(const std::vector<std::string>& args);
    int cmdOrder(const std::vector<std::string>& args, core::TradeSide side);
    int cmdOfferCreate(const std::vector<std::string>& args);
    int cmdOffers(const std::vector<std::string>& args);
    int cmdMyOffers(const std::vector<std::string>& args);
    int cmdOfferAccept(const std::vector<std::string>& args);
    int cmdOfferCancel(const std::vector<std::string>& args);
    int cmdBonus(const std::vector<std::string>& args);
    int cmdPortfolio(const std::vector<std::string>& args);
    int cmdSnapshot(const std::vector<std::string>& args);
    int cmdLeaderboard(const std::vector<std::string>& args);
    int cmdCoinLeaderboard(const std::vector<std::string>& args);
    int cmdRank(const std::vector<std::string>& args);
    int cmdHistory(const std::vector<std::string>& args);
    int cmdAudit(const std::vector<std::string>& args);

    core::TradingGame& game_;
    const core::StaticPriceOracle& oracle_;
    bool json_;
};

static json offerJson(const core::TradeOffer& o) {
    return json{
        {"id", o.id},
        {"creator_id", o.creatorId},
        {"creator_name", o.creatorName},
        {"offering_currency", o.offeringCurrency},
        {"offering_amount", core::formatAmount(o.offeringAmount)},
        {"requesting_currency", o.requestingCurrency},
        {"requesting_amount", core::formatAmount(o.requestingAmount)},
        {"status", core::toString(o.status)},
        {"created_at", o.createdAt},
        {"updated_at", o.updatedAt}
    };
}

static std::string offerTable(const std::vector<core::TradeOffer>& offers) {
    utils::TableFormatter table;
    table.setHeaders({"ID", "Creator", "Offering", "Requesting", "Status", "Created"});
    for (const auto& o : offers) {
        table.addRow({std::to_string(o.id), o.creatorName,
                      core::formatAmount(o.offeringAmount) + " " + o.offeringCurrency,
                      core::formatAmount(o.requestingAmount) + " " + o.requestingCurrency,
                      core::toString(o.status), utils::Formatter::formatTimestamp(o.createdAt)});
    }
    return table.render();
}

int CommandRunner::usage(const std::string& message) {
    std::cerr << "Usage: " << message << "\n";
    return EXIT_USAGE;
}

int CommandRunner::fail(const Error& err) {
    if (json_) {
        json j = {{"ok", false},
                  {"error", {{"code", errorName(err.code)}, {"message", err.message}}}};
        if (err.retryAfter > 0) j["error"]["retry_after"] = err.retryAfter;
        std::cout << j.dump(2) << "\n";
    } else {
        std::cerr << "Error: " << errorName(err.code) << ": " << err.message << "\n";
    }
    return EXIT_FAILED;
}

int CommandRunner::emit(const json& j, const std::string& text) {
    if (json_) {
        json out = j;
        out["ok"] = true;
        std::cout << out.dump(2) << "\n";
    } else {
        std::cout << text;
        if (!text.empty() && text.back() != '\n') std::cout << "\n";
    }
    return 0;
}

bool CommandRunner::resolve(const std::string& externalId, core::AccountId& out, Error& err) {
    auto account = game_.accounts().findByExternalId(externalId);
    if (account.failed()) {
        err = account.error();
        return false;
    }
    out = account.value().id;
    return true;
}

bool CommandRunner::parseCount(const std::string& text, size_t& out) {
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos != text.size() || v <= 0) return false;
        out = static_cast<size_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int CommandRunner::run(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (cmd == "login") return cmdLogin(rest);
    if (cmd == "wallets") return cmdWallets(rest);
    if (cmd == "buy") return cmdOrder(rest, core::TradeSide::BUY);
    if (cmd == "sell") return cmdOrder(rest, core::TradeSide::SELL);
    if (cmd == "offer-create") return cmdOfferCreate(rest);
    if (cmd == "offers") return cmdOffers(rest);
    if (cmd == "my-offers") return cmdMyOffers(rest);
    if (cmd == "offer-accept") return cmdOfferAccept(rest);
    if (cmd == "offer-cancel") return cmdOfferCancel(rest);
    if (cmd == "bonus") return cmdBonus(rest);
    if (cmd == "portfolio") return cmdPortfolio(rest);
    if (cmd == "snapshot") return cmdSnapshot(rest);
    if (cmd == "leaderboard") return cmdLeaderboard(rest);
    if (cmd == "coin-leaderboard") return cmdCoinLeaderboard(rest);
    if (cmd == "rank") return cmdRank(rest);
    if (cmd == "history") return cmdHistory(rest);
    if (cmd == "audit") return cmdAudit(rest);

    std::cerr << "Unknown command: " << cmd << "\n";
    return EXIT_USAGE;
}

int CommandRunner::cmdLogin(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) return usage("login <user> [display-name]");
    core::StaticIdentityProvider identity(args[0], args.size() > 1 ? args[1] : args[0]);
    auto handle = game_.accounts().login(identity);
    if (handle.failed()) return fail(handle.error());

    const auto& a = handle.value().account;
    json j = {{"account_id", a.id}, {"external_id", a.externalId},
              {"display_name", a.displayName}, {"created", handle.value().created}};
    std::string text = (handle.value().created ? "Created account " : "Welcome back, account ") +
                       std::to_string(a.id) + " (" + a.displayName + ")";
    return emit(j, text);
}

int CommandRunner::cmdWallets(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage("wallets <user>");
    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto wallets = game_.getWallets(id);
    if (wallets.failed()) return fail(wallets.error());

    json list = json::array();
    utils::TableFormatter table;
    table.setHeaders({"Currency", "Balance", "Locked"});
    for (const auto& w : wallets.value()) {
        list.push_back({{"currency", w.currency},
                        {"balance", core::formatAmount(w.balance)},
                        {"locked_balance", core::formatAmount(w.lockedBalance)}});
        table.addRow({w.currency, core::formatAmount(w.balance), core::formatAmount(w.lockedBalance)});
    }
    return emit(json{{"wallets", list}}, table.render());
}

int CommandRunner::cmdOrder(const std::vector<std::string>& args, core::TradeSide side) {
    std::string verb = core::toString(side);
    if (args.size() != 3) return usage(verb + " <user> <pair> <amount>");
    core::TradingPair pair;
    if (!core::TradingPair::parse(args[1], pair)) return usage(verb + ": pair must look like BTC/USDT");
    core::Amount amount;
    if (!core::parseAmount(args[2], amount)) return usage(verb + ": invalid amount " + args[2]);

    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto receipt = game_.market().executeAtMarket(id, pair, side, amount, oracle_);
    if (receipt.failed()) return fail(receipt.error());

    const auto& r = receipt.value();
    const auto& tx = r.transaction;
    json j = {{"transaction_id", tx.id}, {"pair", tx.pair}, {"side", verb},
              {"amount", core::formatAmount(tx.amount)}, {"price", tx.price},
              {"total", core::formatAmount(tx.total)}, {"fee", core::formatAmount(tx.fee)},
              {"debited", {{"currency", r.debitCurrency}, {"amount", core::formatAmount(r.debited)}}},
              {"credited", {{"currency", r.creditCurrency}, {"amount", core::formatAmount(r.credited)}}}};
    std::string text = "Executed " + verb + " " + core::formatAmount(tx.amount) + " " + pair.base +
                       " @ " + utils::Formatter::formatValue(tx.price, 8) + " " + pair.quote +
                       "\n  debited  " + core::formatAmount(r.debited) + " " + r.debitCurrency +
                       "\n  credited " + core::formatAmount(r.credited) + " " + r.creditCurrency +
                       "\n  fee      " + core::formatAmount(tx.fee) + " " + pair.quote;
    return emit(j, text);
}

int CommandRunner::cmdOfferCreate(const std::vector<std::string>& args) {
    if (args.size() != 5) return usage("offer-create <user> <currency> <amount> <want-currency> <want-amount>");
    core::Amount offerAmount, wantAmount;
    if (!core::parseAmount(args[2], offerAmount)) return usage("offer-create: invalid amount " + args[2]);
    if (!core::parseAmount(args[4], wantAmount)) return usage("offer-create: invalid amount " + args[4]);

    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto offer = game_.createOffer(id, utils::Formatter::toUpper(args[1]), offerAmount,
                                   utils::Formatter::toUpper(args[3]), wantAmount);
    if (offer.failed()) return fail(offer.error());
    return emit(json{{"offer", offerJson(offer.value())}},
                "Created offer " + std::to_string(offer.value().id));
}

int CommandRunner::cmdOffers(const std::vector<std::string>& args) {
    if (args.size() > 1) return usage("offers [user]");
    std::optional<core::AccountId> exclude;
    if (!args.empty()) {
        core::AccountId id;
        Error err;
        if (!resolve(args[0], id, err)) return fail(err);
        exclude = id;
    }
    auto offers = game_.listActiveOffers(exclude);
    if (offers.failed()) return fail(offers.error());

    json list = json::array();
    for (const auto& o : offers.value()) list.push_back(offerJson(o));
    return emit(json{{"offers", list}}, offerTable(offers.value()));
}

int CommandRunner::cmdMyOffers(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) return usage("my-offers <user> [active|completed|cancelled]");
    std::optional<core::OfferStatus> status;
    if (args.size() == 2) {
        core::OfferStatus s;
        if (!core::parseOfferStatus(args[1], s)) return usage("my-offers: unknown status " + args[1]);
        status = s;
    }
    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto offers = game_.escrow().listOffersByCreator(id, status);
    if (offers.failed()) return fail(offers.error());

    json list = json::array();
    for (const auto& o : offers.value()) list.push_back(offerJson(o));
    return emit(json{{"offers", list}}, offerTable(offers.value()));
}

int CommandRunner::cmdOfferAccept(const std::vector<std::string>& args) {
    if (args.size() != 2) return usage("offer-accept <user> <offer-id>");
    size_t offerId;
    if (!parseCount(args[1], offerId)) return usage("offer-accept: invalid offer id " + args[1]);
    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto receipt = game_.acceptOffer(id, static_cast<core::OfferId>(offerId));
    if (receipt.failed()) return fail(receipt.error());

    const auto& s = receipt.value().settlement;
    json j = {{"settlement_id", s.id}, {"offer", offerJson(receipt.value().offer)}};
    std::string text = "Accepted offer " + std::to_string(s.offerId) +
                       "\n  received " + core::formatAmount(s.offeringAmount) + " " + s.offeringCurrency +
                       "\n  paid     " + core::formatAmount(s.requestingAmount) + " " + s.requestingCurrency;
    return emit(j, text);
}

int CommandRunner::cmdOfferCancel(const std::vector<std::string>& args) {
    if (args.size() != 2) return usage("offer-cancel <user> <offer-id>");
    size_t offerId;
    if (!parseCount(args[1], offerId)) return usage("offer-cancel: invalid offer id " + args[1]);
    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto offer = game_.cancelOffer(id, static_cast<core::OfferId>(offerId));
    if (offer.failed()) return fail(offer.error());
    return emit(json{{"offer", offerJson(offer.value())}},
                "Cancelled offer " + std::to_string(offer.value().id) + ", unlocked " +
                core::formatAmount(offer.value().offeringAmount) + " " + offer.value().offeringCurrency);
}

int CommandRunner::cmdBonus(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage("bonus <user>");
    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto grant = game_.claimBonus(id);
    if (grant.failed()) return fail(grant.error());

    const auto& base = game_.store().config().baseCurrency;
    const auto& g = grant.value();
    json j = {{"amount", core::formatAmount(g.amount)}, {"currency", base},
              {"new_balance", core::formatAmount(g.newBalance)}, {"day", g.day}};
    return emit(j, "Daily bonus claimed: +" + core::formatAmount(g.amount) + " " + base +
                   " (balance " + core::formatAmount(g.newBalance) + ")");
}

int CommandRunner::cmdPortfolio(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage("portfolio <user>");
    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto value = game_.portfolioValue(id, oracle_.prices());
    if (value.failed()) return fail(value.error());

    const auto& base = game_.store().config().baseCurrency;
    json breakdown = json::array();
    utils::TableFormatter table;
    table.setHeaders({"Currency", "Balance", "Locked", "Price", "Value"});
    for (const auto& h : value.value().breakdown) {
        breakdown.push_back({{"currency", h.currency}, {"balance", core::formatAmount(h.balance)},
                             {"locked_balance", core::formatAmount(h.lockedBalance)},
                             {"price", h.price}, {"value", h.value}});
        table.addRow({h.currency, core::formatAmount(h.balance), core::formatAmount(h.lockedBalance),
                      utils::Formatter::formatValue(h.price, 8), utils::Formatter::formatValue(h.value)});
    }
    json j = {{"total_value", value.value().total}, {"currency", base}, {"breakdown", breakdown}};
    return emit(j, table.render() + "Total: " + utils::Formatter::formatValue(value.value().total) + " " + base);
}

int CommandRunner::cmdSnapshot(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage("snapshot <user>");
    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto snap = game_.portfolio().recordSnapshot(id, oracle_.prices());
    if (snap.failed()) return fail(snap.error());
    auto history = game_.portfolio().history(id, 10);
    if (history.failed()) return fail(history.error());

    json list = json::array();
    utils::TableFormatter table;
    table.setHeaders({"Recorded", "Value"});
    for (const auto& s : history.value()) {
        list.push_back({{"recorded_at", s.recordedAt}, {"total_value", s.totalValue}});
        table.addRow({utils::Formatter::formatTimestamp(s.recordedAt),
                      utils::Formatter::formatValue(s.totalValue)});
    }
    return emit(json{{"snapshot_id", snap.value().id}, {"history", list}}, table.render());
}

int CommandRunner::cmdLeaderboard(const std::vector<std::string>& args) {
    size_t limit = 100;
    if (args.size() > 1 || (args.size() == 1 && !parseCount(args[0], limit))) {
        return usage("leaderboard [limit]");
    }
    auto board = game_.leaderboard(oracle_.prices(), limit);
    if (board.failed()) return fail(board.error());

    json list = json::array();
    utils::TableFormatter table;
    table.setHeaders({"Rank", "Player", "Value"});
    for (const auto& e : board.value()) {
        list.push_back({{"rank", e.rank}, {"account_id", e.accountId},
                        {"display_name", e.displayName}, {"total_value", e.totalValue}});
        table.addRow({std::to_string(e.rank), e.displayName, utils::Formatter::formatValue(e.totalValue)});
    }
    return emit(json{{"leaderboard", list}}, table.render());
}

int CommandRunner::cmdCoinLeaderboard(const std::vector<std::string>& args) {
    size_t limit = 100;
    if (args.empty() || args.size() > 2 || (args.size() == 2 && !parseCount(args[1], limit))) {
        return usage("coin-leaderboard <currency> [limit]");
    }
    std::string currency = utils::Formatter::toUpper(args[0]);
    auto board = game_.portfolio().coinLeaderboard(currency, limit);
    if (board.failed()) return fail(board.error());

    json list = json::array();
    utils::TableFormatter table;
    table.setHeaders({"Rank", "Player", currency});
    for (const auto& h : board.value()) {
        list.push_back({{"rank", h.rank}, {"account_id", h.accountId},
                        {"display_name", h.displayName}, {"balance", core::formatAmount(h.balance)}});
        table.addRow({std::to_string(h.rank), h.displayName, core::formatAmount(h.balance)});
    }
    return emit(json{{"currency", currency}, {"leaderboard", list}}, table.render());
}

int CommandRunner::cmdRank(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage("rank <user>");
    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto info = game_.portfolio().rankOf(id, oracle_.prices());
    if (info.failed()) return fail(info.error());

    const auto& r = info.value();
    json j = {{"rank", r.rank}, {"total_accounts", r.totalAccounts},
              {"percentile", r.percentile}, {"total_value", r.totalValue}};
    return emit(j, "Rank " + std::to_string(r.rank) + " of " + std::to_string(r.totalAccounts) +
                   " (top " + utils::Formatter::formatPercent(100.0 - r.percentile) + ")");
}

int CommandRunner::cmdHistory(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 3) return usage("history <user> [pair] [limit]");
    std::optional<std::string> pairFilter;
    size_t limit = 100;
    for (size_t i = 1; i < args.size(); i++) {
        core::TradingPair pair;
        if (core::TradingPair::parse(args[i], pair)) pairFilter = pair.str();
        else if (!parseCount(args[i], limit)) return usage("history <user> [pair] [limit]");
    }
    core::AccountId id;
    Error err;
    if (!resolve(args[0], id, err)) return fail(err);

    auto history = game_.market().history(id, pairFilter, limit);
    if (history.failed()) return fail(history.error());

    json list = json::array();
    utils::TableFormatter table;
    table.setHeaders({"ID", "Time", "Pair", "Side", "Amount", "Price", "Total", "Fee"});
    for (const auto& t : history.value()) {
        list.push_back({{"id", t.id}, {"timestamp", t.timestamp}, {"pair", t.pair},
                        {"side", core::toString(t.kind)}, {"amount", core::formatAmount(t.amount)},
                        {"price", t.price}, {"total", core::formatAmount(t.total)},
                        {"fee", core::formatAmount(t.fee)}});
        table.addRow({std::to_string(t.id), utils::Formatter::formatTimestamp(t.timestamp), t.pair,
                      core::toString(t.kind), core::formatAmount(t.amount),
                      utils::Formatter::formatValue(t.price, 8), core::formatAmount(t.total),
                      core::formatAmount(t.fee)});
    }
    return emit(json{{"transactions", list}}, table.render());
}

int CommandRunner::cmdAudit(const std::vector<std::string>& args) {
    if (args.size() > 1) return usage("audit [currency]");
    std::vector<std::string> currencies = game_.store().config().supportedCurrencies;
    if (!args.empty()) currencies = {utils::Formatter::toUpper(args[0])};

    json totals = json::object();
    utils::TableFormatter table;
    table.setHeaders({"Currency", "Total"});
    for (const auto& c : currencies) {
        auto total = game_.store().currencyTotal(c);
        if (total.failed()) return fail(total.error());
        totals[c] = core::formatAmount(total.value());
        table.addRow({c, core::formatAmount(total.value())});
    }

    auto mismatches = game_.store().verifyJournal();
    if (mismatches.failed()) return fail(mismatches.error());

    json bad = json::array();
    for (const auto& m : mismatches.value()) {
        bad.push_back({{"account_id", m.accountId}, {"currency", m.currency},
                       {"balance", core::formatAmount(m.balance)},
                       {"journal_balance", core::formatAmount(m.journalBalance)},
                       {"locked_balance", core::formatAmount(m.lockedBalance)},
                       {"journal_locked", core::formatAmount(m.journalLocked)}});
    }
    std::string text = table.render() + (bad.empty() ? "Journal: consistent"
                                                     : "Journal: " + std::to_string(bad.size()) + " mismatched wallets");
    emit(json{{"totals", totals}, {"journal_mismatches", bad}}, text);
    return bad.empty() ? 0 : EXIT_FAILED;
}

int runCli(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printHelp(argv[0]);
        return EXIT_USAGE;
    }
    if (opts.showHelp) {
        printHelp(argv[0]);
        return 0;
    }
    if (opts.showVersion) {
        printVersion();
        return 0;
    }
    if (opts.args.empty()) {
        printHelp(argv[0]);
        return EXIT_USAGE;
    }

    utils::Config config;
    // Command output shares stdout with console logging; keep it quiet unless asked.
    config.set("log.level", "warn");
    if (!opts.configPath.empty() && !config.load(opts.configPath)) {
        std::cerr << "Cannot read config file " << opts.configPath << "\n";
        return EXIT_USAGE;
    }
    config.applyEnvironment();
    if (!opts.dbPath.empty()) config.set("storage.database", opts.dbPath);
    if (!opts.logLevel.empty()) config.set("log.level", opts.logLevel);

    auto logConfig = config.getLogConfig();
    utils::LogLevel level;
    if (!utils::Logger::parseLevel(logConfig.level, level)) {
        std::cerr << "Unknown log level " << logConfig.level << "\n";
        return EXIT_USAGE;
    }
    utils::Logger::setMaxFileSize(logConfig.maxFileSize);
    utils::Logger::setMaxFiles(logConfig.maxFiles);
    if (!logConfig.file.empty()) utils::Logger::init(logConfig.file);
    utils::Logger::setLevel(level);
    utils::Logger::enableConsole(logConfig.console && !opts.json);

    auto gameConfig = config.getGameConfig();
    auto storage = config.getStorageConfig();
    std::filesystem::path dbFile(storage.databasePath);
    if (dbFile.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(dbFile.parent_path(), ec);
    }

    core::PriceMap prices;
    if (!opts.pricesPath.empty()) {
        std::string err;
        if (!loadPrices(opts.pricesPath, prices, err)) {
            std::cerr << err << "\n";
            return EXIT_USAGE;
        }
    }
    core::StaticPriceOracle oracle(prices, gameConfig.baseCurrency);

    core::TradingGame game(storage, gameConfig);
    auto opened = game.open();
    if (opened.failed()) {
        std::cerr << "Cannot open ledger: " << errorName(opened.code()) << ": "
                  << opened.error().message << "\n";
        return EXIT_FAILED;
    }

    LOG_CAT(DEBUG, "cli", "command " + opts.args[0]);
    CommandRunner runner(game, oracle, opts.json);
    int rc = runner.run(opts.args);

    game.close();
    utils::Logger::shutdown();
    return rc;
}

}
}
