// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file quorum-util.cpp
 * @brief Operator tool for a bridge database
 *
 * Reads the bridge parameters from the command line and quorum.conf, opens
 * <datadir>/bridge.sqlite (or -db=<path>) and answers point lookups and
 * enumerations over the persisted state. Nothing is written.
 */

#include <amount.h>
#include <bridge/bridge_db.h>
#include <bridge/bridge_node.h>
#include <bridge/bridge_params.h>
#include <bridge/token_ledger.h>
#include <util.h>
#include <utilstrencodings.h>
#include <utiltime.h>

#include <boost/filesystem/operations.hpp>

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bridge;

namespace fs = boost::filesystem;

static const int EXIT_USAGE = 2;

struct UtilContext {
    BridgeParams params;
    BridgeDB db;
};

typedef int (*UtilActor)(UtilContext& ctx, const std::vector<std::string>& args);

struct UtilCommand {
    const char* name;
    UtilActor actor;
    size_t minArgs;
    const char* argNames;
    const char* help;
};

static bool ParseAddressArg(const std::string& str, Address& out)
{
    if (str.size() != 40 || !IsHex(str)) {
        tfm::format(std::cerr, "Error: invalid address '%s' (expected 40 hex characters)\n", str);
        return false;
    }
    out = uint160S(str);
    return true;
}

static bool ParseUInt64Arg(const std::string& str, uint64_t& out)
{
    int64_t n;
    if (!ParseInt64(str, &n) || n < 0) {
        tfm::format(std::cerr, "Error: invalid number '%s'\n", str);
        return false;
    }
    out = static_cast<uint64_t>(n);
    return true;
}

static void PrintValidator(const ValidatorInfo& info)
{
    tfm::format(std::cout, "%s active=%d stake=%s locked=%s reputation=%u slashes=%u validated=%u lastactivity=%u",
                info.address.ToString(), info.isActive, FormatMoney(info.stake), FormatMoney(info.lockedStake),
                info.reputation, info.slashCount, info.validatedTransactions, info.lastActivityTime);
    if (!info.isActive && !info.deactivationReason.empty()) {
        tfm::format(std::cout, " reason=\"%s\"", info.deactivationReason);
    }
    std::cout << "\n";
}

static void PrintTransaction(const BridgeTransaction& tx)
{
    tfm::format(std::cout, "%u %s user=%s amount=%s fee=%s%s chain=%u->%u created=%u trust=%s",
                tx.nonce, TxStatusToString(tx.status), tx.user.ToString(), FormatMoney(tx.amount),
                FormatMoney(tx.fee), tx.feePrepaid ? " (prepaid)" : "", tx.sourceChain, tx.destChain,
                tx.createdAt, tx.trustStatus);
    if (tx.status == TxStatus::COMPLETED) {
        tfm::format(std::cout, " completed=%u proof=%s", tx.completedAt, tx.proofHash.ToString());
    }
    if (!tx.failureReason.empty()) {
        tfm::format(std::cout, " reason=\"%s\"", tx.failureReason);
    }
    std::cout << "\n";
}

static void PrintChallenge(const Challenge& c)
{
    tfm::format(std::cout, "%u %s challenger=%s validator=%s nonce=%u stake=%s period_end=%u votes=%s/%s",
                c.id, ChallengeStatusToString(c.status), c.challenger.ToString(), c.validator.ToString(),
                c.nonce, FormatMoney(c.stake), c.periodEnd, FormatMoney(c.votesAgainstValidator),
                FormatMoney(c.votesForValidator));
    if (!c.IsOpen()) {
        tfm::format(std::cout, " slashed=%s reward=%s insurance=%s resolved=%u",
                    FormatMoney(c.slashedAmount), FormatMoney(c.challengerReward),
                    FormatMoney(c.insuranceShare), c.resolvedAt);
    }
    std::cout << "\n";
}

// ============================================================================
// Commands
// ============================================================================

static int getvalidator(UtilContext& ctx, const std::vector<std::string>& args)
{
    Address address;
    if (!ParseAddressArg(args[0], address)) return EXIT_USAGE;
    std::optional<ValidatorInfo> info = ctx.db.ReadValidator(address);
    if (!info) {
        tfm::format(std::cerr, "Error: validator %s not found\n", args[0]);
        return EXIT_FAILURE;
    }
    PrintValidator(*info);
    return EXIT_SUCCESS;
}

static int listvalidators(UtilContext& ctx, const std::vector<std::string>& args)
{
    bool activeOnly = !args.empty() && args[0] == "active";
    for (const ValidatorInfo& info : ctx.db.ReadValidators(activeOnly)) {
        PrintValidator(info);
    }
    return EXIT_SUCCESS;
}

static int gettransaction(UtilContext& ctx, const std::vector<std::string>& args)
{
    uint64_t nonce;
    if (!ParseUInt64Arg(args[0], nonce)) return EXIT_USAGE;
    std::optional<BridgeTransaction> tx = ctx.db.ReadTransaction(nonce);
    if (!tx) {
        tfm::format(std::cerr, "Error: transaction %u not found\n", nonce);
        return EXIT_FAILURE;
    }
    PrintTransaction(*tx);
    return EXIT_SUCCESS;
}

static int listtransactions(UtilContext& ctx, const std::vector<std::string>& args)
{
    std::vector<BridgeTransaction> txs;
    if (args.empty()) {
        txs = ctx.db.ReadTransactions();
    } else {
        const TxStatus statuses[] = {TxStatus::PENDING, TxStatus::COMPLETED, TxStatus::FAILED, TxStatus::CANCELLED};
        bool found = false;
        for (TxStatus status : statuses) {
            if (TxStatusToString(status) == args[0]) {
                txs = ctx.db.ReadTransactionsByStatus(status);
                found = true;
                break;
            }
        }
        if (!found) {
            tfm::format(std::cerr, "Error: unknown status '%s'\n", args[0]);
            return EXIT_USAGE;
        }
    }
    for (const BridgeTransaction& tx : txs) {
        PrintTransaction(tx);
    }
    return EXIT_SUCCESS;
}

static int listusertransactions(UtilContext& ctx, const std::vector<std::string>& args)
{
    Address user;
    if (!ParseAddressArg(args[0], user)) return EXIT_USAGE;
    for (const BridgeTransaction& tx : ctx.db.ReadTransactionsByUser(user)) {
        PrintTransaction(tx);
    }
    return EXIT_SUCCESS;
}

static int getattestations(UtilContext& ctx, const std::vector<std::string>& args)
{
    uint64_t nonce;
    if (!ParseUInt64Arg(args[0], nonce)) return EXIT_USAGE;
    std::optional<AttestationRecord> record = ctx.db.ReadAttestationRecord(nonce);
    if (!record) {
        tfm::format(std::cerr, "Error: no attestations for transaction %u\n", nonce);
        return EXIT_FAILURE;
    }
    for (const auto& entry : record->attestations) {
        tfm::format(std::cout, "attest %s at=%u%s\n", entry.first.ToString(), entry.second,
                    record->invalidated.count(entry.first) ? " invalidated" : "");
    }
    for (const Address& voter : record->failVotes) {
        tfm::format(std::cout, "fail %s\n", voter.ToString());
    }
    return EXIT_SUCCESS;
}

static int getchallenge(UtilContext& ctx, const std::vector<std::string>& args)
{
    uint64_t id;
    if (!ParseUInt64Arg(args[0], id)) return EXIT_USAGE;
    std::optional<Challenge> challenge = ctx.db.ReadChallenge(id);
    if (!challenge) {
        tfm::format(std::cerr, "Error: challenge %u not found\n", id);
        return EXIT_FAILURE;
    }
    PrintChallenge(*challenge);
    return EXIT_SUCCESS;
}

static int listchallenges(UtilContext& ctx, const std::vector<std::string>& args)
{
    std::vector<Challenge> challenges;
    if (args.empty()) {
        challenges = ctx.db.ReadChallenges();
    } else {
        Address validator;
        if (!ParseAddressArg(args[0], validator)) return EXIT_USAGE;
        challenges = ctx.db.ReadChallengesForValidator(validator);
    }
    for (const Challenge& c : challenges) {
        PrintChallenge(c);
    }
    return EXIT_SUCCESS;
}

static int quotefee(UtilContext& ctx, const std::vector<std::string>& args)
{
    int64_t amount;
    uint64_t chain;
    if (!ParseInt64(args[0], &amount)) {
        tfm::format(std::cerr, "Error: invalid amount '%s'\n", args[0]);
        return EXIT_USAGE;
    }
    if (!ParseUInt64Arg(args[1], chain)) return EXIT_USAGE;

    // Fee math only needs the parameters, not the persisted state
    InMemoryTokenLedger ledger(ctx.params.custody);
    BridgeNode node(ctx.params, ledger);
    CAmount fee = 0;
    BridgeResult result = node.StateMachine().QuoteFee(amount, static_cast<ChainId>(chain), fee);
    if (!result) {
        tfm::format(std::cerr, "Error: %s\n", result.ToString());
        return EXIT_FAILURE;
    }
    tfm::format(std::cout, "fee=%s total=%s\n", FormatMoney(fee), FormatMoney(amount + fee));
    return EXIT_SUCCESS;
}

static int getstats(UtilContext& ctx, const std::vector<std::string>& args)
{
    InMemoryTokenLedger ledger(ctx.params.custody);
    BridgeNode node(ctx.params, ledger);
    if (!node.Load(ctx.db)) {
        tfm::format(std::cerr, "Error: cannot load bridge state from %s\n", ctx.db.GetPath());
        return EXIT_FAILURE;
    }

    const BridgeStats stats = node.StateMachine().GetStats();
    tfm::format(std::cout, "transactions=%u pending=%u completed=%u failed=%u cancelled=%u disputed=%u\n",
                stats.totalTransactions, stats.pendingCount, stats.completedCount, stats.failedCount,
                stats.cancelledCount, stats.disputedCount);
    tfm::format(std::cout, "locked=%s pending=%s released=%s refunded=%s\n",
                FormatMoney(stats.totalLocked), FormatMoney(stats.pendingPrincipal),
                FormatMoney(stats.totalReleased), FormatMoney(stats.totalRefunded));
    tfm::format(std::cout, "fees=%s feepool=%s insurance=%s\n", FormatMoney(stats.totalFees),
                FormatMoney(stats.feePool), FormatMoney(node.Challenges().GetInsuranceFund()));
    tfm::format(std::cout, "successrate=%u.%02u%% avgcompletion=%us\n", stats.successRateBps / 100,
                stats.successRateBps % 100, stats.averageCompletionTime);
    for (const auto& entry : stats.chains) {
        tfm::format(std::cout, "chain %u transfers=%u volume=%s fees=%s\n", entry.first,
                    entry.second.transfers, FormatMoney(entry.second.volume), FormatMoney(entry.second.fees));
    }
    tfm::format(std::cout, "validators active=%u stake=%s\n", node.Registry().ActiveCount(),
                FormatMoney(node.Registry().GetTotalStake()));
    return EXIT_SUCCESS;
}

/** Evaluation time: optional first argument, the clock otherwise */
static bool ParseNowArg(const std::vector<std::string>& args, uint64_t& now)
{
    if (args.empty()) {
        now = static_cast<uint64_t>(GetTime());
        return true;
    }
    return ParseUInt64Arg(args[0], now);
}

static int liststuck(UtilContext& ctx, const std::vector<std::string>& args)
{
    uint64_t now;
    if (!ParseNowArg(args, now)) return EXIT_USAGE;
    InMemoryTokenLedger ledger(ctx.params.custody);
    BridgeNode node(ctx.params, ledger);
    if (!node.Load(ctx.db)) {
        tfm::format(std::cerr, "Error: cannot load bridge state from %s\n", ctx.db.GetPath());
        return EXIT_FAILURE;
    }
    for (const BridgeTransaction& tx : node.StateMachine().GetStuckTransactions(now)) {
        PrintTransaction(tx);
    }
    return EXIT_SUCCESS;
}

static int gethealth(UtilContext& ctx, const std::vector<std::string>& args)
{
    uint64_t now;
    if (!ParseNowArg(args, now)) return EXIT_USAGE;
    InMemoryTokenLedger ledger(ctx.params.custody);
    BridgeNode node(ctx.params, ledger);
    if (!node.Load(ctx.db)) {
        tfm::format(std::cerr, "Error: cannot load bridge state from %s\n", ctx.db.GetPath());
        return EXIT_FAILURE;
    }

    const BridgeHealth health = node.StateMachine().GetHealth(now);
    tfm::format(std::cout, "healthy=%d stuck=%u validators active=%u eligible=%u threshold=%u\n",
                health.healthy, health.stuckCount, health.activeValidators, health.eligibleValidators,
                health.threshold);
    for (const auto& entry : health.chainStatus) {
        tfm::format(std::cout, "chain %u active=%d\n", entry.first, entry.second);
    }
    for (const std::string& issue : health.issues) {
        tfm::format(std::cout, "issue: %s\n", issue);
    }
    return health.healthy ? EXIT_SUCCESS : EXIT_FAILURE;
}

static const UtilCommand commands[] =
{ //  name                    actor                  minArgs  argNames            help
  //  ----------------------  ---------------------  -------  ------------------  ----
    { "getvalidator",         &getvalidator,         1,       "<address>",        "Show one validator" },
    { "listvalidators",       &listvalidators,       0,       "[active]",         "List validators, optionally only active ones" },
    { "gettransaction",       &gettransaction,       1,       "<nonce>",          "Show one bridge transaction" },
    { "listtransactions",     &listtransactions,     0,       "[status]",         "List transactions, optionally by status (PENDING, COMPLETED, FAILED, CANCELLED)" },
    { "listusertransactions", &listusertransactions, 1,       "<address>",        "List transactions of one user" },
    { "getattestations",      &getattestations,      1,       "<nonce>",          "Show attestations and fail votes for a transaction" },
    { "getchallenge",         &getchallenge,         1,       "<id>",             "Show one challenge" },
    { "listchallenges",       &listchallenges,       0,       "[validator]",      "List challenges, optionally against one validator" },
    { "quotefee",             &quotefee,             2,       "<amount> <chain>", "Quote the fee for a transfer in base units" },
    { "getstats",             &getstats,             0,       "",                 "Bridge totals and per-chain metrics" },
    { "liststuck",            &liststuck,            0,       "[time]",           "List transfers pending past the timeout at time (default: now)" },
    { "gethealth",            &gethealth,            0,       "[time]",           "Stuck transfers, validator quorum and chain status, exits 1 when unhealthy" },
};

static const UtilCommand* FindCommand(const std::string& name)
{
    for (const UtilCommand& cmd : commands) {
        if (name == cmd.name) return &cmd;
    }
    return nullptr;
}

static std::string HelpMessage()
{
    std::string strUsage = "Usage: quorum-util [options] <command> [args]\n\n";
    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", QUORUM_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-db=<path>", strprintf("Bridge database (default: <datadir>/%s)", BRIDGE_DB_FILENAME));
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information. <category> can be: " + ListLogCategories());
    strUsage += HelpMessageOpt("-debuglogfile=<file>", strprintf("Log file used with -printtodebuglog, relative paths are under the data directory (default: %s)", DEFAULT_DEBUGLOGFILE));
    strUsage += HelpMessageOpt("-printtoconsole", "Send log output to stdout");
    strUsage += HelpMessageOpt("-printtodebuglog", "Append log output to the debug log file (default: 0)");
    strUsage += GetBridgeHelpMessage();
    strUsage += HelpMessageGroup("Commands:");
    for (const UtilCommand& cmd : commands) {
        strUsage += HelpMessageOpt(strprintf("%s %s", cmd.name, cmd.argNames), cmd.help);
    }
    return strUsage;
}

static int AppInitUtil(int argc, char* argv[], UtilContext& ctx, std::vector<std::string>& argsOut)
{
    gArgs.ParseParameters(argc, argv);

    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        tfm::format(std::cout, "%s", HelpMessage());
        return argc < 2 ? EXIT_USAGE : EXIT_SUCCESS;
    }

    if (!fs::is_directory(GetDataDir())) {
        tfm::format(std::cerr, "Error: Specified data directory \"%s\" does not exist.\n", gArgs.GetArg("-datadir", ""));
        return EXIT_FAILURE;
    }
    try {
        gArgs.ReadConfigFile(gArgs.GetArg("-conf", QUORUM_CONF_FILENAME));
    } catch (const std::exception& e) {
        tfm::format(std::cerr, "Error reading configuration file: %s\n", e.what());
        return EXIT_FAILURE;
    }

    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", false);
    fPrintToDebugLog = gArgs.GetBoolArg("-printtodebuglog", false);
    if (fPrintToDebugLog) {
        OpenDebugLog();
    }
    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        uint32_t flag = 0;
        if (!GetLogCategory(&flag, &cat)) {
            tfm::format(std::cerr, "Warning: unsupported logging category -debug=%s\n", cat);
            continue;
        }
        logCategories |= flag;
    }

    std::string strError;
    if (!InitBridgeParams(ctx.params, strError)) {
        tfm::format(std::cerr, "Error: %s\n", strError);
        return EXIT_FAILURE;
    }

    // Positional arguments follow the options
    for (int i = 1; i < argc; ++i) {
        if (argv[i][0] != '-' || argsOut.size() > 0) {
            argsOut.push_back(argv[i]);
        }
    }
    if (argsOut.empty()) {
        tfm::format(std::cerr, "Error: no command given, see -?\n");
        return EXIT_USAGE;
    }
    return -1;
}

int main(int argc, char* argv[])
{
    try {
        UtilContext ctx;
        std::vector<std::string> args;
        int ret = AppInitUtil(argc, argv, ctx, args);
        if (ret != -1) return ret;

        const UtilCommand* cmd = FindCommand(args[0]);
        if (!cmd) {
            tfm::format(std::cerr, "Error: unknown command '%s', see -?\n", args[0]);
            return EXIT_USAGE;
        }
        args.erase(args.begin());
        if (args.size() < cmd->minArgs) {
            tfm::format(std::cerr, "Usage: quorum-util %s %s\n", cmd->name, cmd->argNames);
            return EXIT_USAGE;
        }

        std::string dbPath = gArgs.GetArg("-db", (GetDataDir() / BRIDGE_DB_FILENAME).string());
        if (!ctx.db.Open(dbPath)) {
            tfm::format(std::cerr, "Error: cannot open bridge database %s\n", dbPath);
            return EXIT_FAILURE;
        }
        int result = cmd->actor(ctx, args);
        ctx.db.Close();
        return result;
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, "quorum-util");
    }
    return EXIT_FAILURE;
}
