// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/bridge_params.h>
#include <test/test_quorum.h>
#include <util.h>

#include <boost/test/unit_test.hpp>

#include <string>

using namespace bridge;

namespace {

const Address OWNER = uint160S("1111111111111111111111111111111111111111");
const Address CUSTODY = uint160S("2222222222222222222222222222222222222222");

bool CheckFails(const BridgeParams& params, const std::string& fragment)
{
    std::string strError;
    if (params.Check(strError)) {
        return false;
    }
    return strError.find(fragment) != std::string::npos;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(bridge_params_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(default_params_are_valid)
{
    BridgeParams params = BridgeParams::Default(OWNER, CUSTODY);
    std::string strError;
    BOOST_CHECK_MESSAGE(params.Check(strError), strError);

    BOOST_CHECK_EQUAL(params.GetSlashShare(SlashRecipient::CHALLENGER) +
                      params.GetSlashShare(SlashRecipient::INSURANCE_FUND), BPS_DENOMINATOR);
    BOOST_CHECK(params.GetChain(2) != nullptr);
    BOOST_CHECK(params.GetChain(params.sourceChainId) == nullptr);
}

BOOST_AUTO_TEST_CASE(check_rejects_inconsistent_params)
{
    BridgeParams params = BridgeParams::Default(OWNER, CUSTODY);

    BridgeParams p = params;
    p.owner.SetNull();
    BOOST_CHECK(CheckFails(p, "owner"));

    p = params;
    p.custody = p.owner;
    BOOST_CHECK(CheckFails(p, "custody"));

    p = params;
    p.validatorThreshold = 0;
    BOOST_CHECK(CheckFails(p, "threshold"));

    p = params;
    p.validatorThreshold = 4;
    p.minValidatorsForQuorum = 3;
    BOOST_CHECK(CheckFails(p, "quorum"));

    p = params;
    p.slashBps = MAX_SLASH_BPS + 1;
    BOOST_CHECK(CheckFails(p, "exceeds cap"));

    p = params;
    p.slashDistribution[SlashRecipient::CHALLENGER] = 6000;
    BOOST_CHECK(CheckFails(p, "slash distribution"));

    p = params;
    p.supermajorityBps = 5000;
    BOOST_CHECK(CheckFails(p, "supermajority"));

    p = params;
    p.revealWindow = p.transactionTimeout + 1;
    BOOST_CHECK(CheckFails(p, "reveal window"));

    p = params;
    p.chains.clear();
    BOOST_CHECK(CheckFails(p, "no destination chains"));

    p = params;
    p.chains[2].maxAmount = p.chains[2].minAmount - 1;
    BOOST_CHECK(CheckFails(p, "bounds"));

    p = params;
    p.chains[1] = ChainConfig(1, "loop", 0, 0, 1, 10);
    BOOST_CHECK(CheckFails(p, "source chain"));
}

BOOST_AUTO_TEST_CASE(chain_fee_formula)
{
    ChainConfig chain(2, "dest", 1 * COIN, 10, 1 * COIN, 1000 * COIN);
    CAmount fee = 0;
    BOOST_CHECK(chain.ComputeFee(1000 * COIN, fee));
    BOOST_CHECK_EQUAL(fee, 1 * COIN + 1 * COIN); // base + 0.1%

    ChainConfig flat(3, "flat", 5, 0, 1, 10);
    BOOST_CHECK(flat.ComputeFee(10, fee));
    BOOST_CHECK_EQUAL(fee, 5);
}

BOOST_AUTO_TEST_CASE(parse_chain_config)
{
    ChainConfig chain;
    std::string strError;
    BOOST_CHECK(ParseChainConfig("7:polygon:100:25:1000:5000000", chain, strError));
    BOOST_CHECK_EQUAL(chain.chainId, 7U);
    BOOST_CHECK_EQUAL(chain.name, "polygon");
    BOOST_CHECK_EQUAL(chain.baseFee, 100);
    BOOST_CHECK_EQUAL(chain.feeBps, 25U);
    BOOST_CHECK_EQUAL(chain.minAmount, 1000);
    BOOST_CHECK_EQUAL(chain.maxAmount, 5000000);
    BOOST_CHECK(chain.isActive);

    BOOST_CHECK(!ParseChainConfig("7:polygon:100:25:1000", chain, strError));
    BOOST_CHECK(!ParseChainConfig("x:polygon:100:25:1000:2000", chain, strError));
    BOOST_CHECK(!ParseChainConfig("7:polygon:100:10001:1000:2000", chain, strError));
    BOOST_CHECK(!ParseChainConfig("0:polygon:100:25:1000:2000", chain, strError));
}

BOOST_AUTO_TEST_CASE(init_from_args)
{
    gArgs.ForceSetArg("-bridgeowner", OWNER.GetHex());
    gArgs.ForceSetArg("-custody", CUSTODY.GetHex());
    gArgs.ForceSetArg("-threshold", "2");
    gArgs.ForceSetArg("-minquorum", "4");
    gArgs.ForceSetArg("-attestationmode", "commitreveal");
    gArgs.ForceSetArg("-challengershare", "7000");
    gArgs.ForceSetArg("-chain", "5:dest:10:20:100:100000");

    BridgeParams params;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(InitBridgeParams(params, strError), strError);
    BOOST_CHECK(params.owner == OWNER);
    BOOST_CHECK(params.custody == CUSTODY);
    BOOST_CHECK_EQUAL(params.validatorThreshold, 2U);
    BOOST_CHECK_EQUAL(params.minValidatorsForQuorum, 4U);
    BOOST_CHECK(params.attestationMode == AttestationMode::COMMIT_REVEAL);
    BOOST_CHECK_EQUAL(params.GetSlashShare(SlashRecipient::CHALLENGER), 7000U);
    BOOST_CHECK_EQUAL(params.GetSlashShare(SlashRecipient::INSURANCE_FUND), 3000U);
    BOOST_REQUIRE(params.GetChain(5) != nullptr);
    BOOST_CHECK_EQUAL(params.GetChain(5)->baseFee, 10);
}

BOOST_AUTO_TEST_CASE(init_rejects_bad_args)
{
    BridgeParams params;
    std::string strError;

    // Owner and custody are mandatory
    BOOST_CHECK(!InitBridgeParams(params, strError));

    gArgs.ForceSetArg("-bridgeowner", OWNER.GetHex());
    gArgs.ForceSetArg("-custody", CUSTODY.GetHex());
    gArgs.ForceSetArg("-chain", "5:dest:10:20:100:100000");
    BOOST_CHECK_MESSAGE(InitBridgeParams(params, strError), strError);

    gArgs.ForceSetArg("-attestationmode", "optimistic");
    BOOST_CHECK(!InitBridgeParams(params, strError));
    BOOST_CHECK(strError.find("attestationmode") != std::string::npos);

    gArgs.ForceSetArg("-attestationmode", "direct");
    gArgs.ForceSetArg("-slashbps", "2500");
    BOOST_CHECK(!InitBridgeParams(params, strError));

    gArgs.ForceSetArg("-slashbps", "1000");
    gArgs.ForceSetArg("-threshold", "-1");
    BOOST_CHECK(!InitBridgeParams(params, strError));
}

BOOST_AUTO_TEST_SUITE_END()
