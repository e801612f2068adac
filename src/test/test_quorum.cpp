// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Quorum Test Suite

#include <test/test_quorum.h>

#include <bridge/attestation.h>
#include <util.h>
#include <utiltime.h>

#include <boost/test/unit_test.hpp>

#include <stdexcept>

BasicTestingSetup::BasicTestingSetup()
{
    ECC_Start();
    fPrintToDebugLog = false;
    fPrintToConsole = false;
    gArgs.ClearArgs();
    SetMockTime(0);
}

BasicTestingSetup::~BasicTestingSetup()
{
    SetMockTime(0);
    gArgs.ClearArgs();
    ECC_Stop();
}

CKey GenerateTestKey(FastRandomContext& rng)
{
    CKey key;
    uint256 secret = rng.rand256();
    key.Set(secret.begin(), secret.end(), true);
    while (!key.IsValid()) {
        secret = rng.rand256();
        key.Set(secret.begin(), secret.end(), true);
    }
    return key;
}

bridge::Address RandomTestAddress(FastRandomContext& rng)
{
    return bridge::AddressFromPubKey(GenerateTestKey(rng).GetPubKey());
}

BridgeTestingSetup::BridgeTestingSetup(size_t numValidators, size_t numUsers)
    : rng(true)
{
    ownerKey = GenerateTestKey(rng);
    owner = bridge::AddressFromPubKey(ownerKey.GetPubKey());
    custody = RandomTestAddress(rng);
    for (size_t i = 0; i < numValidators; ++i) {
        validatorKeys.push_back(GenerateTestKey(rng));
        validators.push_back(bridge::AddressFromPubKey(validatorKeys.back().GetPubKey()));
    }
    for (size_t i = 0; i < numUsers; ++i) {
        users.push_back(RandomTestAddress(rng));
    }

    params = bridge::BridgeParams::Default(owner, custody);
    params.validatorThreshold = 2;
    params.minValidatorsForQuorum = 2;
    ResetNode();
}

void BridgeTestingSetup::ResetNode()
{
    std::string strError;
    if (!params.Check(strError)) {
        throw std::runtime_error("BridgeTestingSetup: invalid parameters: " + strError);
    }
    node.reset();
    ledger.reset(new bridge::InMemoryTokenLedger(custody));
    node.reset(new bridge::BridgeNode(params, *ledger, &payments));
}

void BridgeTestingSetup::RegisterValidators(size_t n, CAmount stake, uint64_t now)
{
    for (size_t i = 0; i < n; ++i) {
        BOOST_REQUIRE(ledger->Mint(validators[i], stake));
        BOOST_REQUIRE(Registry().AddValidator(owner, validators[i], stake, now));
    }
}

uint64_t BridgeTestingSetup::InitiateTransfer(const bridge::Address& user, CAmount amount, uint64_t now)
{
    CAmount fee = 0;
    BOOST_REQUIRE(StateMachine().QuoteFee(amount, 2, fee));
    BOOST_REQUIRE(ledger->Mint(user, amount + fee));
    uint64_t nonce = 0;
    bridge::BridgeResult result = StateMachine().Initiate(user, amount, 2, now, nonce);
    BOOST_REQUIRE_MESSAGE(result, result.ToString());
    return nonce;
}

std::vector<unsigned char> BridgeTestingSetup::SignTransfer(size_t i, uint64_t nonce) const
{
    std::optional<bridge::BridgeTransaction> tx = node->StateMachine().GetTransaction(nonce);
    BOOST_REQUIRE(tx);
    std::vector<unsigned char> sig;
    BOOST_REQUIRE(validatorKeys[i].SignCompact(tx->GetMessage().GetHash(), sig));
    return sig;
}

bridge::BridgeResult BridgeTestingSetup::AttestTransfer(size_t i, uint64_t nonce, uint64_t now)
{
    return StateMachine().Attest(validators[i], nonce, bridge::AttestationSubmission(SignTransfer(i, nonce)), now);
}
