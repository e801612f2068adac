// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2017 The Bitcoin Core developers
// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_KEY_H
#define QUORUM_KEY_H

#include <pubkey.h>
#include <uint256.h>

#include <cstring>
#include <vector>

/**
 * A secp256k1 private key used to sign attestations.
 * Only the recoverable compact form is produced: the bridge identifies
 * the signer by recovering its key from the signature.
 */
class CKey
{
public:
    static const unsigned int KEY_SIZE = 32;

private:
    //! Checked whenever keydata changes
    bool fValid;

    //! Whether signatures recover to the compressed public key
    bool fCompressed;

    std::vector<unsigned char> keydata;

    bool static Check(const unsigned char* vch);

public:
    //! Construct an invalid private key.
    CKey() : fValid(false), fCompressed(false)
    {
        keydata.resize(KEY_SIZE);
    }

    //! Initialize from 32 bytes of secret. Out of range secrets leave the key invalid.
    template <typename T>
    void Set(const T pbegin, const T pend, bool fCompressedIn)
    {
        if (size_t(pend - pbegin) != keydata.size()) {
            fValid = false;
        } else if (Check(&pbegin[0])) {
            memcpy(keydata.data(), (unsigned char*)&pbegin[0], keydata.size());
            fValid = true;
            fCompressed = fCompressedIn;
        } else {
            fValid = false;
        }
    }

    unsigned int size() const { return (fValid ? keydata.size() : 0); }
    const unsigned char* begin() const { return keydata.data(); }
    const unsigned char* end() const { return keydata.data() + size(); }

    bool IsValid() const { return fValid; }
    bool IsCompressed() const { return fCompressed; }

    //! Compute the public key. Expensive.
    CPubKey GetPubKey() const;

    /**
     * Create a 65 byte compact signature from which the public key can be recovered.
     * Header byte 27 + recovery id, plus 4 for compressed keys, then r and s.
     */
    bool SignCompact(const uint256& hash, std::vector<unsigned char>& vchSig) const;
};

/** Initialize the signing context. May not be called twice without calling ECC_Stop first. */
void ECC_Start(void);

/** No-op if ECC_Start wasn't called first. */
void ECC_Stop(void);

#endif // QUORUM_KEY_H
