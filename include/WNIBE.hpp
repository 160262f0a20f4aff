#ifndef WNIBE_HPP
#define WNIBE_HPP

#include <utility>

#include "pairing.hpp"
#include "types.hpp"
#include "utils.hpp"

/*
 * Waters-Naccache identity based encryption.
 *
 *   "Secure and Practical Identity-Based Encryption", IET Information
 *   Security, 2007 (eprint 2005/369).
 *
 * Identities are hashed to CHUNKS 32-bit words with SHA3-512.
 */

namespace wnibe
{

class WNIBE
{
private:
    const Pairing &pairing;

public:
    explicit WNIBE(const Pairing &pairing) : pairing(pairing) {}

    const Pairing &getPairing() const { return pairing; }

    // PKG key pair
    std::pair<PublicKey, SecretKey> Setup(Rng &rng) const;

    /**
     * User secret key for identity v.
     *
     * Every call draws a fresh r, so extracting twice for one identity
     * gives two different keys that both decrypt.
     */
    UserSecretKey Extract(const PublicKey &pk, const SecretKey &sk, const Identity &v, Rng &rng) const;

    /**
     * Encrypt m to identity v.
     *
     * The caller must hand every encryption its own randomness: two
     * ciphertexts sharing t leak the ratio of their messages.
     */
    CipherText Encrypt(const PublicKey &pk, const Identity &v, const Message &m, Rng &rng) const;

    // A key for another identity yields an unrelated message, not an error.
    Message Decrypt(const UserSecretKey &usk, const CipherText &c) const;
};

} // namespace wnibe

#endif
