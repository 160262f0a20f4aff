#include "types.hpp"

#include <gmp.h>

namespace wnibe
{

Identity Identity::derive(const Pairing &pairing, const uint8_t *b, size_t len)
{
    uint8_t hash[HASH_BYTE_LEN];
    SHA3_512(b, len, hash);

    std::vector<Element> result;
    result.reserve(CHUNKS);

    mpz_t z;
    mpz_init(z);
    for (int i = 0; i < CHUNKS; i++)
    {
        const uint8_t *w = hash + i * CHUNK_SIZE;
        unsigned long v = static_cast<unsigned long>(w[0]) | static_cast<unsigned long>(w[1]) << 8 |
                          static_cast<unsigned long>(w[2]) << 16 | static_cast<unsigned long>(w[3]) << 24;
        mpz_set_ui(z, v);

        Element chunk(pairing, GROUP_ZR);
        element_set_mpz(chunk.get(), z); // 32 bits, never reduced
        result.push_back(chunk);
    }
    mpz_clear(z);

    return Identity(result);
}

Identity Identity::derive(const Pairing &pairing, const std::vector<uint8_t> &b)
{
    return derive(pairing, b.data(), b.size());
}

Identity Identity::deriveStr(const Pairing &pairing, const std::string &s)
{
    return derive(pairing, reinterpret_cast<const uint8_t *>(s.data()), s.size());
}

Choice Identity::ctEquals(const Identity &other) const
{
    Choice eq(1);
    for (int i = 0; i < CHUNKS; i++)
        eq &= chunks[i].ctEquals(other.chunks[i]);
    return eq;
}

} // namespace wnibe
