#include "ct.hpp"

#include <openssl/crypto.h>

namespace wnibe
{

Choice Choice::fromInt(int x)
{
    uint32_t u = static_cast<uint32_t>(x);
    // top bit of (u | -u) is set iff u != 0
    return Choice(static_cast<uint8_t>((u | (0u - u)) >> 31));
}

Choice ctEq(const uint8_t *a, const uint8_t *b, size_t len)
{
    return !Choice::fromInt(CRYPTO_memcmp(a, b, len));
}

void ctSelect(uint8_t *out, const uint8_t *a, const uint8_t *b, size_t len, Choice choice)
{
    uint8_t mask = static_cast<uint8_t>(0u - choice.unwrapU8());
    for (size_t i = 0; i < len; i++)
        out[i] = a[i] ^ (mask & (a[i] ^ b[i]));
}

} // namespace wnibe
