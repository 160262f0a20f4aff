#include "utils.hpp"

#include <iostream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace wnibe
{

void handleErrors(const char *errorMessage)
{
    std::cerr << "Error: " << errorMessage << std::endl;
    throw std::runtime_error(errorMessage);
}

uint32_t SHA3_512(const uint8_t *src, size_t slen, uint8_t *dest)
{
    const EVP_MD *md = EVP_sha3_512();
    EVP_MD_CTX *mdctx;
    unsigned int dlen = HASH_BYTE_LEN;

    if ((mdctx = EVP_MD_CTX_new()) == NULL)
    {
        handleErrors("EVP_MD_CTX_new error occurred.");
    }

    if (EVP_DigestInit_ex(mdctx, md, NULL) != 1)
    { // returns 1 if successful
        EVP_MD_CTX_free(mdctx);
        handleErrors("EVP_DigestInit_ex error occurred.");
    }

    if (EVP_DigestUpdate(mdctx, src, slen) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        handleErrors("EVP_DigestUpdate error occurred.");
    }

    if (EVP_DigestFinal_ex(mdctx, dest, &dlen) != 1)
    { // returns 1 if successful
        EVP_MD_CTX_free(mdctx);
        handleErrors("EVP_DigestFinal_ex error occurred.");
    }

    EVP_MD_CTX_free(mdctx);

    return dlen;
}

void OsRng::fill(uint8_t *buf, size_t len)
{
    while (len > 0)
    {
        int chunk = len > 0x10000 ? 0x10000 : static_cast<int>(len);
        if (RAND_bytes(buf, chunk) != 1)
        {
            handleErrors("RAND_bytes error occurred.");
        }
        buf += chunk;
        len -= chunk;
    }
}

} // namespace wnibe
