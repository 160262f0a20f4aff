#ifndef WNIBE_UTILS_HPP
#define WNIBE_UTILS_HPP

#include <cstddef>
#include <cstdint>

#define HASH_BIT_LEN 512
#define HASH_BYTE_LEN (HASH_BIT_LEN / 8)

#define CHUNK_BITS 32
#define CHUNK_SIZE (CHUNK_BITS / 8)
#define CHUNKS (HASH_BYTE_LEN / CHUNK_SIZE)

// bytes drawn from the rng per sampled scalar or hashed point
#define SEED_SPACE 64

namespace wnibe
{

// Logs to stderr and throws std::runtime_error.
[[noreturn]] void handleErrors(const char *errorMessage);

// dest must hold HASH_BYTE_LEN bytes
uint32_t SHA3_512(const uint8_t *src, size_t slen, uint8_t *dest);

/**
 * Source of cryptographically secure random bytes.
 *
 * Each call site should own its handle, or share one whose fill() is
 * thread-safe. Feeding the same bytes to two extractions or encryptions
 * breaks the scheme; nothing here detects that.
 */
class Rng
{
public:
    virtual ~Rng() {}
    virtual void fill(uint8_t *buf, size_t len) = 0;
};

// OpenSSL RAND_bytes.
class OsRng : public Rng
{
public:
    void fill(uint8_t *buf, size_t len);
};

} // namespace wnibe

#endif
