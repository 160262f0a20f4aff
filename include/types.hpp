#ifndef WNIBE_TYPES_HPP
#define WNIBE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ct.hpp"
#include "pairing.hpp"

/*
 * Value types of the Waters-Naccache scheme and their byte encodings.
 *
 * G1 and G2 points are written compressed, GT elements uncompressed, fields
 * concatenated in declaration order with no tag or length prefix. Sizes
 * depend on the loaded pairing; byteSize() reports them. The layout is not
 * promised to stay the same between releases.
 *
 * fromBytes() never throws on bad input: every field is decoded and checked
 * (canonical encoding, on the curve, in the order-r subgroup), the results
 * are combined without early exit, and an invalid input yields an absent
 * CtOption whose placeholder holds only group identities.
 */

namespace wnibe
{

class WNIBE;

/**
 * Field parameters for an identity: SHA3-512 of the identity bytes cut into
 * CHUNKS little-endian 32-bit words, each taken as a Zr element.
 */
class Identity
{
private:
    std::vector<Element> chunks;

    explicit Identity(const std::vector<Element> &chunks) : chunks(chunks) {}

public:
    static Identity derive(const Pairing &pairing, const uint8_t *b, size_t len);
    static Identity derive(const Pairing &pairing, const std::vector<uint8_t> &b);
    // raw UTF-8 bytes, no normalisation
    static Identity deriveStr(const Pairing &pairing, const std::string &s);

    const Element &chunk(int i) const { return chunks[i]; }

    Choice ctEquals(const Identity &other) const;
    bool operator==(const Identity &other) const { return ctEquals(other).reveal(); }
    bool operator!=(const Identity &other) const { return !(*this == other); }
};

/**
 * CHUNKS points of G2, the u vector of the public key.
 */
class Parameters
{
private:
    std::vector<Element> u;

public:
    // u must hold exactly CHUNKS elements of G2, runtime_error otherwise
    explicit Parameters(const std::vector<Element> &u);
    // CHUNKS identities
    explicit Parameters(const Pairing &pairing);

    /**
     * uprime * prod(u[i] ^ v[i]), i.e. uprime + sum(v[i] * u[i]) in additive
     * notation. Extraction and encryption both go through here.
     */
    Element accumulate(const Element &uprime, const Identity &v) const;

    static size_t byteSize(const Pairing &pairing);
    void toBytes(uint8_t *out) const;
    std::vector<uint8_t> toBytes() const;
    static CtOption<Parameters> fromBytes(const Pairing &pairing, const uint8_t *data, size_t len);

    static Parameters conditionalSelect(const Parameters &a, const Parameters &b, Choice choice);
    Choice ctEquals(const Parameters &other) const;
    bool operator==(const Parameters &other) const { return ctEquals(other).reveal(); }
    bool operator!=(const Parameters &other) const { return !(*this == other); }
};

/**
 * Public parameters generated by the PKG, used to encrypt messages.
 */
class PublicKey
{
private:
    Element g;      // G1
    Element g1;     // G1, g^alpha
    Element g2;     // G2
    Element uprime; // G2
    Parameters u;

    friend class WNIBE;

public:
    PublicKey(const Element &g, const Element &g1, const Element &g2, const Element &uprime, const Parameters &u)
        : g(g), g1(g1), g2(g2), uprime(uprime), u(u) {}

    const Parameters &getU() const { return u; }

    static size_t byteSize(const Pairing &pairing);
    std::vector<uint8_t> toBytes() const;
    static CtOption<PublicKey> fromBytes(const Pairing &pairing, const uint8_t *data, size_t len);
    static CtOption<PublicKey> fromBytes(const Pairing &pairing, const std::vector<uint8_t> &data)
    {
        return fromBytes(pairing, data.data(), data.size());
    }

    static PublicKey conditionalSelect(const PublicKey &a, const PublicKey &b, Choice choice);
    Choice ctEquals(const PublicKey &other) const;
    bool operator==(const PublicKey &other) const { return ctEquals(other).reveal(); }
    bool operator!=(const PublicKey &other) const { return !(*this == other); }
};

/**
 * PKG master secret. Only the PKG should ever hold its encoding.
 */
class SecretKey
{
private:
    Element g2prime; // G2, g2^alpha

    friend class WNIBE;

public:
    explicit SecretKey(const Element &g2prime) : g2prime(g2prime) {}

    static size_t byteSize(const Pairing &pairing);
    std::vector<uint8_t> toBytes() const;
    static CtOption<SecretKey> fromBytes(const Pairing &pairing, const uint8_t *data, size_t len);
    static CtOption<SecretKey> fromBytes(const Pairing &pairing, const std::vector<uint8_t> &data)
    {
        return fromBytes(pairing, data.data(), data.size());
    }

    static SecretKey conditionalSelect(const SecretKey &a, const SecretKey &b, Choice choice);
    Choice ctEquals(const SecretKey &other) const;
    bool operator==(const SecretKey &other) const { return ctEquals(other).reveal(); }
    bool operator!=(const SecretKey &other) const { return !(*this == other); }
};

/**
 * Points on the paired curves that form the user secret key.
 */
class UserSecretKey
{
private:
    Element d1; // G2
    Element d2; // G1

    friend class WNIBE;

public:
    UserSecretKey(const Element &d1, const Element &d2) : d1(d1), d2(d2) {}

    static size_t byteSize(const Pairing &pairing);
    std::vector<uint8_t> toBytes() const;
    static CtOption<UserSecretKey> fromBytes(const Pairing &pairing, const uint8_t *data, size_t len);
    static CtOption<UserSecretKey> fromBytes(const Pairing &pairing, const std::vector<uint8_t> &data)
    {
        return fromBytes(pairing, data.data(), data.size());
    }

    static UserSecretKey conditionalSelect(const UserSecretKey &a, const UserSecretKey &b, Choice choice);
    Choice ctEquals(const UserSecretKey &other) const;
    bool operator==(const UserSecretKey &other) const { return ctEquals(other).reveal(); }
    bool operator!=(const UserSecretKey &other) const { return !(*this == other); }
};

/**
 * Encrypted message. Can only be decrypted with a user secret key.
 */
class CipherText
{
private:
    Element c1; // GT
    Element c2; // G1
    Element c3; // G2

    friend class WNIBE;

public:
    CipherText(const Element &c1, const Element &c2, const Element &c3) : c1(c1), c2(c2), c3(c3) {}

    static size_t byteSize(const Pairing &pairing);
    std::vector<uint8_t> toBytes() const;
    static CtOption<CipherText> fromBytes(const Pairing &pairing, const uint8_t *data, size_t len);
    static CtOption<CipherText> fromBytes(const Pairing &pairing, const std::vector<uint8_t> &data)
    {
        return fromBytes(pairing, data.data(), data.size());
    }

    static CipherText conditionalSelect(const CipherText &a, const CipherText &b, Choice choice);
    Choice ctEquals(const CipherText &other) const;
    bool operator==(const CipherText &other) const { return ctEquals(other).reveal(); }
    bool operator!=(const CipherText &other) const { return !(*this == other); }
};

/**
 * A GT element that can be encrypted and decrypted.
 *
 * Not a container for arbitrary plaintext: derive a symmetric key from
 * toBytes() instead.
 */
class Message
{
private:
    Element m; // GT

public:
    explicit Message(const Element &m) : m(m) {}

    // uniformly random GT element
    static Message generate(const Pairing &pairing, Rng &rng);

    const Element &element() const { return m; }

    static size_t byteSize(const Pairing &pairing);
    std::vector<uint8_t> toBytes() const;
    static CtOption<Message> fromBytes(const Pairing &pairing, const uint8_t *data, size_t len);
    static CtOption<Message> fromBytes(const Pairing &pairing, const std::vector<uint8_t> &data)
    {
        return fromBytes(pairing, data.data(), data.size());
    }

    static Message conditionalSelect(const Message &a, const Message &b, Choice choice);
    Choice ctEquals(const Message &other) const;
    bool operator==(const Message &other) const { return ctEquals(other).reveal(); }
    bool operator!=(const Message &other) const { return !(*this == other); }
};

} // namespace wnibe

#endif
