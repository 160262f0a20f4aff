#include "types.hpp"

namespace wnibe
{

namespace
{

// write a compressed point and advance the cursor
void putCompressed(uint8_t *&out, const Element &p)
{
    p.toBytesCompressed(out);
    out += p.lengthInBytesCompressed();
}

void putUncompressed(uint8_t *&out, const Element &p)
{
    p.toBytes(out);
    out += p.lengthInBytes();
}

Element takeCompressed(const Pairing &pairing, Group group, const uint8_t *&in, Choice &valid)
{
    Choice ok;
    Element p = Element::fromBytesCompressed(pairing, group, in, ok);
    valid &= ok;
    in += p.lengthInBytesCompressed();
    return p;
}

Element takeUncompressed(const Pairing &pairing, Group group, const uint8_t *&in, Choice &valid)
{
    Choice ok;
    Element p = Element::fromBytes(pairing, group, in, ok);
    valid &= ok;
    in += p.lengthInBytes();
    return p;
}

} // namespace

// Parameters

Parameters::Parameters(const std::vector<Element> &u) : u(u)
{
    if (u.size() != CHUNKS)
        handleErrors("Parameters need one point per identity chunk");
    for (size_t i = 0; i < u.size(); i++)
    {
        if (u[i].getGroup() != GROUP_G2)
            handleErrors("Parameters must be points of G2");
    }
}

Parameters::Parameters(const Pairing &pairing)
    : u(CHUNKS, Element(pairing, GROUP_G2))
{
}

Element Parameters::accumulate(const Element &uprime, const Identity &v) const
{
    Element coll(uprime);
    Element term(uprime);
    for (int i = 0; i < CHUNKS; i++)
    {
        element_pow_zn(term.get(), u[i].get(), v.chunk(i).get()); // u[i]^v[i]
        element_mul(coll.get(), coll.get(), term.get());
    }
    return coll;
}

size_t Parameters::byteSize(const Pairing &pairing)
{
    return CHUNKS * static_cast<size_t>(pairing.getLenG2());
}

void Parameters::toBytes(uint8_t *out) const
{
    for (int i = 0; i < CHUNKS; i++)
        putCompressed(out, u[i]);
}

std::vector<uint8_t> Parameters::toBytes() const
{
    std::vector<uint8_t> res(CHUNKS * static_cast<size_t>(u[0].lengthInBytesCompressed()));
    toBytes(res.data());
    return res;
}

CtOption<Parameters> Parameters::fromBytes(const Pairing &pairing, const uint8_t *data, size_t len)
{
    Parameters placeholder(pairing);
    if (len != byteSize(pairing))
        return CtOption<Parameters>(placeholder, Choice(0));

    Choice is_some(1);
    std::vector<Element> res;
    res.reserve(CHUNKS);
    for (int i = 0; i < CHUNKS; i++)
        res.push_back(takeCompressed(pairing, GROUP_G2, data, is_some));

    return CtOption<Parameters>(conditionalSelect(placeholder, Parameters(res), is_some), is_some);
}

Parameters Parameters::conditionalSelect(const Parameters &a, const Parameters &b, Choice choice)
{
    std::vector<Element> res;
    res.reserve(CHUNKS);
    for (int i = 0; i < CHUNKS; i++)
        res.push_back(Element::conditionalSelect(a.u[i], b.u[i], choice));
    return Parameters(res);
}

Choice Parameters::ctEquals(const Parameters &other) const
{
    Choice eq(1);
    for (int i = 0; i < CHUNKS; i++)
        eq &= u[i].ctEquals(other.u[i]);
    return eq;
}

// PublicKey

size_t PublicKey::byteSize(const Pairing &pairing)
{
    return 2 * static_cast<size_t>(pairing.getLenG1()) + 2 * static_cast<size_t>(pairing.getLenG2()) +
           Parameters::byteSize(pairing);
}

std::vector<uint8_t> PublicKey::toBytes() const
{
    size_t ulen = CHUNKS * static_cast<size_t>(uprime.lengthInBytesCompressed());
    std::vector<uint8_t> res(g.lengthInBytesCompressed() + g1.lengthInBytesCompressed() +
                             g2.lengthInBytesCompressed() + uprime.lengthInBytesCompressed() + ulen);
    uint8_t *out = res.data();
    putCompressed(out, g);
    putCompressed(out, g1);
    putCompressed(out, g2);
    putCompressed(out, uprime);
    u.toBytes(out);
    return res;
}

CtOption<PublicKey> PublicKey::fromBytes(const Pairing &pairing, const uint8_t *data, size_t len)
{
    Element zero1(pairing, GROUP_G1);
    Element zero2(pairing, GROUP_G2);
    Parameters zeroU(pairing);
    PublicKey placeholder(zero1, zero1, zero2, zero2, zeroU);
    if (len != byteSize(pairing))
        return CtOption<PublicKey>(placeholder, Choice(0));

    Choice is_some(1);
    Element g = takeCompressed(pairing, GROUP_G1, data, is_some);
    Element g1 = takeCompressed(pairing, GROUP_G1, data, is_some);
    Element g2 = takeCompressed(pairing, GROUP_G2, data, is_some);
    Element uprime = takeCompressed(pairing, GROUP_G2, data, is_some);
    CtOption<Parameters> u = Parameters::fromBytes(pairing, data, Parameters::byteSize(pairing));
    is_some &= u.isSome();

    PublicKey decoded(g, g1, g2, uprime, u.unwrapOr(zeroU));
    return CtOption<PublicKey>(conditionalSelect(placeholder, decoded, is_some), is_some);
}

PublicKey PublicKey::conditionalSelect(const PublicKey &a, const PublicKey &b, Choice choice)
{
    return PublicKey(Element::conditionalSelect(a.g, b.g, choice),
                     Element::conditionalSelect(a.g1, b.g1, choice),
                     Element::conditionalSelect(a.g2, b.g2, choice),
                     Element::conditionalSelect(a.uprime, b.uprime, choice),
                     Parameters::conditionalSelect(a.u, b.u, choice));
}

Choice PublicKey::ctEquals(const PublicKey &other) const
{
    return g.ctEquals(other.g) & g1.ctEquals(other.g1) & g2.ctEquals(other.g2) &
           uprime.ctEquals(other.uprime) & u.ctEquals(other.u);
}

// SecretKey

size_t SecretKey::byteSize(const Pairing &pairing)
{
    return pairing.getLenG2();
}

std::vector<uint8_t> SecretKey::toBytes() const
{
    std::vector<uint8_t> res(g2prime.lengthInBytesCompressed());
    g2prime.toBytesCompressed(res.data());
    return res;
}

CtOption<SecretKey> SecretKey::fromBytes(const Pairing &pairing, const uint8_t *data, size_t len)
{
    SecretKey placeholder((Element(pairing, GROUP_G2)));
    if (len != byteSize(pairing))
        return CtOption<SecretKey>(placeholder, Choice(0));

    Choice is_some(1);
    Element g2prime = takeCompressed(pairing, GROUP_G2, data, is_some);

    return CtOption<SecretKey>(conditionalSelect(placeholder, SecretKey(g2prime), is_some), is_some);
}

SecretKey SecretKey::conditionalSelect(const SecretKey &a, const SecretKey &b, Choice choice)
{
    return SecretKey(Element::conditionalSelect(a.g2prime, b.g2prime, choice));
}

Choice SecretKey::ctEquals(const SecretKey &other) const
{
    return g2prime.ctEquals(other.g2prime);
}

// UserSecretKey

size_t UserSecretKey::byteSize(const Pairing &pairing)
{
    return static_cast<size_t>(pairing.getLenG2()) + pairing.getLenG1();
}

std::vector<uint8_t> UserSecretKey::toBytes() const
{
    std::vector<uint8_t> res(d1.lengthInBytesCompressed() + d2.lengthInBytesCompressed());
    uint8_t *out = res.data();
    putCompressed(out, d1);
    putCompressed(out, d2);
    return res;
}

CtOption<UserSecretKey> UserSecretKey::fromBytes(const Pairing &pairing, const uint8_t *data, size_t len)
{
    UserSecretKey placeholder(Element(pairing, GROUP_G2), Element(pairing, GROUP_G1));
    if (len != byteSize(pairing))
        return CtOption<UserSecretKey>(placeholder, Choice(0));

    Choice is_some(1);
    Element d1 = takeCompressed(pairing, GROUP_G2, data, is_some);
    Element d2 = takeCompressed(pairing, GROUP_G1, data, is_some);

    return CtOption<UserSecretKey>(conditionalSelect(placeholder, UserSecretKey(d1, d2), is_some), is_some);
}

UserSecretKey UserSecretKey::conditionalSelect(const UserSecretKey &a, const UserSecretKey &b, Choice choice)
{
    return UserSecretKey(Element::conditionalSelect(a.d1, b.d1, choice),
                         Element::conditionalSelect(a.d2, b.d2, choice));
}

Choice UserSecretKey::ctEquals(const UserSecretKey &other) const
{
    return d1.ctEquals(other.d1) & d2.ctEquals(other.d2);
}

// CipherText

size_t CipherText::byteSize(const Pairing &pairing)
{
    return static_cast<size_t>(pairing.getLenGT()) + pairing.getLenG1() + pairing.getLenG2();
}

std::vector<uint8_t> CipherText::toBytes() const
{
    std::vector<uint8_t> res(c1.lengthInBytes() + c2.lengthInBytesCompressed() + c3.lengthInBytesCompressed());
    uint8_t *out = res.data();
    putUncompressed(out, c1);
    putCompressed(out, c2);
    putCompressed(out, c3);
    return res;
}

CtOption<CipherText> CipherText::fromBytes(const Pairing &pairing, const uint8_t *data, size_t len)
{
    CipherText placeholder(Element(pairing, GROUP_GT), Element(pairing, GROUP_G1), Element(pairing, GROUP_G2));
    if (len != byteSize(pairing))
        return CtOption<CipherText>(placeholder, Choice(0));

    Choice is_some(1);
    Element c1 = takeUncompressed(pairing, GROUP_GT, data, is_some);
    Element c2 = takeCompressed(pairing, GROUP_G1, data, is_some);
    Element c3 = takeCompressed(pairing, GROUP_G2, data, is_some);

    return CtOption<CipherText>(conditionalSelect(placeholder, CipherText(c1, c2, c3), is_some), is_some);
}

CipherText CipherText::conditionalSelect(const CipherText &a, const CipherText &b, Choice choice)
{
    return CipherText(Element::conditionalSelect(a.c1, b.c1, choice),
                      Element::conditionalSelect(a.c2, b.c2, choice),
                      Element::conditionalSelect(a.c3, b.c3, choice));
}

Choice CipherText::ctEquals(const CipherText &other) const
{
    return c1.ctEquals(other.c1) & c2.ctEquals(other.c2) & c3.ctEquals(other.c3);
}

// Message

Message Message::generate(const Pairing &pairing, Rng &rng)
{
    return Message(pairing.Random_GT(rng));
}

size_t Message::byteSize(const Pairing &pairing)
{
    return pairing.getLenGT();
}

std::vector<uint8_t> Message::toBytes() const
{
    std::vector<uint8_t> res(m.lengthInBytes());
    m.toBytes(res.data());
    return res;
}

CtOption<Message> Message::fromBytes(const Pairing &pairing, const uint8_t *data, size_t len)
{
    Message placeholder((Element(pairing, GROUP_GT)));
    if (len != byteSize(pairing))
        return CtOption<Message>(placeholder, Choice(0));

    Choice is_some(1);
    Element m = takeUncompressed(pairing, GROUP_GT, data, is_some);

    return CtOption<Message>(conditionalSelect(placeholder, Message(m), is_some), is_some);
}

Message Message::conditionalSelect(const Message &a, const Message &b, Choice choice)
{
    return Message(Element::conditionalSelect(a.m, b.m, choice));
}

Choice Message::ctEquals(const Message &other) const
{
    return m.ctEquals(other.m);
}

} // namespace wnibe
