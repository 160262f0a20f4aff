#include "WNIBE.hpp"

#include <vector>

namespace wnibe
{

std::pair<PublicKey, SecretKey> WNIBE::Setup(Rng &rng) const
{
    Element g = pairing.Random_G1(rng);
    Element alpha = pairing.Random_Zr(rng); // master secret

    Element g1(pairing, GROUP_G1);
    element_pow_zn(g1.get(), g.get(), alpha.get()); // g1 = g^alpha

    Element g2 = pairing.Random_G2(rng);
    Element uprime = pairing.Random_G2(rng);

    std::vector<Element> u;
    u.reserve(CHUNKS);
    for (int i = 0; i < CHUNKS; i++)
        u.push_back(pairing.Random_G2(rng));

    Element g2prime(pairing, GROUP_G2);
    element_pow_zn(g2prime.get(), g2.get(), alpha.get()); // g2prime = g2^alpha

    element_set0(alpha.get());

    return std::make_pair(PublicKey(g, g1, g2, uprime, Parameters(u)), SecretKey(g2prime));
}

UserSecretKey WNIBE::Extract(const PublicKey &pk, const SecretKey &sk, const Identity &v, Rng &rng) const
{
    Element ucoll = pk.u.accumulate(pk.uprime, v);

    Element r = pairing.Random_Zr(rng);

    // d1 = g2prime * ucoll^r
    Element d1(pairing, GROUP_G2);
    element_pow_zn(d1.get(), ucoll.get(), r.get());
    element_mul(d1.get(), sk.g2prime.get(), d1.get());

    Element d2(pairing, GROUP_G1);
    element_pow_zn(d2.get(), pk.g.get(), r.get()); // d2 = g^r

    element_set0(r.get());

    return UserSecretKey(d1, d2);
}

CipherText WNIBE::Encrypt(const PublicKey &pk, const Identity &v, const Message &m, Rng &rng) const
{
    Element t = pairing.Random_Zr(rng);

    Element c3coll = pk.u.accumulate(pk.uprime, v);

    // c1 = e(g1, g2)^t * m
    Element c1(pairing, GROUP_GT);
    element_pairing(c1.get(), pk.g1.get(), pk.g2.get());
    element_pow_zn(c1.get(), c1.get(), t.get());
    element_mul(c1.get(), c1.get(), m.element().get());

    Element c2(pairing, GROUP_G1);
    element_pow_zn(c2.get(), pk.g.get(), t.get()); // c2 = g^t

    Element c3(pairing, GROUP_G2);
    element_pow_zn(c3.get(), c3coll.get(), t.get()); // c3 = c3coll^t

    element_set0(t.get());

    return CipherText(c1, c2, c3);
}

Message WNIBE::Decrypt(const UserSecretKey &usk, const CipherText &c) const
{
    Element num(pairing, GROUP_GT);
    element_pairing(num.get(), usk.d2.get(), c.c3.get()); // num = e(d2, c3)

    Element dem(pairing, GROUP_GT);
    element_pairing(dem.get(), c.c2.get(), usk.d1.get()); // dem = e(c2, d1)

    // m = c1 * num / dem
    Element m(pairing, GROUP_GT);
    element_mul(m.get(), c.c1.get(), num.get());
    element_div(m.get(), m.get(), dem.get());

    return Message(m);
}

} // namespace wnibe
