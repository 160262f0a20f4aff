#include "pairing.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

#include <gmp.h>
#include <openssl/crypto.h>

#include "pbc_test.h"

namespace wnibe
{

const char TYPE_A_PARAMS[] = "type a\n"
                             "q 8780710799663312522437781984754049815806883199414208211028653399266475630880222957078625179422662221423155858769582317459277713367317481324925129998224791\n"
                             "h 12016012264891146079388821366740534204802954401251311822919615131047207289359704531102844802183906537786776\n"
                             "r 730750818665451621361119245571504901405976559617\n"
                             "exp2 159\n"
                             "exp1 107\n"
                             "sign1 1\n"
                             "sign0 1\n";

Pairing::Pairing()
{
    if (pairing_init_set_buf(pairing, TYPE_A_PARAMS, strlen(TYPE_A_PARAMS)))
    {
        handleErrors("Pairing initialization failed");
    }
    init();
}

Pairing::Pairing(const char *param, size_t len)
{
    if (pairing_init_set_buf(pairing, param, len))
    {
        handleErrors("Pairing initialization failed");
    }
    init();
}

Pairing::Pairing(int argc, char **argv)
{
    pbc_demo_pairing_init(pairing, argc, argv);
    init();
}

void Pairing::init()
{
    lenG1 = pairing_length_in_bytes_compressed_G1(pairing);
    lenG2 = pairing_length_in_bytes_compressed_G2(pairing);
    lenGT = pairing_length_in_bytes_GT(pairing);
    lenZr = pairing_length_in_bytes_Zr(pairing);
}

Pairing::~Pairing()
{
    pairing_clear(pairing);
}

std::unique_ptr<Pairing> Pairing::fromFile(const std::string &path)
{
    std::ifstream infile(path.c_str());
    if (!infile.is_open())
    {
        std::string msg = "Cannot open parameter file " + path;
        handleErrors(msg.c_str());
    }
    std::stringstream buffer;
    buffer << infile.rdbuf();
    std::string param = buffer.str();

    return std::unique_ptr<Pairing>(new Pairing(param.c_str(), param.size()));
}

bool Pairing::isSymmetric() const
{
    return pairing_is_symmetric(pairing) != 0;
}

void Pairing::getOrder(mpz_t out) const
{
    mpz_set(out, pairing->r);
}

Element Pairing::Random_Zr(Rng &rng) const
{
    uint8_t seed[SEED_SPACE];
    rng.fill(seed, SEED_SPACE);

    mpz_t z;
    mpz_init(z);
    mpz_import(z, SEED_SPACE, 1, 1, 1, 0, seed);
    mpz_mod(z, z, pairing->r);

    Element r(*this, GROUP_ZR);
    element_set_mpz(r.get(), z);

    // covers the unreduced seed as well as the scalar
    size_t limbs = (SEED_SPACE + sizeof(mp_limb_t) - 1) / sizeof(mp_limb_t);
    OPENSSL_cleanse(mpz_limbs_modify(z, limbs), limbs * sizeof(mp_limb_t));
    mpz_clear(z);
    OPENSSL_cleanse(seed, SEED_SPACE);
    return r;
}

Element Pairing::Random_G1(Rng &rng) const
{
    uint8_t seed[SEED_SPACE];
    rng.fill(seed, SEED_SPACE);

    Element p(*this, GROUP_G1);
    element_from_hash(p.get(), seed, SEED_SPACE); // lands in the order-r subgroup

    OPENSSL_cleanse(seed, SEED_SPACE);
    return p;
}

Element Pairing::Random_G2(Rng &rng) const
{
    uint8_t seed[SEED_SPACE];
    rng.fill(seed, SEED_SPACE);

    Element p(*this, GROUP_G2);
    element_from_hash(p.get(), seed, SEED_SPACE);

    OPENSSL_cleanse(seed, SEED_SPACE);
    return p;
}

Element Pairing::Random_GT(Rng &rng) const
{
    Element a = Random_G1(rng);
    Element b = Random_G2(rng);

    Element m(*this, GROUP_GT);
    element_pairing(m.get(), a.get(), b.get()); // m = e(a, b)
    return m;
}

Element::Element(const Pairing &pairing, Group group) : group(group)
{
    switch (group)
    {
    case GROUP_G1:
        element_init_G1(e, pairing.get());
        element_set0(e);
        break;
    case GROUP_G2:
        element_init_G2(e, pairing.get());
        element_set0(e);
        break;
    case GROUP_GT:
        element_init_GT(e, pairing.get());
        element_set1(e);
        break;
    case GROUP_ZR:
        element_init_Zr(e, pairing.get());
        element_set0(e);
        break;
    }
}

Element::Element(const Element &other) : group(other.group)
{
    element_init_same_as(e, other.e);
    element_set(e, other.e);
}

Element &Element::operator=(const Element &other)
{
    if (this == &other)
        return *this;
    if (e->field != other.e->field)
    {
        element_clear(e);
        element_init_same_as(e, other.e);
    }
    // G1 and G2 share a field on symmetric pairings
    group = other.group;
    element_set(e, other.e);
    return *this;
}

Element::~Element()
{
    element_clear(e);
}

int Element::lengthInBytes() const
{
    return element_length_in_bytes(e);
}

int Element::lengthInBytesCompressed() const
{
    return element_length_in_bytes_compressed(e);
}

void Element::toBytes(uint8_t *data) const
{
    element_to_bytes(data, e);
}

void Element::toBytesCompressed(uint8_t *data) const
{
    element_to_bytes_compressed(data, e);
}

Choice Element::isIdentity() const
{
    if (group == GROUP_GT)
        return Choice::fromInt(element_is1(e));
    return Choice::fromInt(element_is0(e));
}

Choice Element::ctEquals(const Element &other) const
{
    int len = lengthInBytes();
    std::vector<uint8_t> a(len), b(len);
    toBytes(a.data());
    other.toBytes(b.data());
    Choice eq = ctEq(a.data(), b.data(), len);
    OPENSSL_cleanse(a.data(), len);
    OPENSSL_cleanse(b.data(), len);

    if (!isCurvePoint())
        return eq;

    // the point at infinity carries stale coordinates in PBC
    Choice infA = isIdentity();
    Choice infB = other.isIdentity();
    return (infA & infB) | (!infA & !infB & eq);
}

Element Element::conditionalSelect(const Element &a, const Element &b, Choice choice)
{
    int len = a.lengthInBytes();
    std::vector<uint8_t> ba(len), bb(len);
    a.toBytes(ba.data());
    b.toBytes(bb.data());
    ctSelect(ba.data(), ba.data(), bb.data(), len, choice);

    Element out(a);
    element_from_bytes(out.e, ba.data());

    if (out.isCurvePoint())
    {
        uint8_t infA = a.isIdentity().unwrapU8();
        uint8_t infB = b.isIdentity().unwrapU8();
        uint8_t inf;
        ctSelect(&inf, &infA, &infB, 1, choice);

        // raise to 0 or 1 instead of branching on the selected flag
        mpz_t keep;
        mpz_init_set_ui(keep, inf ^ 1);
        element_pow_mpz(out.e, out.e, keep);
        mpz_clear(keep);
    }

    OPENSSL_cleanse(ba.data(), len);
    OPENSSL_cleanse(bb.data(), len);
    return out;
}

Element Element::fromBytesCompressed(const Pairing &pairing, Group group, const uint8_t *data, Choice &valid)
{
    Element out(pairing, group);
    int len = out.lengthInBytesCompressed();

    // off-curve or non-residue x decodes to infinity
    element_from_bytes_compressed(out.e, const_cast<uint8_t *>(data));

    std::vector<uint8_t> check(len);
    out.toBytesCompressed(check.data());
    Choice canonical = ctEq(check.data(), data, len);

    Element t(pairing, group);
    element_pow_mpz(t.e, out.e, pairing.get()->r);

    valid = canonical & !out.isIdentity() & t.isIdentity();
    return out;
}

Element Element::fromBytes(const Pairing &pairing, Group group, const uint8_t *data, Choice &valid)
{
    Element out(pairing, group);
    int len = out.lengthInBytes();

    element_from_bytes(out.e, const_cast<uint8_t *>(data));

    std::vector<uint8_t> check(len);
    out.toBytes(check.data());
    Choice canonical = ctEq(check.data(), data, len);
    OPENSSL_cleanse(check.data(), len);

    if (group == GROUP_ZR)
    {
        valid = canonical;
        return out;
    }

    Element t(pairing, group);
    element_pow_mpz(t.e, out.e, pairing.get()->r);
    Choice inSubgroup = t.isIdentity();

    if (group == GROUP_GT)
        valid = canonical & inSubgroup;
    else
        valid = canonical & !out.isIdentity() & inSubgroup;
    return out;
}

} // namespace wnibe
