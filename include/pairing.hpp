#ifndef WNIBE_PAIRING_HPP
#define WNIBE_PAIRING_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <pbc.h>

#include "ct.hpp"
#include "utils.hpp"

namespace wnibe
{

/**
 * @brief PBC type A parameters (512-bit base field, 160-bit group order).
 *
 * Used when no parameter file is given. Symmetric, embedding degree 2,
 * roughly 80-bit security; load larger parameters for long-lived keys.
 */
extern const char TYPE_A_PARAMS[];

enum Group
{
    GROUP_G1,
    GROUP_G2,
    GROUP_GT,
    GROUP_ZR
};

class Element;

/**
 * Owns the PBC pairing every element of the scheme lives in.
 *
 * Read-only once constructed, so one instance can serve any number of
 * threads. It must outlive every Element created from it.
 */
class Pairing
{
private:
    mutable pairing_t pairing;
    int lenG1; // compressed
    int lenG2; // compressed
    int lenGT;
    int lenZr;

    void init();

public:
    Pairing();
    Pairing(const char *param, size_t len);
    // PBC demo loader: parameter file in argv[1], stdin otherwise
    Pairing(int argc, char **argv);
    ~Pairing();

    Pairing(const Pairing &) = delete;
    Pairing &operator=(const Pairing &) = delete;

    static std::unique_ptr<Pairing> fromFile(const std::string &path);

    pairing_ptr get() const { return pairing; }
    bool isSymmetric() const;

    int getLenG1() const { return lenG1; }
    int getLenG2() const { return lenG2; }
    int getLenGT() const { return lenGT; }
    int getLenZr() const { return lenZr; }

    // copies the group order r into out (already initialised)
    void getOrder(mpz_t out) const;

    Element Random_Zr(Rng &rng) const;
    Element Random_G1(Rng &rng) const;
    Element Random_G2(Rng &rng) const;
    Element Random_GT(Rng &rng) const;
};

/**
 * RAII handle over a PBC element_t, bound to one group of one Pairing.
 *
 * Copies are deep.
 */
class Element
{
private:
    mutable element_t e;
    Group group;

public:
    // identity of the group (zero for Zr)
    Element(const Pairing &pairing, Group group);
    Element(const Element &other);
    Element &operator=(const Element &other);
    ~Element();

    element_ptr get() const { return e; }
    Group getGroup() const { return group; }
    bool isCurvePoint() const { return group == GROUP_G1 || group == GROUP_G2; }

    int lengthInBytes() const;
    int lengthInBytesCompressed() const;

    void toBytes(uint8_t *data) const;
    void toBytesCompressed(uint8_t *data) const;

    Choice isIdentity() const;
    Choice ctEquals(const Element &other) const;

    // choice ? b : a; a and b must share a group
    static Element conditionalSelect(const Element &a, const Element &b, Choice choice);

    // validity is returned, the element always ends up initialised
    static Element fromBytesCompressed(const Pairing &pairing, Group group, const uint8_t *data, Choice &valid);
    static Element fromBytes(const Pairing &pairing, Group group, const uint8_t *data, Choice &valid);
};

} // namespace wnibe

#endif
