#include <algorithm>
#include <stdexcept>
#include <string>

#include <gmp.h>
#include <gtest/gtest.h>

#include "test_common.hpp"

using namespace wnibe;

class SerializationTest : public ::testing::Test
{
protected:
    static Pairing *pairing;
    OsRng rng;

    static void SetUpTestCase() { pairing = new Pairing(); }
    static void TearDownTestCase()
    {
        delete pairing;
        pairing = NULL;
    }

    int lenG1() const { return pairing->getLenG1(); }
    int lenG2() const { return pairing->getLenG2(); }
    int lenGT() const { return pairing->getLenGT(); }

    // compressed encoding of the smallest x < q where x^3 + x is not a square mod q
    void offCurveEncoding(std::vector<uint8_t> &out, uint8_t sign) const
    {
        std::string params(TYPE_A_PARAMS);
        size_t at = params.find("\nq ") + 3;
        std::string qstr = params.substr(at, params.find('\n', at) - at);

        mpz_t q, rhs;
        mpz_init_set_str(q, qstr.c_str(), 10);
        mpz_init(rhs);

        unsigned long x = 1;
        for (; x < 1000; x++)
        {
            mpz_set_ui(rhs, x * x + 1);
            mpz_mul_ui(rhs, rhs, x);
            if (mpz_legendre(rhs, q) == -1)
                break;
        }
        int legendre = mpz_legendre(rhs, q);
        mpz_clear(q);
        mpz_clear(rhs);
        ASSERT_EQ(-1, legendre);

        // big-endian x, then the sign byte
        out.assign(lenG1(), 0);
        out[lenG1() - 3] = static_cast<uint8_t>(x >> 8);
        out[lenG1() - 2] = static_cast<uint8_t>(x & 0xff);
        out[lenG1() - 1] = sign;
    }
};

Pairing *SerializationTest::pairing = NULL;

TEST_F(SerializationTest, TypeASizes)
{
    EXPECT_EQ(65, lenG1());
    EXPECT_EQ(65, lenG2());
    EXPECT_EQ(128, lenGT());

    EXPECT_EQ(1040u, Parameters::byteSize(*pairing));
    EXPECT_EQ(1300u, PublicKey::byteSize(*pairing));
    EXPECT_EQ(65u, SecretKey::byteSize(*pairing));
    EXPECT_EQ(130u, UserSecretKey::byteSize(*pairing));
    EXPECT_EQ(258u, CipherText::byteSize(*pairing));
    EXPECT_EQ(128u, Message::byteSize(*pairing));
}

TEST_F(SerializationTest, EncodedLengthsMatch)
{
    WNIBE ibe(*pairing);
    std::pair<PublicKey, SecretKey> keys = ibe.Setup(rng);
    Identity kid = Identity::deriveStr(*pairing, TEST_ID);
    UserSecretKey usk = ibe.Extract(keys.first, keys.second, kid, rng);
    Message m = Message::generate(*pairing, rng);
    CipherText c = ibe.Encrypt(keys.first, kid, m, rng);

    EXPECT_EQ(PublicKey::byteSize(*pairing), keys.first.toBytes().size());
    EXPECT_EQ(Parameters::byteSize(*pairing), keys.first.getU().toBytes().size());
    EXPECT_EQ(SecretKey::byteSize(*pairing), keys.second.toBytes().size());
    EXPECT_EQ(UserSecretKey::byteSize(*pairing), usk.toBytes().size());
    EXPECT_EQ(CipherText::byteSize(*pairing), c.toBytes().size());
    EXPECT_EQ(Message::byteSize(*pairing), m.toBytes().size());
}

TEST_F(SerializationTest, EqSerializeDeserialize)
{
    WNIBE ibe(*pairing);
    std::pair<PublicKey, SecretKey> keys = ibe.Setup(rng);
    Identity kid = Identity::deriveStr(*pairing, TEST_ID);
    UserSecretKey usk = ibe.Extract(keys.first, keys.second, kid, rng);
    Message m = Message::generate(*pairing, rng);
    CipherText c = ibe.Encrypt(keys.first, kid, m, rng);

    CtOption<Message> m2 = Message::fromBytes(*pairing, m.toBytes());
    ASSERT_TRUE(m2.isSome().reveal());
    EXPECT_TRUE(m == m2.unwrap());

    CtOption<PublicKey> pk2 = PublicKey::fromBytes(*pairing, keys.first.toBytes());
    ASSERT_TRUE(pk2.isSome().reveal());
    EXPECT_TRUE(keys.first == pk2.unwrap());

    CtOption<SecretKey> sk2 = SecretKey::fromBytes(*pairing, keys.second.toBytes());
    ASSERT_TRUE(sk2.isSome().reveal());
    EXPECT_TRUE(keys.second == sk2.unwrap());

    CtOption<UserSecretKey> usk2 = UserSecretKey::fromBytes(*pairing, usk.toBytes());
    ASSERT_TRUE(usk2.isSome().reveal());
    EXPECT_TRUE(usk == usk2.unwrap());

    CtOption<CipherText> c2 = CipherText::fromBytes(*pairing, c.toBytes());
    ASSERT_TRUE(c2.isSome().reveal());
    EXPECT_TRUE(c == c2.unwrap());

    std::vector<uint8_t> ubytes = keys.first.getU().toBytes();
    CtOption<Parameters> u2 = Parameters::fromBytes(*pairing, ubytes.data(), ubytes.size());
    ASSERT_TRUE(u2.isSome().reveal());
    EXPECT_TRUE(keys.first.getU() == u2.unwrap());
}

TEST_F(SerializationTest, WrongLengthIsAbsent)
{
    WNIBE ibe(*pairing);
    std::pair<PublicKey, SecretKey> keys = ibe.Setup(rng);

    std::vector<uint8_t> pk = keys.first.toBytes();
    pk.push_back(0);
    EXPECT_TRUE(PublicKey::fromBytes(*pairing, pk).isNone().reveal());
    pk.resize(pk.size() - 2);
    EXPECT_TRUE(PublicKey::fromBytes(*pairing, pk).isNone().reveal());

    std::vector<uint8_t> empty;
    EXPECT_TRUE(SecretKey::fromBytes(*pairing, empty).isNone().reveal());
    EXPECT_TRUE(UserSecretKey::fromBytes(*pairing, empty).isNone().reveal());
    EXPECT_TRUE(CipherText::fromBytes(*pairing, empty).isNone().reveal());
    EXPECT_TRUE(Message::fromBytes(*pairing, empty).isNone().reveal());
}

TEST_F(SerializationTest, ZeroBuffersAreAbsent)
{
    std::vector<uint8_t> pk(PublicKey::byteSize(*pairing), 0);
    std::vector<uint8_t> sk(SecretKey::byteSize(*pairing), 0);
    std::vector<uint8_t> usk(UserSecretKey::byteSize(*pairing), 0);
    std::vector<uint8_t> c(CipherText::byteSize(*pairing), 0);
    std::vector<uint8_t> m(Message::byteSize(*pairing), 0);
    std::vector<uint8_t> u(Parameters::byteSize(*pairing), 0);

    EXPECT_TRUE(PublicKey::fromBytes(*pairing, pk).isNone().reveal());
    EXPECT_TRUE(SecretKey::fromBytes(*pairing, sk).isNone().reveal());
    EXPECT_TRUE(UserSecretKey::fromBytes(*pairing, usk).isNone().reveal());
    EXPECT_TRUE(CipherText::fromBytes(*pairing, c).isNone().reveal());
    EXPECT_TRUE(Message::fromBytes(*pairing, m).isNone().reveal());
    EXPECT_TRUE(Parameters::fromBytes(*pairing, u.data(), u.size()).isNone().reveal());
}

TEST_F(SerializationTest, CorruptedPublicKeyFields)
{
    WNIBE ibe(*pairing);
    std::pair<PublicKey, SecretKey> keys = ibe.Setup(rng);
    const std::vector<uint8_t> good = keys.first.toBytes();

    // start of every compressed point: g, g1, g2, uprime, u[0..CHUNKS)
    std::vector<size_t> offsets;
    std::vector<size_t> lengths;
    offsets.push_back(0);
    lengths.push_back(lenG1());
    offsets.push_back(lenG1());
    lengths.push_back(lenG1());
    size_t at = 2 * lenG1();
    for (int i = 0; i < 2 + CHUNKS; i++)
    {
        offsets.push_back(at);
        lengths.push_back(lenG2());
        at += lenG2();
    }
    ASSERT_EQ(good.size(), at);

    for (size_t f = 0; f < offsets.size(); f++)
    {
        // x coordinate beyond the field modulus
        std::vector<uint8_t> bad = good;
        for (size_t i = 0; i + 1 < lengths[f]; i++)
            bad[offsets[f] + i] = 0xff;
        EXPECT_TRUE(PublicKey::fromBytes(*pairing, bad).isNone().reveal()) << "field " << f;

        // sign byte out of range
        bad = good;
        bad[offsets[f] + lengths[f] - 1] = 0x02;
        EXPECT_TRUE(PublicKey::fromBytes(*pairing, bad).isNone().reveal()) << "field " << f;
    }
}

TEST_F(SerializationTest, OffCurvePointIsAbsent)
{
    ASSERT_EQ(lenG1(), lenG2());
    WNIBE ibe(*pairing);
    std::pair<PublicKey, SecretKey> keys = ibe.Setup(rng);
    Identity kid = Identity::deriveStr(*pairing, TEST_ID);
    Message m = Message::generate(*pairing, rng);
    const std::vector<uint8_t> goodPk = keys.first.toBytes();
    const std::vector<uint8_t> goodC = ibe.Encrypt(keys.first, kid, m, rng).toBytes();

    for (uint8_t sign = 0; sign < 2; sign++)
    {
        std::vector<uint8_t> point;
        ASSERT_NO_FATAL_FAILURE(offCurveEncoding(point, sign));

        Choice valid(1);
        Element::fromBytesCompressed(*pairing, GROUP_G1, point.data(), valid);
        EXPECT_FALSE(valid.reveal());

        // u[3] of the public key
        std::vector<uint8_t> pk = goodPk;
        std::copy(point.begin(), point.end(), pk.begin() + 2 * lenG1() + 5 * lenG2());
        EXPECT_TRUE(PublicKey::fromBytes(*pairing, pk).isNone().reveal());

        // c2 of the ciphertext
        std::vector<uint8_t> c = goodC;
        std::copy(point.begin(), point.end(), c.begin() + lenGT());
        EXPECT_TRUE(CipherText::fromBytes(*pairing, c).isNone().reveal());
    }
}

TEST_F(SerializationTest, ParametersRejectMalformedVectors)
{
    std::vector<Element> none;
    EXPECT_THROW(Parameters p(none), std::runtime_error);

    std::vector<Element> tooFew(CHUNKS - 1, Element(*pairing, GROUP_G2));
    EXPECT_THROW(Parameters p(tooFew), std::runtime_error);

    std::vector<Element> tooMany(CHUNKS + 1, Element(*pairing, GROUP_G2));
    EXPECT_THROW(Parameters p(tooMany), std::runtime_error);

    std::vector<Element> scalars(CHUNKS, Element(*pairing, GROUP_ZR));
    EXPECT_THROW(Parameters p(scalars), std::runtime_error);

    // same field as G2 on type A, still rejected
    std::vector<Element> g1Points(CHUNKS, pairing->Random_G1(rng));
    EXPECT_THROW(Parameters p(g1Points), std::runtime_error);

    std::vector<Element> good(CHUNKS, pairing->Random_G2(rng));
    EXPECT_NO_THROW(Parameters p(good));
}

TEST_F(SerializationTest, SmallOrderPointIsAbsent)
{
    // x = 0 gives the 2-torsion point (0, 0) on y^2 = x^3 + x
    std::vector<uint8_t> sk(SecretKey::byteSize(*pairing), 0);
    CtOption<SecretKey> decoded = SecretKey::fromBytes(*pairing, sk);
    EXPECT_TRUE(decoded.isNone().reveal());
}

TEST_F(SerializationTest, CorruptedCipherText)
{
    WNIBE ibe(*pairing);
    std::pair<PublicKey, SecretKey> keys = ibe.Setup(rng);
    Identity kid = Identity::deriveStr(*pairing, TEST_ID);
    Message m = Message::generate(*pairing, rng);
    const std::vector<uint8_t> good = ibe.Encrypt(keys.first, kid, m, rng).toBytes();

    // c1 = 2 + 0i: canonical Fq2 element, not of order r
    std::vector<uint8_t> bad = good;
    for (int i = 0; i < lenGT(); i++)
        bad[i] = 0;
    bad[lenGT() / 2 - 1] = 2;
    EXPECT_TRUE(CipherText::fromBytes(*pairing, bad).isNone().reveal());

    // c1 coordinates >= q
    bad = good;
    for (int i = 0; i < lenGT(); i++)
        bad[i] = 0xff;
    EXPECT_TRUE(CipherText::fromBytes(*pairing, bad).isNone().reveal());

    // c2 sign byte
    bad = good;
    bad[lenGT() + lenG1() - 1] = 0x07;
    EXPECT_TRUE(CipherText::fromBytes(*pairing, bad).isNone().reveal());

    // c3 sign byte
    bad = good;
    bad[bad.size() - 1] = 0x07;
    EXPECT_TRUE(CipherText::fromBytes(*pairing, bad).isNone().reveal());
}

TEST_F(SerializationTest, CorruptedUserSecretKey)
{
    WNIBE ibe(*pairing);
    std::pair<PublicKey, SecretKey> keys = ibe.Setup(rng);
    Identity kid = Identity::deriveStr(*pairing, TEST_ID);
    const std::vector<uint8_t> good = ibe.Extract(keys.first, keys.second, kid, rng).toBytes();

    std::vector<uint8_t> bad = good;
    bad[lenG2() - 1] = 0x03;
    EXPECT_TRUE(UserSecretKey::fromBytes(*pairing, bad).isNone().reveal());

    bad = good;
    for (int i = 0; i < lenG1() - 1; i++)
        bad[lenG2() + i] = 0xff;
    EXPECT_TRUE(UserSecretKey::fromBytes(*pairing, bad).isNone().reveal());
}

TEST_F(SerializationTest, AbsentValue)
{
    std::vector<uint8_t> zero(Message::byteSize(*pairing), 0);
    CtOption<Message> decoded = Message::fromBytes(*pairing, zero);
    ASSERT_TRUE(decoded.isNone().reveal());

    EXPECT_THROW(decoded.unwrap(), std::logic_error);

    Message fallback = Message::generate(*pairing, rng);
    EXPECT_TRUE(decoded.unwrapOr(fallback) == fallback);
}

TEST_F(SerializationTest, PresentValueIgnoresDefault)
{
    Message m = Message::generate(*pairing, rng);
    Message other = Message::generate(*pairing, rng);
    CtOption<Message> decoded = Message::fromBytes(*pairing, m.toBytes());
    ASSERT_TRUE(decoded.isSome().reveal());
    EXPECT_TRUE(decoded.unwrapOr(other) == m);
    EXPECT_NO_THROW(decoded.unwrap());
}

TEST_F(SerializationTest, ConditionalSelectParameters)
{
    WNIBE ibe(*pairing);
    Parameters a = ibe.Setup(rng).first.getU();
    Parameters b = ibe.Setup(rng).first.getU();
    ASSERT_TRUE(a != b);

    EXPECT_TRUE(Parameters::conditionalSelect(a, b, Choice(0)) == a);
    EXPECT_TRUE(Parameters::conditionalSelect(a, b, Choice(1)) == b);

    // identity points survive selection
    Parameters zero(*pairing);
    EXPECT_TRUE(Parameters::conditionalSelect(a, zero, Choice(1)) == zero);
    EXPECT_TRUE(Parameters::conditionalSelect(zero, a, Choice(0)) == zero);
}

TEST_F(SerializationTest, ConditionalSelectKeys)
{
    WNIBE ibe(*pairing);
    std::pair<PublicKey, SecretKey> k1 = ibe.Setup(rng);
    std::pair<PublicKey, SecretKey> k2 = ibe.Setup(rng);

    EXPECT_TRUE(PublicKey::conditionalSelect(k1.first, k2.first, Choice(0)) == k1.first);
    EXPECT_TRUE(PublicKey::conditionalSelect(k1.first, k2.first, Choice(1)) == k2.first);
    EXPECT_TRUE(SecretKey::conditionalSelect(k1.second, k2.second, Choice(1)) == k2.second);
    EXPECT_TRUE(k1.second != k2.second);
}
