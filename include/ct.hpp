#ifndef WNIBE_CT_HPP
#define WNIBE_CT_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace wnibe
{

/**
 * A secret boolean held as 0 or 1.
 *
 * Combine with & | ! only; reveal() is for values that are allowed to
 * become public (decode results the caller is about to branch on anyway).
 */
class Choice
{
private:
    uint8_t v;

public:
    Choice() : v(0) {}
    explicit Choice(uint8_t bit) : v(bit & 1) {}

    // nonzero -> 1, computed without a branch
    static Choice fromInt(int x);

    uint8_t unwrapU8() const { return v; }
    bool reveal() const { return v == 1; }

    Choice operator&(const Choice &o) const { return Choice(v & o.v); }
    Choice operator|(const Choice &o) const { return Choice(v | o.v); }
    Choice operator!() const { return Choice(v ^ 1); }
    Choice &operator&=(const Choice &o)
    {
        v &= o.v;
        return *this;
    }
};

// CRYPTO_memcmp
Choice ctEq(const uint8_t *a, const uint8_t *b, size_t len);

// out = choice ? b : a, out may alias a or b
void ctSelect(uint8_t *out, const uint8_t *a, const uint8_t *b, size_t len, Choice choice);

/**
 * A value that may or may not be valid.
 *
 * The value is always present in memory; validity is a Choice computed
 * alongside it, so building one does not branch on which part failed.
 * T must provide static T conditionalSelect(const T &, const T &, Choice).
 */
template <typename T>
class CtOption
{
private:
    T value;
    Choice is_some;

public:
    CtOption(const T &value, Choice is_some) : value(value), is_some(is_some) {}

    Choice isSome() const { return is_some; }
    Choice isNone() const { return !is_some; }

    const T &unwrap() const
    {
        if (!is_some.reveal())
            throw std::logic_error("CtOption::unwrap on an absent value");
        return value;
    }

    T unwrapOr(const T &def) const
    {
        return T::conditionalSelect(def, value, is_some);
    }
};

} // namespace wnibe

#endif
