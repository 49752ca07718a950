// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef RATIO_H
#define RATIO_H

namespace stretch
{

/*
 * \brief Represents a ratio between two numbers.
 *
 * This is a facade. It behaves like a double.
 */
class Ratio
{
public:
    /*
     * \brief Default constructor setting the ratio to 1.
     */
    constexpr Ratio()
        : value(1.0){};

    /*
     * \brief Casts a double to a Ratio instance.
     */
    constexpr Ratio(double value)
        : value(value){};

    /*!
     * Create the Ratio with a numerator and a divisor from arbitrary types
     * \tparam E1 required to be castable to a double
     * \tparam E2 required to be castable to a double
     * \param numerator the numerator of the ratio
     * \param divisor the divisor of the ratio
     */
    template<typename E1, typename E2>
    constexpr Ratio(const E1& numerator, const E2& divisor)
        : value(static_cast<double>(numerator) / static_cast<double>(divisor)){};

    /*
     * \brief Casts the Ratio instance to a double.
     */
    constexpr operator double() const
    {
        return value;
    }

    /*
     * Some operators for arithmetic on ratios.
     */
    constexpr Ratio operator*(const Ratio& other) const
    {
        return Ratio(value * other.value);
    }
    template<typename E>
    constexpr Ratio operator*(const E& other) const
    {
        return Ratio(value * other);
    }
    constexpr Ratio operator/(const Ratio& other) const
    {
        return Ratio(value / other.value);
    }
    template<typename E>
    constexpr Ratio operator/(const E& other) const
    {
        return Ratio(value / other);
    }

    double value = 0.0;
};

constexpr Ratio operator"" _r(const long double ratio)
{
    return Ratio(ratio);
}

} // namespace stretch

#endif // RATIO_H
