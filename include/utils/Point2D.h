// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef UTILS_POINT2D_H
#define UTILS_POINT2D_H

#include <cmath>

namespace stretch
{

/*
Double-precision 2D points (and vectors) are used for the stretch geometry, in millimeters.
*/
class Point2D
{
public:
    double x_{}, y_{};

    Point2D()
    {
    }

    Point2D(double x, double y)
        : x_(x)
        , y_(y)
    {
    }

    Point2D& operator+=(const Point2D& p)
    {
        x_ += p.x_;
        y_ += p.y_;
        return *this;
    }
    Point2D& operator-=(const Point2D& p)
    {
        x_ -= p.x_;
        y_ -= p.y_;
        return *this;
    }
    Point2D& operator*=(const double f)
    {
        x_ *= f;
        y_ *= f;
        return *this;
    }

    bool operator==(const Point2D& p) const
    {
        return x_ == p.x_ && y_ == p.y_;
    }

    Point2D operator+(const Point2D& other) const
    {
        return Point2D(x_ + other.x_, y_ + other.y_);
    }

    Point2D operator-(const Point2D& other) const
    {
        return Point2D(x_ - other.x_, y_ - other.y_);
    }

    Point2D operator-() const
    {
        return Point2D(-x_, -y_);
    }

    Point2D operator*(const double factor) const
    {
        return Point2D(x_ * factor, y_ * factor);
    }

    Point2D operator/(const double divisor) const
    {
        return Point2D(x_ / divisor, y_ / divisor);
    }

    //! Dot product.
    double operator*(const Point2D& other) const
    {
        return x_ * other.x_ + y_ * other.y_;
    }

    double vSize2() const
    {
        return x_ * x_ + y_ * y_;
    }

    double vSize() const
    {
        return std::sqrt(vSize2());
    }

    /*!
     * Unit vector in the same direction, or the zero vector if this is the zero vector.
     */
    Point2D normalized() const
    {
        const double size = vSize();
        if (size == 0.0)
        {
            return Point2D();
        }
        return *this / size;
    }

    /*!
     * This vector turned 90 degrees clockwise.
     */
    Point2D turnRight() const
    {
        return Point2D(y_, -x_);
    }
};

inline Point2D operator*(const double factor, const Point2D& p)
{
    return p * factor;
}

} // namespace stretch

#endif // UTILS_POINT2D_H
