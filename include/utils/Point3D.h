// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef POINT3D_H
#define POINT3D_H

#include "utils/Point2D.h"

#include <cmath>

namespace stretch
{

/*
Double-precision 3D points are used for the machine location, in millimeters.
*/
class Point3D
{
public:
    double x_{}, y_{}, z_{};

    Point3D()
    {
    }

    Point3D(double x, double y, double z)
        : x_(x)
        , y_(y)
        , z_(z)
    {
    }

    bool operator==(const Point3D& p) const
    {
        return x_ == p.x_ && y_ == p.y_ && z_ == p.z_;
    }

    Point3D operator+(const Point3D& other) const
    {
        return Point3D(x_ + other.x_, y_ + other.y_, z_ + other.z_);
    }

    Point3D operator-(const Point3D& other) const
    {
        return Point3D(x_ - other.x_, y_ - other.y_, z_ - other.z_);
    }

    double vSize2() const
    {
        return x_ * x_ + y_ * y_ + z_ * z_;
    }

    double vSize() const
    {
        return std::sqrt(vSize2());
    }

    /*!
     * The location projected on the build plate.
     */
    Point2D xy() const
    {
        return Point2D(x_, y_);
    }
};

} // namespace stretch
#endif // POINT3D_H
