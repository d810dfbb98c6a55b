#pragma once

#include <initializer_list>

#include <cmath>
#include <algorithm>

namespace lightbox {

using Float = float;

constexpr Float Pi = Float(3.14159265358979323846);
constexpr Float TwoPi = 2 * Pi;

/// Vectors shorter than this have no usable direction.
constexpr Float DegenerateLength = Float(1e-6);

template<typename Float, int N>
struct Vector {
    static constexpr int Dimensionality = N;

    Float el[N];

    Vector() {
        for (int i = 0; i < N; i++) {
            el[i] = 0;
        }
    }

    explicit Vector(Float v) {
        for (int i = 0; i < N; i++) {
            el[i] = v;
        }
    }

    Vector(std::initializer_list<Float> l) {
        auto it = l.begin();
        for (int i = 0; i < N; i++) {
            el[i] = it != l.end() ? *it++ : Float(0);
        }
    }

    Float &operator[](int i) {
        return el[i];
    }

    const Float &operator[](int i) const {
        return el[i];
    }

#define LIGHTBOX_MAKE_ACCESSOR(name, index) \
Float &name() { \
    static_assert(index < N, "out of bounds"); \
    return this->el[index]; \
} \
const Float &name() const { \
    static_assert(index < N, "out of bounds"); \
    return this->el[index]; \
}

    LIGHTBOX_MAKE_ACCESSOR(x, 0)

    LIGHTBOX_MAKE_ACCESSOR(y, 1)

#undef LIGHTBOX_MAKE_ACCESSOR

    Float lengthSquared() const {
        return dot(*this);
    }

    Float length() const {
        return std::sqrt(lengthSquared());
    }

    Float dot(const Vector &other) const {
        Float sum(0);
        for (int i = 0; i < N; i++) {
            sum += el[i] * other[i];
        }
        return sum;
    }

    /// Unit vector with the same direction, or the zero vector if the direction is undefined.
    Vector normalized() const {
        const Float len = length();
        if (len < DegenerateLength) {
            return Vector();
        }
        return *this / len;
    }

    Vector &operator*=(const Float &other) {
        for (int i = 0; i < N; i++) {
            el[i] *= other;
        }
        return *this;
    }

    Vector &operator/=(const Float &other) {
        return (*this *= Float(1) / other);
    }

    Vector &operator+=(const Vector &other) {
        for (int i = 0; i < N; i++) {
            el[i] += other[i];
        }
        return *this;
    }

    Vector &operator-=(const Vector &other) {
        for (int i = 0; i < N; i++) {
            el[i] -= other[i];
        }
        return *this;
    }

    Vector operator*(const Float &other) const {
        Vector copy = *this;
        copy *= other;
        return copy;
    }

    Vector operator/(const Float &other) const {
        Vector copy = *this;
        copy /= other;
        return copy;
    }

    Vector operator+(const Vector &other) const {
        Vector copy = *this;
        copy += other;
        return copy;
    }

    Vector operator-(const Vector &other) const {
        Vector copy = *this;
        copy -= other;
        return copy;
    }

    Vector operator-() const {
        Vector copy;
        for (int i = 0; i < N; i++) {
            copy[i] = -el[i];
        }
        return copy;
    }

    friend Vector operator*(const Float &lhs, Vector rhs) {
        return rhs *= lhs;
    }

    bool operator==(const Vector &other) const {
        for (int i = 0; i < N; i++) {
            if (el[i] != other[i]) {
                return false;
            }
        }
        return true;
    }

    bool operator!=(const Vector &other) const {
        return !(*this == other);
    }
};

using Vec2f = Vector<Float, 2>;

inline Vec2f normalize(const Vec2f &v) {
    return v.normalized();
}

/// Counter-rotates in a y-up frame, which reads as clockwise on a y-down screen.
inline Vec2f rotate(const Vec2f &v, Float angle) {
    const Float c = std::cos(angle);
    const Float s = std::sin(angle);
    return {c * v.x() - s * v.y(), s * v.x() + c * v.y()};
}

/// Rotates by +90 degrees.
inline Vec2f perpendicular(const Vec2f &v) {
    return {-v.y(), v.x()};
}

inline Vec2f direction(Float angle) {
    return {std::cos(angle), std::sin(angle)};
}

inline Float angleOf(const Vec2f &v) {
    return std::atan2(v.y(), v.x());
}

/// Maps any angle into [0, 2pi).
inline Float wrapAngle(Float angle) {
    Float wrapped = std::fmod(angle, TwoPi);
    if (wrapped < 0) {
        wrapped += TwoPi;
    }
    // fmod of a tiny negative value can round up to exactly 2pi
    if (wrapped >= TwoPi) {
        wrapped = 0;
    }
    return wrapped;
}

inline Float degrees(Float radians) {
    return radians * Float(180) / Pi;
}

inline Float radians(Float degrees) {
    return degrees * Pi / Float(180);
}

}
