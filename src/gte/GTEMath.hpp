#pragma once

#include <array>
#include "common/Types.hpp"

// ── GTE fixed-point math types ────────────────────────────────────────────────
//
// Matrix and vector elements are 1.3.12 fixed-point 16-bit values in the
// register file.  They are widened to s64 lanes before any arithmetic so
// that a full three-term dot product plus a translation term (at most ~46
// bits) never overflows on the host.  Accumulator range checks then happen
// on the exact value.
namespace gte {

struct Vector3 {
    s64 x = 0;
    s64 y = 0;
    s64 z = 0;

    [[nodiscard]] constexpr s64 operator[](int i) const noexcept {
        return i == 0 ? x : (i == 1 ? y : z);
    }

    [[nodiscard]] constexpr Vector3 operator+(const Vector3& o) const noexcept {
        return {x + o.x, y + o.y, z + o.z};
    }

    [[nodiscard]] constexpr Vector3 operator<<(int amount) const noexcept {
        return {x * (s64{1} << amount), y * (s64{1} << amount), z * (s64{1} << amount)};
    }

    // Component-wise product.
    [[nodiscard]] constexpr Vector3 scale(const Vector3& o) const noexcept {
        return {x * o.x, y * o.y, z * o.z};
    }
};

// Row-major 3x3 matrix: rows[r][c].
struct Matrix3 {
    std::array<std::array<s64, 3>, 3> rows{};

    [[nodiscard]] constexpr s64 at(int r, int c) const noexcept { return rows[r][c]; }

    [[nodiscard]] constexpr Vector3 operator*(const Vector3& v) const noexcept {
        return {
            rows[0][0] * v.x + rows[0][1] * v.y + rows[0][2] * v.z,
            rows[1][0] * v.x + rows[1][1] * v.y + rows[1][2] * v.z,
            rows[2][0] * v.x + rows[2][1] * v.y + rows[2][2] * v.z,
        };
    }
};

} // namespace gte
