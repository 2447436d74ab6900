#pragma once

#include <cmath>
#include <glm/glm.hpp>

/**
 * @defgroup MathUtils Math / Geometry Utilities
 * @brief Tolerance comparison and guarded normalization for the fill ops.
 */
namespace un
{

    /**
     * @brief Per-component vec3 equality with an explicit tolerance.
     * @return True if |a[i] - b[i]| < tol for every component.
     * @ingroup MathUtils
     */
    inline bool equal(const glm::vec3& a, const glm::vec3& b, float tol)
    {
        return glm::all(glm::lessThan(glm::abs(a - b), glm::vec3(tol)));
    }

    /**
     * @brief Normalize a vector safely (avoids NaNs for tiny/invalid inputs).
     *
     * Behaves like `glm::normalize()` but returns (0,0,0) if the vector length
     * is near zero or non-finite.
     *
     * @param v   Input vector.
     * @param eps Threshold under which the vector is treated as zero.
     * @ingroup MathUtils
     */
    inline glm::vec3 safe_normalize(const glm::vec3& v, float eps = 1e-8f)
    {
        float len2 = glm::dot(v, v);
        if (len2 > eps * eps && std::isfinite(len2))
            return v / std::sqrt(len2);
        return glm::vec3(0.0f);
    }

    /**
     * @brief Normalize a vector safely with a fallback.
     *
     * If the vector length is at or below @p eps or non-finite, the provided
     * fallback vector is returned instead.
     *
     * @param v        Input vector.
     * @param fallback Vector to return if @p v is degenerate.
     * @param eps      Threshold under which the vector is treated as zero.
     * @ingroup MathUtils
     */
    inline glm::vec3 safe_normalize(const glm::vec3& v,
                                    const glm::vec3& fallback,
                                    float            eps = 1e-8f)
    {
        float len2 = glm::dot(v, v);
        if (len2 > eps * eps && std::isfinite(len2))
            return v / std::sqrt(len2);
        return fallback;
    }

} // namespace un
