#pragma once

#include <nlohmann/json.hpp>

namespace EvoScope {

/**
 * Plain 2D vector used for layout coordinates and curve control points.
 */
template <typename T>
struct Vector2 {
    T x{};
    T y{};

    bool operator==(const Vector2& other) const = default;
};

using Vector2d = Vector2<double>;

template <typename T>
void to_json(nlohmann::json& j, const Vector2<T>& v)
{
    j = nlohmann::json{ { "x", v.x }, { "y", v.y } };
}

} // namespace EvoScope
