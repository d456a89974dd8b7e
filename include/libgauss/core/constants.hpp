#pragma once

namespace gauss {

template <typename T>
inline constexpr T PI = static_cast<T>(3.141592653589793238462643383279502884L);

} // namespace gauss
