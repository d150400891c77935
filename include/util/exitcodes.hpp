#pragma once

namespace exitc
{
inline constexpr int ok       = 0;
inline constexpr int bad_args = 2;
inline constexpr int io_error = 3;
inline constexpr int mismatch = 4;
inline constexpr int timeout  = 5;
}  // namespace exitc
