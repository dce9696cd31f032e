#pragma once

namespace exitc
{
inline constexpr int ok         = 0;
inline constexpr int failure    = 1;
inline constexpr int bad_args   = 2;
inline constexpr int no_server  = 3;
inline constexpr int io_error   = 4;
inline constexpr int incomplete = 5;  // decode finished with missing indices
}  // namespace exitc
