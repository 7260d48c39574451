#pragma once

namespace c4::sddp {

inline constexpr const char* kVersion = "1.0.0";

} // namespace c4::sddp
