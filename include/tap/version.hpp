#ifndef TAP_VERSION_HPP
#define TAP_VERSION_HPP

#pragma once

namespace tap {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 2;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.2.0")
    inline constexpr const char* version_string = "0.2.0";

} // namespace tap

#endif // TAP_VERSION_HPP
