#ifndef WARDEN_VERSION_HPP
#define WARDEN_VERSION_HPP

#pragma once

namespace warden {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 2;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.2.0")
    inline constexpr const char* version_string = "0.2.0";

} // namespace warden

#endif // WARDEN_VERSION_HPP
