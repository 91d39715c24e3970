#ifndef WEBFRONT_VERSION_HPP
#define WEBFRONT_VERSION_HPP

#pragma once

namespace webfront {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 3;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.3.0")
    inline constexpr const char* version_string = "0.3.0";

    /// Value sent in the `Server:` header of locally generated responses.
    inline constexpr const char* server_token = "webfront/0.3.0";

} // namespace webfront

#endif // WEBFRONT_VERSION_HPP
