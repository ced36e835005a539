#pragma once

namespace thermolog {

/// Version information
struct Version {
    static constexpr int MAJOR = THERMOLOG_VERSION_MAJOR;
    static constexpr int MINOR = THERMOLOG_VERSION_MINOR;
    static constexpr int PATCH = THERMOLOG_VERSION_PATCH;
    
    static const char* get_version_string();
};

} // namespace thermolog
