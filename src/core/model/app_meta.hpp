#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#ifndef SEALTRAIL_APP_VERSION
#define SEALTRAIL_APP_VERSION "0.3.0"
#endif

#ifndef SEALTRAIL_BUILD_RELEASE
#define SEALTRAIL_BUILD_RELEASE "Chain Format 1"
#endif

namespace sealtrail {

inline constexpr std::string_view kAppDisplayName = "SealTrail compliance audit chain";
inline constexpr std::string_view kAppVersion = SEALTRAIL_APP_VERSION;
inline constexpr std::string_view kBuildRelease = SEALTRAIL_BUILD_RELEASE;

// previous_hash of block 1.
inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

inline constexpr std::uint32_t kChainFormatVersion = 1;
inline constexpr std::size_t kSecretKeyBytes = 32;

}  // namespace sealtrail
