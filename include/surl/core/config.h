#ifndef SURL_CORE_CONFIG_H
#define SURL_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace surl::core::config {

inline constexpr std::size_t kMaxLabelLength = 63;
inline constexpr std::size_t kMinHostLabels = 2;
inline constexpr std::uint32_t kMaxPort = 65535;
inline constexpr const char kSchemeSeparator[] = "://";

}  // namespace surl::core::config

#endif  // SURL_CORE_CONFIG_H
