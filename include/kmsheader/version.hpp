#ifndef KMSHEADER_VERSION_HPP
#define KMSHEADER_VERSION_HPP

// ============================================================================
// KMS Header - Version Header
// ============================================================================

namespace kmsheader {

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;

inline constexpr const char* VERSION_STRING = "0.1.0";

} // namespace kmsheader

#endif // KMSHEADER_VERSION_HPP
