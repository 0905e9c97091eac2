#pragma once

namespace toolrelay
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "0.3.0";

/// Protocol revision requested during the initialize handshake
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

} // namespace toolrelay
