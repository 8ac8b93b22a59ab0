#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_host module

#include <cstdint>

namespace strata_host {

enum class HookResult : std::uint8_t;
struct RequestRec;
class RequestPipeline;
struct LocationScope;
struct VirtualHostScope;
struct HostConfig;
class HostConfigBuilder;
class Server;

} // namespace strata_host
