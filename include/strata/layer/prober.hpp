#pragma once

/// @file prober.hpp
/// @brief Existence checks for layer candidates

#include "fwd.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace strata_layer {

// =============================================================================
// FileMetadata
// =============================================================================

/// Status of a probed entry, handed to the host so it need not stat again
struct FileMetadata {
    std::filesystem::file_type type = std::filesystem::file_type::none;
    std::uintmax_t size = 0;  ///< Zero for anything but regular files
    std::chrono::system_clock::time_point modified;
    std::filesystem::perms permissions = std::filesystem::perms::unknown;

    [[nodiscard]] bool is_regular() const noexcept {
        return type == std::filesystem::file_type::regular;
    }

    [[nodiscard]] bool is_directory() const noexcept {
        return type == std::filesystem::file_type::directory;
    }

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Get file type name
[[nodiscard]] const char* file_type_name(std::filesystem::file_type type) noexcept;

// =============================================================================
// FileProber
// =============================================================================

/// Answers "is there something at this path" for the resolver.
///
/// Implementations must not throw and must fold every failure (absent,
/// permission denied, I/O error) into std::nullopt. Probes are issued
/// concurrently from request workers, so `probe` must be thread-safe.
class FileProber {
public:
    virtual ~FileProber() = default;

    [[nodiscard]] virtual std::optional<FileMetadata> probe(const std::string& path) const = 0;
};

/// Probes the host filesystem, following symbolic links
class FilesystemProber final : public FileProber {
public:
    [[nodiscard]] std::optional<FileMetadata> probe(const std::string& path) const override;
};

} // namespace strata_layer
