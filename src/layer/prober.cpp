/// @file prober.cpp
/// @brief Filesystem prober implementation

#include <strata/layer/prober.hpp>

#include <system_error>

namespace strata_layer {

const char* file_type_name(std::filesystem::file_type type) noexcept {
    using std::filesystem::file_type;
    switch (type) {
        case file_type::regular: return "regular";
        case file_type::directory: return "directory";
        case file_type::symlink: return "symlink";
        case file_type::block: return "block";
        case file_type::character: return "character";
        case file_type::fifo: return "fifo";
        case file_type::socket: return "socket";
        case file_type::not_found: return "not_found";
        case file_type::none: return "none";
        default: return "unknown";
    }
}

nlohmann::json FileMetadata::to_json() const {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        modified.time_since_epoch()).count();
    return nlohmann::json{
        {"type", file_type_name(type)},
        {"size", size},
        {"modified", seconds},
        {"permissions", static_cast<unsigned>(permissions) & 07777u}
    };
}

std::optional<FileMetadata> FilesystemProber::probe(const std::string& path) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return std::nullopt;
    }

    FileMetadata meta;
    meta.type = status.type();
    meta.permissions = status.permissions();

    if (meta.is_regular()) {
        auto size = fs::file_size(path, ec);
        if (ec) {
            return std::nullopt;
        }
        meta.size = size;
    }

    auto written = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    meta.modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        fs::file_time_type::clock::to_sys(written));

    return meta;
}

} // namespace strata_layer
