/// @file path_joiner.cpp
/// @brief Candidate path construction

#include <strata/layer/path_joiner.hpp>

#include <filesystem>

namespace strata_layer {

std::string canonicalize(std::string_view path) {
    if (path.empty()) {
        return {};
    }

    std::string normal = std::filesystem::path(path).lexically_normal().generic_string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

bool is_absolute_layer(std::string_view layer_dir) {
    return !layer_dir.empty() && layer_dir.front() == '/';
}

std::string join_layer_path(std::string_view layer_dir,
                            std::string_view document_root,
                            std::string_view request_path) {
    std::string joined;
    joined.reserve(document_root.size() + layer_dir.size() + request_path.size() + 2);

    if (!is_absolute_layer(layer_dir)) {
        joined.append(document_root);
        joined.push_back('/');
    }
    joined.append(layer_dir);
    joined.push_back('/');
    joined.append(request_path);

    return canonicalize(joined);
}

} // namespace strata_layer
