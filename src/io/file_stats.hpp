#pragma once
#include <filesystem>
#include <cstdint>
#include <string>

#include "util/text.hpp"

namespace tabprof {

inline std::uintmax_t file_size_bytes(const std::filesystem::path& p) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    return ec ? 0u : static_cast<std::uintmax_t>(sz);
}

// Lower-case extension without the dot; "csv" when the path has none.
inline std::string file_type_of(const std::filesystem::path& p) {
    std::string ext = to_lower(p.extension().string());
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    return ext.empty() ? "csv" : ext;
}

}
