/// @file token_store.cpp
/// @brief DirectoryLayout reference helpers.

#include "otpm/token/token_store.hpp"

namespace otpm::token {

std::string DirectoryLayout::userReference(std::string_view uid) const {
    return "uid=" + std::string(uid) + "," + userContainer + "," + baseDn;
}

std::string DirectoryLayout::tokenReference(std::string_view id) const {
    return "tokenId=" + std::string(id) + "," + tokenContainer + "," + baseDn;
}

std::optional<std::string> DirectoryLayout::primaryKey(std::string_view reference) {
    auto eq = reference.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return std::nullopt;
    }
    auto comma = reference.find(',', eq);
    auto value = reference.substr(eq + 1, comma == std::string_view::npos
                                              ? std::string_view::npos
                                              : comma - eq - 1);
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace otpm::token
