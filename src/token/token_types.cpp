/// @file token_types.cpp
/// @brief Parsing helpers for token enumerations.

#include "otpm/token/token_types.hpp"

#include "detail/text_utils.hpp"

#include <algorithm>

namespace otpm::token {

std::optional<TokenType> parseTokenType(std::string_view name) {
    auto lower = detail::toLower(name);
    for (auto type : kTokenTypes) {
        if (lower == tokenTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<HashAlgorithm> parseAlgorithm(std::string_view name) {
    auto lower = detail::toLower(name);
    for (auto algorithm : {HashAlgorithm::Sha1, HashAlgorithm::Sha256,
                           HashAlgorithm::Sha384, HashAlgorithm::Sha512}) {
        if (lower == algorithmName(algorithm)) {
            return algorithm;
        }
    }
    return std::nullopt;
}

bool isInfoField(std::string_view name) {
    return std::find(kInfoFieldNames.begin(), kInfoFieldNames.end(), name) !=
           kInfoFieldNames.end();
}

}  // namespace otpm::token
