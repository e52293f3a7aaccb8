#pragma once

/// @file search_filter.hpp
/// @brief Token search filters: construction, type-predicate rewriting and
/// evaluation of LDAP-style filter expressions (RFC 4515 subset).

#include "otpm/foundation/otp_result.hpp"
#include "otpm/token/token_store.hpp"
#include "otpm/token/token_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace otpm::token {

/// Predicate matching every token record regardless of type.
inline constexpr std::string_view kGenericTokenPredicate = "(objectClass=otpToken)";

/// Predicate matching only tokens of @p type.
[[nodiscard]] std::string typePredicate(TokenType type);

/// Replace the generic token predicate with the type-specific one when
/// @p type names a known type. Any other value, or none, leaves @p filter
/// unchanged. Nothing else in the filter is touched.
[[nodiscard]] std::string rewriteTypePredicate(std::string_view filter,
                                               const std::optional<std::string>& type);

/// Escape '*', '(', ')', '\\' and NUL in an assertion value.
[[nodiscard]] std::string escapeFilterValue(std::string_view value);

/// Build the generic (untyped) filter for a search request.
/// @param ownerReference Canonical owner reference, already normalized.
[[nodiscard]] std::string buildSearchFilter(const SearchRequest& request,
                                            const std::optional<std::string>& ownerReference);

/// Parsed filter expression.
///
/// Supports '&', '|', '!', equality, presence ("attr=*") and substring
/// assertions. Attribute names and values compare case-insensitively.
class FilterExpression {
public:
    [[nodiscard]] static foundation::OtpResult<FilterExpression> parse(std::string_view text);

    [[nodiscard]] bool matches(const AttributeMap& attributes) const;

    struct Node;

private:
    explicit FilterExpression(std::shared_ptr<const Node> root) : root_(std::move(root)) {}

    std::shared_ptr<const Node> root_;
};

}  // namespace otpm::token
