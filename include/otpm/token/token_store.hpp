#pragma once

/// @file token_store.hpp
/// @brief Directory collaborator interfaces: token record storage and user
/// identity resolution.
///
/// The token manager never persists anything itself; it hands flat attribute
/// maps to an ITokenStore and resolves user identifiers through an
/// IIdentityResolver. Any compare-and-set discipline needed for
/// read-validate-write sequences on one token belongs to the store.

#include "otpm/foundation/otp_result.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otpm::token {

/// Multi-valued attribute map, the storage-boundary representation.
using AttributeMap = std::map<std::string, std::vector<std::string>>;

/// User entry attribute holding the principal name used as URI issuer.
inline constexpr std::string_view kPrincipalAttribute = "principalName";

/// Where users and tokens live in the directory tree.
struct DirectoryLayout {
    std::string baseDn = "dc=example,dc=com";
    std::string userContainer = "cn=users,cn=accounts";
    std::string tokenContainer = "cn=otp";

    /// Canonical reference of a user ("uid=alice,cn=users,...").
    [[nodiscard]] std::string userReference(std::string_view uid) const;

    /// Canonical reference of a token ("tokenId=abc,cn=otp,...").
    [[nodiscard]] std::string tokenReference(std::string_view id) const;

    /// Value of the leading RDN of @p reference, or nullopt if it has none.
    [[nodiscard]] static std::optional<std::string> primaryKey(std::string_view reference);
};

/// One page of search results.
struct SearchPage {
    std::vector<AttributeMap> entries;
    bool truncated = false;
};

/// Abstract token record store.
///
/// Implementations must be thread-safe when shared across threads.
class ITokenStore {
public:
    virtual ~ITokenStore() = default;

    /// Persist a new record tagged with @p objectClasses. Returns its id.
    virtual foundation::OtpResult<std::string> createRecord(
        const std::vector<std::string>& objectClasses, const AttributeMap& attributes) = 0;

    /// Read a full record, TokenNotFound when absent.
    [[nodiscard]] virtual foundation::OtpResult<AttributeMap> readRecord(
        std::string_view id) const = 0;

    /// Replace the listed attributes. An empty value list removes the attribute.
    virtual foundation::OtpResult<void> updateRecord(std::string_view id,
                                                     const AttributeMap& changes) = 0;

    virtual foundation::OtpResult<void> deleteRecord(std::string_view id) = 0;

    /// Evaluate an LDAP-style filter over token records. sizeLimit 0 means
    /// unlimited.
    [[nodiscard]] virtual foundation::OtpResult<SearchPage> search(
        std::string_view filter, std::size_t sizeLimit) const = 0;

    /// Read one attribute of any entry by canonical reference.
    [[nodiscard]] virtual foundation::OtpResult<std::string> lookupAttribute(
        std::string_view reference, std::string_view attribute) const = 0;
};

/// Identity of the caller on whose behalf operations run.
struct Identity {
    std::string uid;
    std::string reference;
};

/// Abstract user identity resolver.
class IIdentityResolver {
public:
    virtual ~IIdentityResolver() = default;

    /// Map a user identifier (uid or canonical reference) to its canonical
    /// reference. Fails with UserNotFound when it cannot be resolved.
    [[nodiscard]] virtual foundation::OtpResult<std::string> resolveIdentity(
        std::string_view identifier) const = 0;

    /// The calling user, if one is authenticated.
    [[nodiscard]] virtual std::optional<Identity> currentIdentity() const = 0;

    /// Display identifier for a canonical reference.
    [[nodiscard]] virtual std::string displayIdentifier(std::string_view reference) const = 0;
};

}  // namespace otpm::token
