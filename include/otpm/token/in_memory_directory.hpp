#pragma once

/// @file in_memory_directory.hpp
/// @brief Thread-safe in-memory token store and identity resolver.
///
/// Backs the standalone tokend executable and the unit tests. Production
/// deployments plug a directory-server-backed ITokenStore/IIdentityResolver
/// pair in instead.

#include "otpm/token/token_store.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace otpm::token {

class InMemoryDirectory : public ITokenStore, public IIdentityResolver {
public:
    explicit InMemoryDirectory(DirectoryLayout layout = {});

    /// Register a user entry. Returns its canonical reference.
    std::string addUser(std::string_view uid, std::string_view principal = {});

    /// Set (or clear) the identity returned by currentIdentity().
    void setCurrentUser(std::optional<std::string> uid);

    /// Stored attributes of a token, including key material. Test helper.
    [[nodiscard]] std::optional<AttributeMap> rawRecord(std::string_view id) const;

    [[nodiscard]] std::size_t tokenCount() const;

    [[nodiscard]] const DirectoryLayout& layout() const noexcept { return layout_; }

    // ITokenStore
    foundation::OtpResult<std::string> createRecord(
        const std::vector<std::string>& objectClasses, const AttributeMap& attributes) override;

    [[nodiscard]] foundation::OtpResult<AttributeMap> readRecord(
        std::string_view id) const override;

    foundation::OtpResult<void> updateRecord(std::string_view id,
                                             const AttributeMap& changes) override;

    foundation::OtpResult<void> deleteRecord(std::string_view id) override;

    [[nodiscard]] foundation::OtpResult<SearchPage> search(std::string_view filter,
                                                           std::size_t sizeLimit) const override;

    [[nodiscard]] foundation::OtpResult<std::string> lookupAttribute(
        std::string_view reference, std::string_view attribute) const override;

    // IIdentityResolver
    [[nodiscard]] foundation::OtpResult<std::string> resolveIdentity(
        std::string_view identifier) const override;

    [[nodiscard]] std::optional<Identity> currentIdentity() const override;

    [[nodiscard]] std::string displayIdentifier(std::string_view reference) const override;

private:
    [[nodiscard]] const AttributeMap* findEntry(std::string_view reference) const;

    DirectoryLayout layout_;
    mutable std::mutex mutex_;
    std::map<std::string, AttributeMap, std::less<>> users_;   ///< keyed by uid
    std::map<std::string, AttributeMap, std::less<>> tokens_;  ///< keyed by token id
    std::optional<std::string> currentUser_;
};

}  // namespace otpm::token
