#pragma once

/// @file token_manager.hpp
/// @brief OTP token lifecycle: create, show, update, remove, find and
/// manager membership.
///
/// Orchestrates KeyCodec, SchemaResolver, ValidityValidator, OwnerResolver,
/// ProvisioningUri and the search filter rewriter over an ITokenStore and an
/// IIdentityResolver.

#include "otpm/foundation/otp_result.hpp"
#include "otpm/token/manager_config.hpp"
#include "otpm/token/token_types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace otpm::token {

class ITokenStore;
class IIdentityResolver;
class SchemaResolver;
class OwnerResolver;

/// Token manager. Holds no per-token state; concurrent calls for different
/// tokens are independent.
///
/// Example:
/// @code
///   auto directory = std::make_shared<InMemoryDirectory>();
///   directory->addUser("alice", "alice@EXAMPLE.COM");
///   directory->setCurrentUser("alice");
///
///   TokenManager manager(ManagerConfig{}, directory, directory);
///   auto created = manager.create({});
///   enroll(created.value().uri);   // only chance to see the key
/// @endcode
class TokenManager {
public:
    TokenManager(ManagerConfig config,
                 std::shared_ptr<ITokenStore> store,
                 std::shared_ptr<IIdentityResolver> identities);

    ~TokenManager();

    TokenManager(const TokenManager&) = delete;
    TokenManager& operator=(const TokenManager&) = delete;
    TokenManager(TokenManager&&) noexcept;
    TokenManager& operator=(TokenManager&&) noexcept;

    /// Create a token and return it together with its provisioning URI.
    ///
    /// A missing id is replaced by a random UUID; a missing key by
    /// defaults().keyLength random bytes.
    [[nodiscard]] foundation::OtpResult<CreateResult> create(const CreateRequest& request,
                                                             const OutputOptions& options = {});

    [[nodiscard]] foundation::OtpResult<TokenRecord> show(std::string_view id,
                                                          const OutputOptions& options = {}) const;

    /// Apply a partial update. An empty request fails with NoModifications.
    [[nodiscard]] foundation::OtpResult<TokenRecord> update(const UpdateRequest& request,
                                                            const OutputOptions& options = {});

    [[nodiscard]] foundation::OtpResult<void> remove(std::string_view id);

    [[nodiscard]] foundation::OtpResult<SearchResult> find(const SearchRequest& request,
                                                           const OutputOptions& options = {}) const;

    /// Add users to the token's managers. Unresolvable users and users that
    /// already manage the token are reported in MembershipResult::failed.
    [[nodiscard]] foundation::OtpResult<MembershipResult> addManagers(
        std::string_view id, const std::vector<std::string>& users,
        const OutputOptions& options = {});

    /// Remove users from the token's managers. Unresolvable users and users
    /// that do not manage the token are reported in MembershipResult::failed.
    [[nodiscard]] foundation::OtpResult<MembershipResult> removeManagers(
        std::string_view id, const std::vector<std::string>& users,
        const OutputOptions& options = {});

    [[nodiscard]] const ManagerConfig& config() const noexcept { return config_; }

private:
    struct CreateAccumulator;

    [[nodiscard]] foundation::OtpResult<CreateAccumulator> prepareCreate(
        const CreateRequest& request) const;

    [[nodiscard]] foundation::OtpResult<TokenRecord> present(AttributeMap attributes,
                                                             const OutputOptions& options) const;

    [[nodiscard]] foundation::OtpResult<MembershipResult> changeManagers(
        std::string_view id, const std::vector<std::string>& users, bool add,
        const OutputOptions& options);

    ManagerConfig config_;
    std::shared_ptr<ITokenStore> store_;
    std::shared_ptr<IIdentityResolver> identities_;
    std::unique_ptr<SchemaResolver> schema_;
    std::unique_ptr<OwnerResolver> owners_;
};

}  // namespace otpm::token
