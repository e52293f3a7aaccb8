/// @file token_manager.cpp
/// @brief TokenManager implementation.

#include "otpm/token/token_manager.hpp"

#include "otpm/foundation/otp_logger.hpp"
#include "otpm/token/key_codec.hpp"
#include "otpm/token/owner_resolver.hpp"
#include "otpm/token/provisioning_uri.hpp"
#include "otpm/token/schema_resolver.hpp"
#include "otpm/token/search_filter.hpp"
#include "otpm/token/token_store.hpp"
#include "otpm/token/validity_validator.hpp"

#include "detail/text_utils.hpp"

#include <algorithm>
#include <cstdio>

namespace otpm::token {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::OtpError;
using foundation::OtpLogger;
using foundation::OtpResult;

/// State carried from the preparation phase of create to the post-store
/// phase. The URI lives only here and in the returned CreateResult.
struct TokenManager::CreateAccumulator {
    Token token;
    std::string uri;
};

namespace {

/// Random (version 4) UUID from the OpenSSL CSPRNG.
OtpResult<std::string> generateTokenId() {
    auto bytes = KeyCodec::generate(16);
    if (bytes.hasError()) {
        return OtpResult<std::string>::err(bytes.error());
    }
    auto& b = bytes.value();
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return OtpResult<std::string>::ok(std::string(buf, 36));
}

OtpResult<void> checkInfoFields(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (!isInfoField(name)) {
            return OtpResult<void>::err(OtpError(
                ErrorCode::InvalidArgument, "unknown informational field '" + name + "'"));
        }
    }
    return OtpResult<void>::ok();
}

Ownership ownershipOf(const AttributeMap& attributes) {
    Ownership ownership;
    if (auto it = attributes.find(std::string(attr::kOwner));
        it != attributes.end() && !it->second.empty()) {
        ownership.owner = it->second.front();
    }
    if (auto it = attributes.find(std::string(attr::kManagedBy)); it != attributes.end()) {
        ownership.managers = it->second;
    }
    return ownership;
}

void logTokenEvent(LogLevel level, std::string_view msg, std::string_view id,
                   const std::optional<std::string>& owner = std::nullopt) {
    auto& logger = OtpLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Core)) {
        return;
    }
    LogContext ctx;
    ctx.tokenId = std::string(id);
    ctx.owner = owner;
    logger.logWithContext(level, LogCategory::Core, msg, ctx);
}

}  // namespace

TokenManager::TokenManager(ManagerConfig config,
                           std::shared_ptr<ITokenStore> store,
                           std::shared_ptr<IIdentityResolver> identities)
    : config_(std::move(config)),
      store_(std::move(store)),
      identities_(std::move(identities)),
      schema_(std::make_unique<SchemaResolver>(config_.defaults)),
      owners_(std::make_unique<OwnerResolver>(*identities_)) {}

TokenManager::~TokenManager() = default;
TokenManager::TokenManager(TokenManager&&) noexcept = default;
TokenManager& TokenManager::operator=(TokenManager&&) noexcept = default;

// -- Create -------------------------------------------------------------------

OtpResult<TokenManager::CreateAccumulator> TokenManager::prepareCreate(
    const CreateRequest& request) const {
    using Prepared = OtpResult<CreateAccumulator>;

    auto validity = ValidityValidator::checkCreate({request.notBefore, request.notAfter});
    if (validity.hasError()) {
        return Prepared::err(validity.error());
    }

    auto resolved = schema_->resolve(request);
    if (resolved.hasError()) {
        return Prepared::err(resolved.error());
    }
    CreateAccumulator acc{std::move(resolved).value(), {}};
    auto& token = acc.token;

    if (request.id && !request.id->empty()) {
        token.id = *request.id;
    } else {
        auto id = generateTokenId();
        if (id.hasError()) {
            return Prepared::err(id.error());
        }
        token.id = std::move(id).value();
    }

    auto key = request.key ? KeyCodec::decode(*request.key)
                           : KeyCodec::generate(schema_->defaults().keyLength);
    if (key.hasError()) {
        return Prepared::err(key.error());
    }
    token.key = std::move(key).value();

    auto ownership = owners_->resolveForCreate(request.owner, request.manager);
    if (ownership.hasError()) {
        return Prepared::err(ownership.error());
    }
    token.owner = ownership.value().owner;
    token.managers = ownership.value().managers;

    auto issuer = ProvisioningUri::resolveIssuer(*store_, token.owner, config_.realm);
    acc.uri = ProvisioningUri::build(token, issuer);
    return Prepared::ok(std::move(acc));
}

OtpResult<CreateResult> TokenManager::create(const CreateRequest& request,
                                             const OutputOptions& options) {
    auto prepared = prepareCreate(request);
    if (prepared.hasError()) {
        OTPM_LOG_INFO(LogCategory::Core,
                      "token creation rejected: " + std::string(prepared.error().message()));
        return OtpResult<CreateResult>::err(prepared.error());
    }
    auto acc = std::move(prepared).value();

    auto stored = store_->createRecord(objectClassesFor(acc.token.type()),
                                       SchemaResolver::toAttributes(acc.token));
    if (stored.hasError()) {
        return OtpResult<CreateResult>::err(stored.error());
    }

    auto attributes = store_->readRecord(stored.value());
    if (attributes.hasError()) {
        return OtpResult<CreateResult>::err(attributes.error());
    }
    auto record = present(std::move(attributes).value(), options);
    if (record.hasError()) {
        return OtpResult<CreateResult>::err(record.error());
    }

    logTokenEvent(LogLevel::Info, "token created", acc.token.id, acc.token.owner);
    return OtpResult<CreateResult>::ok(
        CreateResult{std::move(record).value(), std::move(acc.uri)});
}

// -- Read ---------------------------------------------------------------------

OtpResult<TokenRecord> TokenManager::show(std::string_view id,
                                          const OutputOptions& options) const {
    auto attributes = store_->readRecord(id);
    if (attributes.hasError()) {
        return OtpResult<TokenRecord>::err(attributes.error());
    }
    return present(std::move(attributes).value(), options);
}

OtpResult<SearchResult> TokenManager::find(const SearchRequest& request,
                                           const OutputOptions& options) const {
    std::vector<std::string> infoNames;
    for (const auto& [name, value] : request.info) {
        infoNames.push_back(name);
    }
    auto infoCheck = checkInfoFields(infoNames);
    if (infoCheck.hasError()) {
        return OtpResult<SearchResult>::err(infoCheck.error());
    }

    std::optional<std::string> ownerRef;
    if (request.owner) {
        auto resolved = owners_->normalizeOwner(*request.owner);
        if (resolved.hasError()) {
            return OtpResult<SearchResult>::err(resolved.error());
        }
        ownerRef = std::move(resolved).value();
    }

    auto filter = rewriteTypePredicate(buildSearchFilter(request, ownerRef), request.type);
    OTPM_LOG_DEBUG(LogCategory::Search, "token search filter " + filter);

    auto page = store_->search(filter, request.sizeLimit);
    if (page.hasError()) {
        return OtpResult<SearchResult>::err(page.error());
    }

    SearchResult result;
    result.truncated = page.value().truncated;
    for (auto& entry : page.value().entries) {
        auto record = present(std::move(entry), options);
        if (record.hasError()) {
            return OtpResult<SearchResult>::err(record.error());
        }
        result.tokens.push_back(std::move(record).value());
    }
    return OtpResult<SearchResult>::ok(std::move(result));
}

// -- Update -------------------------------------------------------------------

OtpResult<TokenRecord> TokenManager::update(const UpdateRequest& request,
                                            const OutputOptions& options) {
    if (request.empty()) {
        return OtpResult<TokenRecord>::err(
            OtpError(ErrorCode::NoModifications, "no modifications to be performed"));
    }

    std::vector<std::string> infoNames;
    for (const auto& [name, value] : request.info) {
        infoNames.push_back(name);
    }
    auto infoCheck = checkInfoFields(infoNames);
    if (infoCheck.hasError()) {
        return OtpResult<TokenRecord>::err(infoCheck.error());
    }

    auto validity = ValidityValidator::checkUpdate(
        {request.notBefore, request.notAfter},
        [this, &request]() -> OtpResult<ValidityBounds> {
            auto stored = show(request.id, OutputOptions{.raw = true});
            if (stored.hasError()) {
                return OtpResult<ValidityBounds>::err(stored.error());
            }
            return OtpResult<ValidityBounds>::ok(
                ValidityBounds{stored.value().notBefore, stored.value().notAfter});
        });
    if (validity.hasError()) {
        return OtpResult<TokenRecord>::err(validity.error());
    }

    AttributeMap changes;
    auto set = [&changes](std::string_view name, std::string value) {
        changes[std::string(name)] = {std::move(value)};
    };

    if (request.disabled) {
        set(attr::kDisabled, *request.disabled ? "TRUE" : "FALSE");
    }
    if (request.notBefore) {
        set(attr::kNotBefore, detail::formatGeneralizedTime(*request.notBefore));
    }
    if (request.notAfter) {
        set(attr::kNotAfter, detail::formatGeneralizedTime(*request.notAfter));
    }
    for (const auto& [field, value] : request.info) {
        if (value && !value->empty()) {
            set(infoAttribute(field), *value);
        } else {
            changes[std::string(infoAttribute(field))] = {};
        }
    }

    if (request.manager) {
        auto manager = owners_->normalizeManager(*request.manager);
        if (manager.hasError()) {
            return OtpResult<TokenRecord>::err(manager.error());
        }
        set(attr::kManagedBy, std::move(manager).value());
    }

    if (request.owner) {
        auto owner = owners_->normalizeOwner(*request.owner);
        if (owner.hasError()) {
            return OtpResult<TokenRecord>::err(owner.error());
        }
        auto newOwner = std::move(owner).value();

        if (!request.manager) {
            auto previous = store_->readRecord(request.id);
            if (previous.hasError()) {
                return OtpResult<TokenRecord>::err(previous.error());
            }
            auto managers =
                OwnerResolver::managersAfterOwnerChange(newOwner, ownershipOf(previous.value()));
            if (managers) {
                OTPM_LOG_DEBUG(LogCategory::Owner,
                               "self-managed token " + request.id + " follows its new owner");
                changes[std::string(attr::kManagedBy)] = std::move(*managers);
            }
        }
        set(attr::kOwner, std::move(newOwner));
    }

    auto updated = store_->updateRecord(request.id, changes);
    if (updated.hasError()) {
        return OtpResult<TokenRecord>::err(updated.error());
    }
    logTokenEvent(LogLevel::Info, "token modified", request.id);
    return show(request.id, options);
}

OtpResult<void> TokenManager::remove(std::string_view id) {
    auto removed = store_->deleteRecord(id);
    if (removed) {
        logTokenEvent(LogLevel::Info, "token deleted", id);
    }
    return removed;
}

// -- Managers -----------------------------------------------------------------

OtpResult<MembershipResult> TokenManager::addManagers(std::string_view id,
                                                      const std::vector<std::string>& users,
                                                      const OutputOptions& options) {
    return changeManagers(id, users, true, options);
}

OtpResult<MembershipResult> TokenManager::removeManagers(std::string_view id,
                                                         const std::vector<std::string>& users,
                                                         const OutputOptions& options) {
    return changeManagers(id, users, false, options);
}

OtpResult<MembershipResult> TokenManager::changeManagers(std::string_view id,
                                                         const std::vector<std::string>& users,
                                                         bool add,
                                                         const OutputOptions& options) {
    auto stored = store_->readRecord(id);
    if (stored.hasError()) {
        return OtpResult<MembershipResult>::err(stored.error());
    }
    auto managers = ownershipOf(stored.value()).managers;

    MembershipResult result;
    for (const auto& user : users) {
        auto reference = identities_->resolveIdentity(user);
        if (reference.hasError()) {
            if (reference.error().code() != ErrorCode::UserNotFound) {
                return OtpResult<MembershipResult>::err(reference.error());
            }
            result.failed.emplace_back(user, "no such entry");
            continue;
        }
        auto it = std::find(managers.begin(), managers.end(), reference.value());
        if (add) {
            if (it != managers.end()) {
                result.failed.emplace_back(user, "This entry is already a member");
                continue;
            }
            managers.push_back(std::move(reference).value());
        } else {
            if (it == managers.end()) {
                result.failed.emplace_back(user, "This entry is not a member");
                continue;
            }
            managers.erase(it);
        }
        ++result.completed;
    }

    if (result.completed > 0) {
        auto updated = store_->updateRecord(id, {{std::string(attr::kManagedBy), managers}});
        if (updated.hasError()) {
            return OtpResult<MembershipResult>::err(updated.error());
        }
        logTokenEvent(LogLevel::Info, add ? "token managers added" : "token managers removed", id);
    }

    auto record = show(id, options);
    if (record.hasError()) {
        return OtpResult<MembershipResult>::err(record.error());
    }
    result.token = std::move(record).value();
    return OtpResult<MembershipResult>::ok(std::move(result));
}

// -- Output -------------------------------------------------------------------

OtpResult<TokenRecord> TokenManager::present(AttributeMap attributes,
                                             const OutputOptions& options) const {
    auto record = SchemaResolver::toRecord(std::move(attributes), options);
    if (record.hasError()) {
        return record;
    }
    if (!options.pkeyOnly) {
        owners_->denormalize(record.value(), options);
    }
    return record;
}

}  // namespace otpm::token
