/// @file in_memory_directory.cpp
/// @brief InMemoryDirectory implementation.

#include "otpm/token/in_memory_directory.hpp"

#include "otpm/foundation/otp_logger.hpp"
#include "otpm/token/schema_resolver.hpp"
#include "otpm/token/search_filter.hpp"

namespace otpm::token {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::OtpError;
using foundation::OtpResult;

namespace {

OtpError tokenNotFound(std::string_view id) {
    return OtpError(ErrorCode::TokenNotFound, "token '" + std::string(id) + "' not found",
                    foundation::FieldError{"id", "no such token"});
}

}  // namespace

InMemoryDirectory::InMemoryDirectory(DirectoryLayout layout) : layout_(std::move(layout)) {}

std::string InMemoryDirectory::addUser(std::string_view uid, std::string_view principal) {
    AttributeMap entry;
    entry["uid"] = {std::string(uid)};
    if (!principal.empty()) {
        entry[std::string(kPrincipalAttribute)] = {std::string(principal)};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    users_[std::string(uid)] = std::move(entry);
    return layout_.userReference(uid);
}

void InMemoryDirectory::setCurrentUser(std::optional<std::string> uid) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentUser_ = std::move(uid);
}

std::optional<AttributeMap> InMemoryDirectory::rawRecord(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(id);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t InMemoryDirectory::tokenCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

// -- ITokenStore --------------------------------------------------------------

OtpResult<std::string> InMemoryDirectory::createRecord(
    const std::vector<std::string>& objectClasses, const AttributeMap& attributes) {
    auto idIt = attributes.find(std::string(attr::kTokenId));
    if (idIt == attributes.end() || idIt->second.empty() || idIt->second.front().empty()) {
        return OtpResult<std::string>::err(
            OtpError(ErrorCode::InvalidArgument, "record has no token id"));
    }
    const auto& id = idIt->second.front();

    std::lock_guard<std::mutex> lock(mutex_);
    if (tokens_.count(id) != 0) {
        return OtpResult<std::string>::err(
            OtpError(ErrorCode::TokenAlreadyExists, "token '" + id + "' already exists",
                     foundation::FieldError{"id", "already in use"}));
    }
    auto record = attributes;
    record[std::string(attr::kObjectClass)] = objectClasses;
    tokens_.emplace(id, std::move(record));
    OTPM_LOG_DEBUG(LogCategory::Store, "stored token record '" + id + "'");
    return OtpResult<std::string>::ok(id);
}

OtpResult<AttributeMap> InMemoryDirectory::readRecord(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(id);
    if (it == tokens_.end()) {
        return OtpResult<AttributeMap>::err(tokenNotFound(id));
    }
    return OtpResult<AttributeMap>::ok(it->second);
}

OtpResult<void> InMemoryDirectory::updateRecord(std::string_view id,
                                                const AttributeMap& changes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(id);
    if (it == tokens_.end()) {
        return OtpResult<void>::err(tokenNotFound(id));
    }
    for (const auto& [name, values] : changes) {
        if (values.empty()) {
            it->second.erase(name);
        } else {
            it->second[name] = values;
        }
    }
    return OtpResult<void>::ok();
}

OtpResult<void> InMemoryDirectory::deleteRecord(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(id);
    if (it == tokens_.end()) {
        return OtpResult<void>::err(tokenNotFound(id));
    }
    tokens_.erase(it);
    return OtpResult<void>::ok();
}

OtpResult<SearchPage> InMemoryDirectory::search(std::string_view filter,
                                                std::size_t sizeLimit) const {
    auto expression = FilterExpression::parse(filter);
    if (expression.hasError()) {
        OTPM_LOG_WARN(LogCategory::Store,
                      "rejecting filter: " + std::string(expression.error().message()));
        return OtpResult<SearchPage>::err(expression.error());
    }

    SearchPage page;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, record] : tokens_) {
        if (!expression.value().matches(record)) {
            continue;
        }
        if (sizeLimit != 0 && page.entries.size() == sizeLimit) {
            page.truncated = true;
            break;
        }
        page.entries.push_back(record);
    }
    return OtpResult<SearchPage>::ok(std::move(page));
}

OtpResult<std::string> InMemoryDirectory::lookupAttribute(std::string_view reference,
                                                          std::string_view attribute) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* entry = findEntry(reference);
    if (entry == nullptr) {
        return OtpResult<std::string>::err(OtpError(
            ErrorCode::NotFound, "no entry at '" + std::string(reference) + "'"));
    }
    auto it = entry->find(std::string(attribute));
    if (it == entry->end() || it->second.empty()) {
        return OtpResult<std::string>::err(
            OtpError(ErrorCode::NotFound, "entry has no attribute " + std::string(attribute)));
    }
    return OtpResult<std::string>::ok(it->second.front());
}

// -- IIdentityResolver --------------------------------------------------------

OtpResult<std::string> InMemoryDirectory::resolveIdentity(std::string_view identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string uid(identifier);
    if (identifier.find('=') != std::string_view::npos) {
        auto key = DirectoryLayout::primaryKey(identifier);
        if (!key || layout_.userReference(*key) != identifier) {
            uid.clear();
        } else {
            uid = *key;
        }
    }
    if (uid.empty() || users_.find(uid) == users_.end()) {
        return OtpResult<std::string>::err(OtpError(
            ErrorCode::UserNotFound, "user '" + std::string(identifier) + "' not found"));
    }
    return OtpResult<std::string>::ok(layout_.userReference(uid));
}

std::optional<Identity> InMemoryDirectory::currentIdentity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!currentUser_) {
        return std::nullopt;
    }
    return Identity{*currentUser_, layout_.userReference(*currentUser_)};
}

std::string InMemoryDirectory::displayIdentifier(std::string_view reference) const {
    return DirectoryLayout::primaryKey(reference).value_or(std::string(reference));
}

const AttributeMap* InMemoryDirectory::findEntry(std::string_view reference) const {
    auto key = DirectoryLayout::primaryKey(reference);
    if (!key) {
        return nullptr;
    }
    if (layout_.userReference(*key) == reference) {
        auto it = users_.find(*key);
        return it == users_.end() ? nullptr : &it->second;
    }
    if (layout_.tokenReference(*key) == reference) {
        auto it = tokens_.find(*key);
        return it == tokens_.end() ? nullptr : &it->second;
    }
    return nullptr;
}

}  // namespace otpm::token
