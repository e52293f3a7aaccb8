/// @file schema_resolver.cpp
/// @brief SchemaResolver implementation.

#include "otpm/token/schema_resolver.hpp"

#include "otpm/foundation/otp_logger.hpp"

#include "detail/text_utils.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

namespace otpm::token {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::OtpError;
using foundation::OtpResult;

namespace {

std::string firstValue(const AttributeMap& attributes, std::string_view name) {
    auto it = attributes.find(std::string(name));
    if (it == attributes.end() || it->second.empty()) {
        return {};
    }
    return it->second.front();
}

bool hasAttribute(const AttributeMap& attributes, std::string_view name) {
    auto it = attributes.find(std::string(name));
    return it != attributes.end() && !it->second.empty();
}

void put(AttributeMap& attributes, std::string_view name, std::string value) {
    attributes[std::string(name)] = {std::move(value)};
}

OtpResult<int64_t> readInt(const AttributeMap& attributes, std::string_view name,
                           int64_t fallback) {
    if (!hasAttribute(attributes, name)) {
        return OtpResult<int64_t>::ok(fallback);
    }
    auto parsed = detail::parseInt(firstValue(attributes, name));
    if (!parsed) {
        return OtpResult<int64_t>::err(OtpError(
            ErrorCode::MalformedRecord, "attribute " + std::string(name) + " is not an integer"));
    }
    return OtpResult<int64_t>::ok(*parsed);
}

OtpResult<std::optional<Timestamp>> readTime(const AttributeMap& attributes,
                                             std::string_view name) {
    if (!hasAttribute(attributes, name)) {
        return OtpResult<std::optional<Timestamp>>::ok(std::nullopt);
    }
    auto parsed = detail::parseGeneralizedTime(firstValue(attributes, name));
    if (!parsed) {
        return OtpResult<std::optional<Timestamp>>::err(OtpError(
            ErrorCode::MalformedRecord, "attribute " + std::string(name) + " is not a timestamp"));
    }
    return OtpResult<std::optional<Timestamp>>::ok(*parsed);
}

}  // namespace

// -- Marker / attribute tables ------------------------------------------------

std::string schemaClassFor(TokenType type) {
    return type == TokenType::Totp ? "otpTokenTotp" : "otpTokenHotp";
}

std::vector<std::string> objectClassesFor(TokenType type) {
    return {std::string(kTokenClass), schemaClassFor(type)};
}

const std::vector<std::string_view>& typeAttributes(TokenType type) {
    static const std::vector<std::string_view> totp = {attr::kTotpClockOffset,
                                                       attr::kTotpTimeStep};
    static const std::vector<std::string_view> hotp = {attr::kHotpCounter};
    return type == TokenType::Totp ? totp : hotp;
}

std::string_view infoAttribute(std::string_view field) {
    if (field == "vendor") return attr::kVendor;
    if (field == "model") return attr::kModel;
    if (field == "serial") return attr::kSerial;
    return attr::kDescription;
}

// -- SchemaResolver -----------------------------------------------------------

SchemaResolver::SchemaResolver(TokenDefaults defaults) : defaults_(defaults) {}

OtpResult<Token> SchemaResolver::resolve(const CreateRequest& request) const {
    TokenType type = defaults_.type;
    if (request.type) {
        auto parsed = parseTokenType(*request.type);
        if (!parsed) {
            return OtpResult<Token>::err(
                OtpError(ErrorCode::UnknownTokenType,
                         "unknown token type '" + *request.type + "', expected totp or hotp",
                         foundation::FieldError{"type", "must be one of totp, hotp"}));
        }
        type = *parsed;
    }

    Token token;

    // Select this type's field group; the other group is dropped unread.
    if (type == TokenType::Totp) {
        if (request.counter) {
            OTPM_LOG_DEBUG(LogCategory::Token, "dropping hotp-only field 'counter' from totp token");
        }
        TotpParams params;
        params.clockOffset = request.clockOffset.value_or(defaults_.clockOffset);
        params.timeStep = request.timeStep.value_or(defaults_.timeStep);
        if (params.timeStep < kMinTimeStep) {
            return OtpResult<Token>::err(OtpError::validation(
                "timeStep", "must be at least " + std::to_string(kMinTimeStep)));
        }
        token.params = params;
    } else {
        if (request.clockOffset || request.timeStep) {
            OTPM_LOG_DEBUG(LogCategory::Token,
                           "dropping totp-only fields 'clockOffset'/'timeStep' from hotp token");
        }
        HotpParams params;
        params.counter = request.counter.value_or(defaults_.counter);
        if (params.counter < kMinCounter) {
            return OtpResult<Token>::err(OtpError::validation(
                "counter", "must be at least " + std::to_string(kMinCounter)));
        }
        token.params = params;
    }

    token.algorithm = defaults_.algorithm;
    if (request.algorithm) {
        auto parsed = parseAlgorithm(*request.algorithm);
        if (!parsed) {
            return OtpResult<Token>::err(OtpError::validation(
                "algorithm", "must be one of sha1, sha256, sha384, sha512"));
        }
        token.algorithm = *parsed;
    }

    token.digits = request.digits.value_or(defaults_.digits);
    if (token.digits != 6 && token.digits != 8) {
        return OtpResult<Token>::err(OtpError::validation("digits", "must be 6 or 8"));
    }

    for (const auto& [field, value] : request.info) {
        if (!isInfoField(field)) {
            return OtpResult<Token>::err(OtpError(
                ErrorCode::InvalidArgument, "unknown informational field '" + field + "'"));
        }
        if (!value.empty()) {
            token.info[field] = value;
        }
    }

    token.disabled = request.disabled.value_or(false);
    token.notBefore = request.notBefore;
    token.notAfter = request.notAfter;
    return OtpResult<Token>::ok(std::move(token));
}

AttributeMap SchemaResolver::toAttributes(const Token& token) {
    AttributeMap attributes;
    put(attributes, attr::kTokenId, token.id);
    put(attributes, attr::kKey, std::string(token.key.begin(), token.key.end()));
    put(attributes, attr::kAlgorithm, std::string(algorithmName(token.algorithm)));
    put(attributes, attr::kDigits, std::to_string(token.digits));
    put(attributes, attr::kDisabled, token.disabled ? "TRUE" : "FALSE");

    std::visit(
        [&attributes](const auto& params) {
            using P = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<P, TotpParams>) {
                put(attributes, attr::kTotpClockOffset, std::to_string(params.clockOffset));
                put(attributes, attr::kTotpTimeStep, std::to_string(params.timeStep));
            } else {
                put(attributes, attr::kHotpCounter, std::to_string(params.counter));
            }
        },
        token.params);

    if (token.owner) {
        put(attributes, attr::kOwner, *token.owner);
    }
    if (!token.managers.empty()) {
        attributes[std::string(attr::kManagedBy)] = token.managers;
    }
    if (token.notBefore) {
        put(attributes, attr::kNotBefore, detail::formatGeneralizedTime(*token.notBefore));
    }
    if (token.notAfter) {
        put(attributes, attr::kNotAfter, detail::formatGeneralizedTime(*token.notAfter));
    }
    for (const auto& [field, value] : token.info) {
        put(attributes, infoAttribute(field), value);
    }
    return attributes;
}

std::optional<TokenType> SchemaResolver::deriveType(const AttributeMap& attributes) {
    auto it = attributes.find(std::string(attr::kObjectClass));
    if (it == attributes.end()) {
        return std::nullopt;
    }
    for (auto type : kTokenTypes) {
        auto marker = schemaClassFor(type);
        for (const auto& value : it->second) {
            if (detail::equalsIgnoreCase(value, marker)) {
                return type;
            }
        }
    }
    return std::nullopt;
}

void SchemaResolver::stripForeignAttributes(AttributeMap& attributes,
                                            std::optional<TokenType> type) {
    for (auto other : kTokenTypes) {
        if (type && other == *type) {
            continue;
        }
        for (auto name : typeAttributes(other)) {
            attributes.erase(std::string(name));
        }
    }
}

OtpResult<TokenRecord> SchemaResolver::toRecord(AttributeMap attributes,
                                                const OutputOptions& options) {
    TokenRecord record;
    record.id = firstValue(attributes, attr::kTokenId);
    record.type = deriveType(attributes);

    if (options.all && !options.pkeyOnly) {
        auto it = attributes.find(std::string(attr::kObjectClass));
        if (it != attributes.end()) {
            record.objectClasses = it->second;
        }
    }
    if (options.pkeyOnly) {
        return OtpResult<TokenRecord>::ok(std::move(record));
    }

    attributes.erase(std::string(attr::kKey));
    stripForeignAttributes(attributes, record.type);

    if (record.type == TokenType::Totp) {
        const auto& names = typeAttributes(TokenType::Totp);
        if (std::any_of(names.begin(), names.end(),
                        [&](auto n) { return hasAttribute(attributes, n); })) {
            auto offset = readInt(attributes, attr::kTotpClockOffset, kDefaultClockOffset);
            auto step = readInt(attributes, attr::kTotpTimeStep, kDefaultTimeStep);
            if (offset.hasError()) return OtpResult<TokenRecord>::err(offset.error());
            if (step.hasError()) return OtpResult<TokenRecord>::err(step.error());
            record.params = TotpParams{offset.value(), step.value()};
        }
    } else if (record.type == TokenType::Hotp) {
        if (hasAttribute(attributes, attr::kHotpCounter)) {
            auto counter = readInt(attributes, attr::kHotpCounter, kDefaultCounter);
            if (counter.hasError()) return OtpResult<TokenRecord>::err(counter.error());
            record.params = HotpParams{counter.value()};
        }
    }

    if (hasAttribute(attributes, attr::kAlgorithm)) {
        record.algorithm = parseAlgorithm(firstValue(attributes, attr::kAlgorithm));
    }
    if (hasAttribute(attributes, attr::kDigits)) {
        auto digits = readInt(attributes, attr::kDigits, kDefaultDigits);
        if (digits.hasError()) return OtpResult<TokenRecord>::err(digits.error());
        record.digits = static_cast<int>(digits.value());
    }

    if (hasAttribute(attributes, attr::kOwner)) {
        record.owner = firstValue(attributes, attr::kOwner);
    }
    if (auto it = attributes.find(std::string(attr::kManagedBy)); it != attributes.end()) {
        record.managers = it->second;
    }
    record.disabled = detail::equalsIgnoreCase(firstValue(attributes, attr::kDisabled), "TRUE");

    auto notBefore = readTime(attributes, attr::kNotBefore);
    if (notBefore.hasError()) return OtpResult<TokenRecord>::err(notBefore.error());
    record.notBefore = notBefore.value();
    auto notAfter = readTime(attributes, attr::kNotAfter);
    if (notAfter.hasError()) return OtpResult<TokenRecord>::err(notAfter.error());
    record.notAfter = notAfter.value();

    for (auto field : kInfoFieldNames) {
        if (hasAttribute(attributes, infoAttribute(field))) {
            record.info[std::string(field)] = firstValue(attributes, infoAttribute(field));
        }
    }
    return OtpResult<TokenRecord>::ok(std::move(record));
}

}  // namespace otpm::token
