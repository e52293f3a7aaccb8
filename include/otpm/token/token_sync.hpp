#pragma once

/// @file token_sync.hpp
/// @brief Token resynchronization request against the server's sync endpoint.
///
/// The core only builds the form body and interprets the result header; the
/// HTTPS exchange belongs to an ISyncTransport.

#include "otpm/foundation/otp_result.hpp"
#include "otpm/token/manager_config.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace otpm::token {

enum class SyncStatus : uint8_t { Ok, Error, InvalidCredentials, Unknown };

/// Caller input. Password and codes are secrets and never logged.
struct SyncRequest {
    std::string user;
    std::string password;
    std::string firstCode;
    std::string secondCode;
    std::optional<std::string> token;  ///< Token id; omitted when unset.
};

/// Fully prepared POST for the transport.
struct SyncSubmission {
    std::string url;
    std::string body;
    std::string contentType = "application/x-www-form-urlencoded";
};

struct SyncResponse {
    int statusCode = 0;
    std::map<std::string, std::string> headers;
};

/// HTTPS transport. Implementations own timeouts and TLS settings.
class ISyncTransport {
public:
    virtual ~ISyncTransport() = default;

    /// POST @p submission. Fails with SyncTransportFailed when no response
    /// was obtained.
    virtual foundation::OtpResult<SyncResponse> post(const SyncSubmission& submission) = 0;
};

class TokenSync {
public:
    TokenSync(ManagerConfig config, std::shared_ptr<ISyncTransport> transport);

    /// Derive the endpoint and encode the body.
    /// Fails with InsecureSyncEndpoint unless the RPC URI uses https, and with
    /// InvalidSyncUri when it cannot be parsed.
    [[nodiscard]] foundation::OtpResult<SyncSubmission> prepare(const SyncRequest& request) const;

    /// Submit the request and read the result header.
    [[nodiscard]] foundation::OtpResult<SyncStatus> synchronize(const SyncRequest& request);

    /// Map a response to a status. A non-200 response, a missing header or
    /// an unrecognized value yield Unknown. The header name matches
    /// case-insensitively.
    [[nodiscard]] static SyncStatus parseStatus(const SyncResponse& response,
                                                std::string_view header);

    /// User-facing text for @p status.
    [[nodiscard]] static std::string_view statusMessage(SyncStatus status);

private:
    ManagerConfig config_;
    std::shared_ptr<ISyncTransport> transport_;
};

}  // namespace otpm::token
