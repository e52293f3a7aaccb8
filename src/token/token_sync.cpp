/// @file token_sync.cpp
/// @brief TokenSync implementation.

#include "otpm/token/token_sync.hpp"

#include "otpm/foundation/otp_logger.hpp"

#include "detail/text_utils.hpp"

#include <utility>
#include <vector>

namespace otpm::token {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::OtpError;
using foundation::OtpResult;

namespace {

/// Replace the "/xml" segment of the RPC URI path with @p syncPath.
OtpResult<std::string> deriveSyncUrl(std::string_view rpcUri, std::string_view syncPath) {
    auto schemeEnd = rpcUri.find("://");
    if (schemeEnd == std::string_view::npos || schemeEnd == 0) {
        return OtpResult<std::string>::err(OtpError(
            ErrorCode::InvalidSyncUri, "cannot parse RPC URI '" + std::string(rpcUri) + "'"));
    }
    if (!detail::equalsIgnoreCase(rpcUri.substr(0, schemeEnd), "https")) {
        return OtpResult<std::string>::err(OtpError(
            ErrorCode::InsecureSyncEndpoint, "token sync requires an https RPC URI"));
    }

    auto pathStart = rpcUri.find('/', schemeEnd + 3);
    if (pathStart == std::string_view::npos) {
        return OtpResult<std::string>::ok(std::string(rpcUri));
    }
    auto pathEnd = rpcUri.find_first_of("?#", pathStart);
    if (pathEnd == std::string_view::npos) {
        pathEnd = rpcUri.size();
    }

    std::string path(rpcUri.substr(pathStart, pathEnd - pathStart));
    constexpr std::string_view marker = "/xml";
    std::size_t pos = 0;
    while ((pos = path.find(marker, pos)) != std::string::npos) {
        path.replace(pos, marker.size(), syncPath);
        pos += syncPath.size();
    }

    std::string url(rpcUri.substr(0, pathStart));
    url += path;
    url += rpcUri.substr(pathEnd);
    return OtpResult<std::string>::ok(std::move(url));
}

}  // namespace

TokenSync::TokenSync(ManagerConfig config, std::shared_ptr<ISyncTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

OtpResult<SyncSubmission> TokenSync::prepare(const SyncRequest& request) const {
    auto url = deriveSyncUrl(config_.rpcUri, config_.syncPath);
    if (url.hasError()) {
        return OtpResult<SyncSubmission>::err(url.error());
    }

    std::vector<std::pair<std::string, std::string>> params = {
        {"user", request.user},
        {"password", request.password},
        {"first_code", request.firstCode},
        {"second_code", request.secondCode},
    };
    if (request.token) {
        params.emplace_back("token", config_.layout.tokenReference(*request.token));
    }

    SyncSubmission submission;
    submission.url = std::move(url).value();
    submission.body = detail::formEncode(params);
    return OtpResult<SyncSubmission>::ok(std::move(submission));
}

OtpResult<SyncStatus> TokenSync::synchronize(const SyncRequest& request) {
    auto submission = prepare(request);
    if (submission.hasError()) {
        return OtpResult<SyncStatus>::err(submission.error());
    }

    OTPM_LOG_INFO(LogCategory::Sync,
                  "synchronizing token for " + request.user + " via " + submission.value().url);
    auto response = transport_->post(submission.value());
    if (response.hasError()) {
        OTPM_LOG_WARN(LogCategory::Sync,
                      "token sync transport failed: " + std::string(response.error().message()));
        return OtpResult<SyncStatus>::err(response.error());
    }

    auto status = parseStatus(response.value(), config_.syncResultHeader);
    if (status != SyncStatus::Ok) {
        OTPM_LOG_WARN(LogCategory::Sync,
                      "token sync for " + request.user + ": " + std::string(statusMessage(status)));
    }
    return OtpResult<SyncStatus>::ok(status);
}

SyncStatus TokenSync::parseStatus(const SyncResponse& response, std::string_view header) {
    if (response.statusCode != 200) {
        return SyncStatus::Unknown;
    }
    for (const auto& [name, value] : response.headers) {
        if (!detail::equalsIgnoreCase(name, header)) {
            continue;
        }
        if (value == "ok") return SyncStatus::Ok;
        if (value == "error") return SyncStatus::Error;
        if (value == "invalid-credentials") return SyncStatus::InvalidCredentials;
        return SyncStatus::Unknown;
    }
    return SyncStatus::Unknown;
}

std::string_view TokenSync::statusMessage(SyncStatus status) {
    switch (status) {
        case SyncStatus::Ok:                 return "Token synchronized.";
        case SyncStatus::Error:              return "Error contacting server!";
        case SyncStatus::InvalidCredentials: return "Invalid Credentials!";
        case SyncStatus::Unknown:            return "Unknown Error!";
    }
    return "Unknown Error!";
}

}  // namespace otpm::token
