#pragma once

#include "batch_request.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace cmdb_fetch {

/// Calls CMDB (`cc.*`) API methods.
class CmdbClient {
public:
    virtual ~CmdbClient() = default;

    /// Invoke @p method with @p params.
    /// Implementations must be safe to call from several threads at once.
    /// @throws std::runtime_error on transport failures.
    virtual ApiResponse call(const std::string& method,
                             const nlohmann::json& params) = 0;

    /// A RemoteCall for @p method, identified as "cc.<method>" in logs.
    /// The client must outlive the returned RemoteCall.
    RemoteCall bind(const std::string& method);
};

/// CmdbClient over the ESB HTTP gateway, built on Boost.Beast.
/// Sends `POST <endpoint>/api/c/compapi/v2/cc/<method>/` with the params and
/// the app credentials in the JSON body.
class EsbClient : public CmdbClient {
public:
    /// @param endpoint   Gateway root, e.g. "http://paas.service.consul"
    /// @param appCode    bk_app_code of the calling application
    /// @param appSecret  bk_app_secret of the calling application
    /// @param username   bk_username the calls are made on behalf of
    /// @param timeoutMs  Per-operation timeout in milliseconds
    /// @throws std::invalid_argument on a malformed endpoint,
    ///         std::runtime_error for HTTPS without SSL support.
    EsbClient(const std::string& endpoint,
              const std::string& appCode,
              const std::string& appSecret,
              const std::string& username,
              int timeoutMs = 30000);

    ApiResponse call(const std::string& method,
                     const nlohmann::json& params) override;

    void setVerbose(bool v) { mVerbose = v; }

    /// Stream for verbose diagnostics (default std::cerr).
    /// @throws std::invalid_argument if @p log is null.
    void setLog(std::ostream* log);

    /// Request target for @p method, e.g. "/api/c/compapi/v2/cc/search_business/".
    std::string targetFor(const std::string& method) const;

private:
    struct HttpResult {
        unsigned int httpStatus = 0;
        std::string  body;
    };

    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    std::string mAppCode;
    std::string mAppSecret;
    std::string mUsername;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    std::ostream* mLog = &std::cerr;
    std::mutex    mLogMutex;

    HttpResult doHttpRequest(const std::string& target, const std::string& requestBody);
    HttpResult doHttpsRequest(const std::string& target, const std::string& requestBody);

    void logLine(const std::string& line);
};

} // namespace cmdb_fetch
