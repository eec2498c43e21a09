#include "cmdb_client.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef CMDB_FETCH_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace cmdb_fetch {

namespace {

http::request<http::string_body> makeRequest(const std::string& host,
                                             const std::string& target,
                                             const std::string& body) {
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "cmdb_fetch/1.0");
    req.body() = body;
    req.prepare_payload();
    return req;
}

} // namespace

// ---------------------------------------------------------------------------
// CmdbClient
// ---------------------------------------------------------------------------

RemoteCall CmdbClient::bind(const std::string& method) {
    RemoteCall remote;
    remote.path   = "cc." + method;
    remote.invoke = [this, method](const nlohmann::json& params) {
        return call(method, params);
    };
    return remote;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

EsbClient::EsbClient(const std::string& endpoint,
                     const std::string& appCode,
                     const std::string& appSecret,
                     const std::string& username,
                     int timeoutMs)
    : mAppCode(appCode)
    , mAppSecret(appSecret)
    , mUsername(username)
    , mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(endpoint);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target;
    mUseSsl   = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef CMDB_FETCH_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

void EsbClient::setLog(std::ostream* log) {
    if (log == nullptr) {
        throw std::invalid_argument("EsbClient log stream must not be null");
    }
    std::lock_guard<std::mutex> lock(mLogMutex);
    mLog = log;
}

void EsbClient::logLine(const std::string& line) {
    // Calls arrive from several worker threads.
    std::lock_guard<std::mutex> lock(mLogMutex);
    *mLog << (line + "\n");
}

std::string EsbClient::targetFor(const std::string& method) const {
    return mBasePath + "/api/c/compapi/v2/cc/" + method + "/";
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

ApiResponse EsbClient::call(const std::string& method,
                            const nlohmann::json& params)
{
    if (!params.is_null() && !params.is_object()) {
        throw std::invalid_argument("Params for cc." + method + " must be a JSON object");
    }

    nlohmann::json payload = params.is_null() ? nlohmann::json::object() : params;
    payload["bk_app_code"]   = mAppCode;
    payload["bk_app_secret"] = mAppSecret;
    payload["bk_username"]   = mUsername;

    const std::string target = targetFor(method);
    const std::string body   = payload.dump();

    if (mVerbose) {
        std::ostringstream line;
        line << "[EsbClient] POST " << mHost << ":" << mPort << target;
        if (payload.contains("page")) {
            line << " page=" << dumpForLog(payload["page"]);
        }
        logLine(line.str());
    }

    const HttpResult res = mUseSsl ? doHttpsRequest(target, body)
                                   : doHttpRequest(target, body);

    if (mVerbose) {
        std::ostringstream line;
        line << "[EsbClient] " << method << " -> HTTP " << res.httpStatus;
        logLine(line.str());
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::parse_error& e) {
        if (res.httpStatus < 200 || res.httpStatus >= 300) {
            // Gateway errors (502, 504, ...) often come back as HTML.
            ApiResponse failure;
            failure.result  = false;
            failure.code    = static_cast<int>(res.httpStatus);
            failure.message = "HTTP " + std::to_string(res.httpStatus) +
                              " from " + target;
            return failure;
        }
        throw std::runtime_error(
            std::string("Failed to parse JSON response: ") + e.what());
    }

    return parseApiResponse(parsed);
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

EsbClient::HttpResult
EsbClient::doHttpRequest(const std::string& target, const std::string& requestBody)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = makeRequest(mHost, target, requestBody);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    // Graceful shutdown (non-critical errors are ignored).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return HttpResult{res.result_int(), std::move(res.body())};
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

EsbClient::HttpResult
EsbClient::doHttpsRequest(const std::string& target, const std::string& requestBody)
{
#ifdef CMDB_FETCH_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = makeRequest(mHost, target, requestBody);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.shutdown(ec);

    return HttpResult{res.result_int(), std::move(res.body())};
#else
    (void)target;
    (void)requestBody;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace cmdb_fetch
