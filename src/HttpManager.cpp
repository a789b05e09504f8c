// src/HttpManager.cpp
#include <Neo4jCtl/HttpManager.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>
#include <fstream>

namespace Neo4jCtl {

HttpManager::HttpManager(const std::optional<std::filesystem::path>& caBundle) {
    m_logger = Utils::Logger::GetOrCreateLogger("HttpManager");

    if (caBundle) {
        m_logger->debug("Configuring SslOptions with CA bundle: {}", caBundle->string());
        m_globalSslOptions = cpr::Ssl(
            cpr::ssl::CaInfo{caBundle->string()},
            cpr::ssl::VerifyHost{true},
            cpr::ssl::VerifyPeer{true}
        );
    } else {
        m_logger->debug("Using the system trust store for TLS.");
        m_globalSslOptions = cpr::Ssl(
            cpr::ssl::VerifyHost{true},
            cpr::ssl::VerifyPeer{true}
        );
    }
}

HttpManager::~HttpManager() {
    m_logger->trace("HttpManager shutting down.");
}

cpr::Session HttpManager::CreateSession(const cpr::Url& url) const {
    cpr::Session session;
    session.SetUrl(url);
    session.SetSslOptions(m_globalSslOptions);
    session.SetUserAgent(cpr::UserAgent{"neo4jctl/0.1"});
    return session;
}

void HttpManager::logFailure(const char* verb, const cpr::Url& url, const cpr::Response& response) const {
    if (response.error.code != cpr::ErrorCode::OK || !isSuccessStatus(response.status_code)) {
        m_logger->debug("{} {} failed. Status: {}, Error: \"{}\", CPR Error Code: {}",
            verb, url.str(), response.status_code, response.error.message, static_cast<int>(response.error.code));
    }
}

cpr::Response HttpManager::Head(const cpr::Url& url) {
    m_logger->trace("HEAD: {}", url.str());
    cpr::Session session = CreateSession(url);
    cpr::Response response = session.Head();
    logFailure("HEAD", url, response);
    return response;
}

cpr::Response HttpManager::Get(const cpr::Url& url) {
    m_logger->trace("GET: {}", url.str());
    cpr::Session session = CreateSession(url);
    cpr::Response response = session.Get();
    logFailure("GET", url, response);
    return response;
}

cpr::Response HttpManager::PostForm(const cpr::Url& url, const cpr::Payload& payload) {
    m_logger->trace("POST (form): {}", url.str());
    cpr::Session session = CreateSession(url);
    session.SetPayload(payload);
    cpr::Response response = session.Post();
    logFailure("POST", url, response);
    return response;
}

cpr::Response HttpManager::Download(std::ofstream& sink, const cpr::Url& url) {
    m_logger->trace("DOWNLOAD to provided ofstream: {}", url.str());
    cpr::Session session = CreateSession(url);

    cpr::Response response = session.Download(sink);

    if(response.error.code != cpr::ErrorCode::OK || !isSuccessStatus(response.status_code)) {
        m_logger->error("Download to stream failed for {}. Status: {}, Error: \"{}\", CPR Error Code: {}",
            url.str(), response.status_code, response.error.message, static_cast<int>(response.error.code));
    } else {
        m_logger->info("Download to stream successful for {}. Bytes: {}", url.str(), response.downloaded_bytes);
    }
    return response;
}

cpr::Response HttpManager::Download(const std::filesystem::path& filepath, const cpr::Url& url) {
    m_logger->debug("DOWNLOAD to file: {} -> {}", url.str(), filepath.string());
    std::ofstream file_stream(filepath, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        cpr::Response r_fail;
        r_fail.error.code = cpr::ErrorCode::UNKNOWN_ERROR;
        r_fail.error.message = "HttpManager::Download: Failed to open file for writing: " + filepath.string();
        r_fail.status_code = 0;
        m_logger->error("{}", r_fail.error.message);
        return r_fail;
    }

    cpr::Response response = Download(file_stream, url);
    file_stream.close();

    if (response.error.code != cpr::ErrorCode::OK || !isSuccessStatus(response.status_code)) {
        std::error_code ec;
        if (std::filesystem::remove(filepath, ec)) {
            m_logger->info("Removed partially downloaded file: {}", filepath.string());
        } else if (ec) {
            m_logger->warn("Failed to remove partially downloaded file {}: {}", filepath.string(), ec.message());
        }
    }
    return response;
}

} // namespace Neo4jCtl
