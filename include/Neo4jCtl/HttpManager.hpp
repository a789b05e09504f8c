// include/Neo4jCtl/HttpManager.hpp
#ifndef NEO4JCTL_HTTP_MANAGER_HPP
#define NEO4JCTL_HTTP_MANAGER_HPP

#include <Neo4jCtl/HttpClient.hpp>
#include <cpr/cpr.h>
#include <filesystem>
#include <fstream>
#include <optional>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    class HttpManager : public HttpClient {
    public:
        // caBundle replaces the system trust store when given
        explicit HttpManager(const std::optional<std::filesystem::path>& caBundle = std::nullopt);
        ~HttpManager() override;

        cpr::Response Head(const cpr::Url& url) override;
        cpr::Response Get(const cpr::Url& url) override;
        cpr::Response Download(const std::filesystem::path& filepath, const cpr::Url& url) override;
        cpr::Response PostForm(const cpr::Url& url, const cpr::Payload& payload) override;

        // Streams into an already open sink
        cpr::Response Download(std::ofstream& sink, const cpr::Url& url);

    private:
        cpr::SslOptions m_globalSslOptions;
        std::shared_ptr<spdlog::logger> m_logger;

        // A fresh session per request keeps requests independent
        cpr::Session CreateSession(const cpr::Url& url) const;
        void logFailure(const char* verb, const cpr::Url& url, const cpr::Response& response) const;
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_HTTP_MANAGER_HPP
