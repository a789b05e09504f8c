// include/Neo4jCtl/HttpClient.hpp
#ifndef NEO4JCTL_HTTP_CLIENT_HPP
#define NEO4JCTL_HTTP_CLIENT_HPP

#include <cpr/cpr.h>
#include <filesystem>

namespace Neo4jCtl {

    // Transport used by the catalog, the downloader and the password change.
    // Implementations report failures through the returned response
    // (status_code and error) and never throw.
    class HttpClient {
    public:
        virtual ~HttpClient() = default;

        virtual cpr::Response Head(const cpr::Url& url) = 0;
        virtual cpr::Response Get(const cpr::Url& url) = 0;
        // Streams the body into filepath (binary, truncated). A failed transfer removes the file.
        virtual cpr::Response Download(const std::filesystem::path& filepath, const cpr::Url& url) = 0;
        // application/x-www-form-urlencoded POST
        virtual cpr::Response PostForm(const cpr::Url& url, const cpr::Payload& payload) = 0;
    };

    inline bool isSuccessStatus(long status) {
        return status >= 200 && status < 300;
    }

} // namespace Neo4jCtl

#endif // NEO4JCTL_HTTP_CLIENT_HPP
