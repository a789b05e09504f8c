// include/Neo4jCtl/PasswordChanger.hpp
#ifndef NEO4JCTL_PASSWORD_CHANGER_HPP
#define NEO4JCTL_PASSWORD_CHANGER_HPP

#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace Neo4jCtl {

    class HttpClient;
    class PromptPort;

    struct PasswordChangeRequest {
        std::string address;
        std::string oldPassword;
        std::string newPassword;
    };

    struct PasswordChangeResult {
        bool success;
        std::string message;     // first server error when !success
        std::string newPassword; // echoed back on success
    };

    // Rotates the "neo4j" user's password through the server's REST endpoint
    class PasswordChanger {
    public:
        static constexpr const char* kDefaultAddress = "http://localhost:7474";
        static constexpr const char* kDefaultPassword = "neo4j";

        PasswordChanger(PromptPort& prompt, HttpClient& httpClient);

        // Prompts, posts, reports. Throws MissingNewPassword and HttpError.
        PasswordChangeResult run();

        // Throws MissingNewPassword
        PasswordChangeRequest promptForRequest();

        // POST <address>/user/neo4j/password and interpret the JSON answer
        PasswordChangeResult submit(const PasswordChangeRequest& request);

        static PasswordChangeResult interpret(const nlohmann::json& body, const std::string& newPassword);

    private:
        PromptPort& m_prompt;
        HttpClient& m_httpClient;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_PASSWORD_CHANGER_HPP
