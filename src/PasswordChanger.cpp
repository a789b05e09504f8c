// src/PasswordChanger.cpp
#include <Neo4jCtl/PasswordChanger.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/HttpClient.hpp>
#include <Neo4jCtl/PromptPort.hpp>
#include <Neo4jCtl/Utils/Logger.hpp>

#include <nlohmann/json.hpp>

namespace Neo4jCtl {

PasswordChanger::PasswordChanger(PromptPort& prompt, HttpClient& httpClient)
    : m_prompt(prompt), m_httpClient(httpClient) {
    m_logger = Utils::Logger::GetOrCreateLogger("PasswordChanger");
}

PasswordChangeRequest PasswordChanger::promptForRequest() {
    PasswordChangeRequest request;
    request.address = m_prompt.ask("Enter IP address / host name without protocol and port", std::string(kDefaultAddress));
    request.oldPassword = m_prompt.ask("Input current password. Leave blank for a fresh installation", std::string(kDefaultPassword));
    request.newPassword = m_prompt.ask("Input new password.", std::nullopt);
    if (request.newPassword.empty()) {
        throw MissingNewPassword();
    }
    return request;
}

PasswordChangeResult PasswordChanger::interpret(const nlohmann::json& body, const std::string& newPassword) {
    if (body.is_object() && body.contains("errors") && body.at("errors").is_array() && !body.at("errors").empty()) {
        const nlohmann::json& first = body.at("errors").at(0);
        std::string message = "unknown error";
        if (first.is_object() && first.contains("message") && first.at("message").is_string()) {
            message = first.at("message").get<std::string>();
        } else if (first.is_string()) {
            message = first.get<std::string>();
        }
        return PasswordChangeResult{false, message, ""};
    }
    return PasswordChangeResult{true, "", newPassword};
}

PasswordChangeResult PasswordChanger::submit(const PasswordChangeRequest& request) {
    std::string address = request.address;
    while (!address.empty() && address.back() == '/') {
        address.pop_back();
    }
    const std::string url = address + "/user/neo4j/password";

    m_logger->debug("Posting password change to {}", url);
    cpr::Response response = m_httpClient.PostForm(
        cpr::Url{url},
        cpr::Payload{{"password", request.oldPassword}, {"new_password", request.newPassword}});

    if (response.error.code != cpr::ErrorCode::OK || response.status_code == 0) {
        throw HttpError("Unable to reach " + url + ": " + response.error.message, response.status_code);
    }

    nlohmann::json body = nlohmann::json::object();
    if (!response.text.empty()) {
        try {
            body = nlohmann::json::parse(response.text);
        } catch (const nlohmann::json::parse_error& e) {
            m_logger->error("Failed to parse password change response: {}. Response Text: {}", e.what(), response.text);
            throw HttpError(std::string("Unexpected response from ") + url + ": " + e.what(), response.status_code);
        }
    }

    PasswordChangeResult result = interpret(body, request.newPassword);
    if (result.success && !isSuccessStatus(response.status_code)) {
        return PasswordChangeResult{false, "Server answered HTTP " + std::to_string(response.status_code), ""};
    }
    return result;
}

PasswordChangeResult PasswordChanger::run() {
    m_prompt.tell("This will change the password for a Neo4j server");

    PasswordChangeRequest request = promptForRequest();
    PasswordChangeResult result = submit(request);

    if (result.success) {
        m_prompt.tell("Password changed successfully! Please update your app to use:");
        m_prompt.tell("username: neo4j");
        m_prompt.tell("password: " + result.newPassword);
    } else {
        m_prompt.tell("An error was returned: " + result.message);
    }
    return result;
}

} // namespace Neo4jCtl
