// src/PromptPort.cpp
#include <Neo4jCtl/PromptPort.hpp>

#include <iostream>

namespace Neo4jCtl {

ConsolePromptPort::ConsolePromptPort() : m_in(std::cin), m_out(std::cout) {}

ConsolePromptPort::ConsolePromptPort(std::istream& in, std::ostream& out) : m_in(in), m_out(out) {}

std::string ConsolePromptPort::ask(const std::string& message, const std::optional<std::string>& defaultValue) {
    m_out << message << '\n';
    if (defaultValue) {
        m_out << '[' << *defaultValue << "] ";
    }
    m_out << "> " << std::flush;

    std::string answer;
    std::getline(m_in, answer);
    if (!answer.empty() && answer.back() == '\r') {
        answer.pop_back();
    }

    if (answer.find_first_not_of(" \t") == std::string::npos) {
        return defaultValue.value_or("");
    }
    return answer;
}

void ConsolePromptPort::tell(const std::string& line) {
    m_out << line << std::endl;
}

} // namespace Neo4jCtl
