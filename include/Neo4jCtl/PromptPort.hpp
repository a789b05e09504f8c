// include/Neo4jCtl/PromptPort.hpp
#ifndef NEO4JCTL_PROMPT_PORT_HPP
#define NEO4JCTL_PROMPT_PORT_HPP

#include <iosfwd>
#include <optional>
#include <string>

namespace Neo4jCtl {

    // Operator channel for interactive flows
    class PromptPort {
    public:
        virtual ~PromptPort() = default;

        // A blank answer yields defaultValue, or "" when there is none
        virtual std::string ask(const std::string& message, const std::optional<std::string>& defaultValue) = 0;

        virtual void tell(const std::string& line) = 0;
    };

    class ConsolePromptPort : public PromptPort {
    public:
        ConsolePromptPort();
        ConsolePromptPort(std::istream& in, std::ostream& out);

        std::string ask(const std::string& message, const std::optional<std::string>& defaultValue) override;
        void tell(const std::string& line) override;

    private:
        std::istream& m_in;
        std::ostream& m_out;
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_PROMPT_PORT_HPP
