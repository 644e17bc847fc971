#include "execution_strategy.hpp"

namespace svckit {

namespace {
std::string quote_word(const std::string& word) {
    if (!word.empty() && word.find_first_of(" \t\"") == std::string::npos)
        return word;
    std::string out = "\"";
    for (char c : word) {
        if (c == '"')
            out += "\\\"";
        else
            out += c;
    }
    out += "\"";
    return out;
}
} // namespace

std::string LaunchCommand::command_line(const std::string& verb) const {
    std::string out;
    if (!interpreter.empty())
        out += "\"" + interpreter + "\" ";
    out += "\"" + program + "\"";
    if (!verb.empty())
        out += " " + verb;
    for (const auto& arg : args)
        out += " " + quote_word(arg);
    return out;
}

} // namespace svckit
