#include "CommandParser.hpp"
#include "Errors.hpp"

#include <cctype>

namespace CommandParser {

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool inToken = false;
    bool inQuote = false;

    for (char c : line) {
        if (inQuote) {
            if (c == '"') inQuote = false;
            else          cur.push_back(c);
            continue;
        }
        if (c == '"') {
            inQuote = true;
            inToken = true;   // "" still yields an (empty) token
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (inToken) {
                out.push_back(cur);
                cur.clear();
                inToken = false;
            }
        } else {
            cur.push_back(c);
            inToken = true;
        }
    }
    throwIf(inQuote, ErrorCode::UnterminatedQuote, line);
    if (inToken) out.push_back(cur);
    return out;
}

std::optional<Command> parse(const std::string& line) {
    auto first = line.find_first_not_of(" \t\r\n\v\f");
    if (first == std::string::npos || line[first] == '#') return std::nullopt;

    auto tokens = tokenize(line);
    if (tokens.empty()) return std::nullopt;

    Command cmd;
    cmd.name = tokens.front();
    cmd.args.assign(tokens.begin() + 1, tokens.end());
    return cmd;
}

}
