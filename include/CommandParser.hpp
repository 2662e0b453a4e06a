#pragma once
#include <optional>
#include <string>
#include <vector>

struct Command {
    std::string name;
    std::vector<std::string> args;
};

namespace CommandParser {

// Splits one raw line into a command and its arguments. Double quotes
// group text into a token; there is no escape character. Blank and
// comment ("#...") lines give nullopt. Throws UnterminatedQuote.
[[nodiscard("check parsed command")]] std::optional<Command> parse(const std::string& line);

[[nodiscard("use tokens")]] std::vector<std::string> tokenize(const std::string& line);

}
