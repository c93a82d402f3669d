/*
 * script_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "script_adapter.hpp"

#include <cctype>
#include <optional>
#include <unordered_map>

namespace warden::sandbox::interpreter {

namespace {

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

const std::unordered_map<std::string_view, std::string_view>& wordRewrites() {
    static const std::unordered_map<std::string_view, std::string_view> rewrites = {
        {"println", "print"}, {"true", "True"}, {"false", "False"}, {"null", "None"}};
    return rewrites;
}

/// Length of a leading "val " / "var " keyword followed by an identifier
std::size_t declarationKeyword(std::string_view code) {
    for (std::string_view keyword : {"val", "var"}) {
        if (code.size() > keyword.size() + 1 && code.starts_with(keyword) &&
            std::isspace(static_cast<unsigned char>(code[keyword.size()]))) {
            auto rest = code.find_first_not_of(" \t", keyword.size());
            if (rest != std::string_view::npos && isIdentifierStart(code[rest])) {
                return rest;
            }
        }
    }
    return 0;
}

class Adapter {
public:
    std::string run(std::string_view source) {
        std::size_t lineStart = 0;
        while (lineStart <= source.size()) {
            auto lineEnd = source.find('\n', lineStart);
            bool last = lineEnd == std::string_view::npos;
            auto line = source.substr(lineStart, last ? std::string_view::npos
                                                      : lineEnd - lineStart);
            adaptLine(line);
            if (last) {
                break;
            }
            output_.push_back('\n');
            lineStart = lineEnd + 1;
        }
        return std::move(output_);
    }

private:
    void adaptLine(std::string_view line) {
        std::size_t position = 0;

        if (!tripleQuote_) {
            auto indent = line.find_first_not_of(" \t");
            if (indent == std::string_view::npos) {
                output_.append(line);
                return;
            }
            output_.append(line.substr(0, indent));
            position = indent;

            auto code = line.substr(indent);
            if (code.starts_with("//")) {
                output_.push_back('#');
                output_.append(code.substr(2));
                return;
            }
            position += declarationKeyword(code);
        }

        std::size_t lineOutputStart = output_.size();
        std::optional<std::size_t> lastCodeChar;

        while (position < line.size()) {
            if (tripleQuote_) {
                position = copyTripleQuoted(line, position);
                continue;
            }

            char c = line[position];
            if (c == '#') {
                output_.append(line.substr(position));
                break;
            }
            if (c == '"' || c == '\'') {
                std::string_view triple = c == '"' ? "\"\"\"" : "'''";
                if (line.substr(position).starts_with(triple)) {
                    tripleQuote_ = c;
                    output_.append(triple);
                    position = copyTripleQuoted(line, position + 3);
                } else {
                    position = copyQuoted(line, position, c);
                }
                lastCodeChar = output_.size() - 1;
                continue;
            }
            if (isIdentifierStart(c) &&
                (position == 0 || !isIdentifierChar(line[position - 1]))) {
                auto end = position;
                while (end < line.size() && isIdentifierChar(line[end])) {
                    ++end;
                }
                auto word = line.substr(position, end - position);
                auto it = wordRewrites().find(word);
                output_.append(it != wordRewrites().end() ? it->second : word);
                lastCodeChar = output_.size() - 1;
                position = end;
                continue;
            }

            output_.push_back(c);
            if (!std::isspace(static_cast<unsigned char>(c))) {
                lastCodeChar = output_.size() - 1;
            }
            ++position;
        }

        // A statement terminator on code (not inside a string or comment)
        if (!tripleQuote_ && lastCodeChar && *lastCodeChar >= lineOutputStart &&
            output_[*lastCodeChar] == ';' &&
            output_.find('#', *lastCodeChar) == std::string::npos) {
            output_.erase(*lastCodeChar, 1);
        }
    }

    std::size_t copyQuoted(std::string_view line, std::size_t position, char quote) {
        output_.push_back(quote);
        ++position;
        while (position < line.size()) {
            char c = line[position];
            output_.push_back(c);
            ++position;
            if (c == '\\' && position < line.size()) {
                output_.push_back(line[position]);
                ++position;
            } else if (c == quote) {
                break;
            }
        }
        return position;
    }

    std::size_t copyTripleQuoted(std::string_view line, std::size_t position) {
        const std::string closing(3, *tripleQuote_);
        while (position < line.size()) {
            if (line[position] == '\\' && position + 1 < line.size()) {
                output_.append(line.substr(position, 2));
                position += 2;
                continue;
            }
            if (line.substr(position).starts_with(closing)) {
                output_.append(closing);
                tripleQuote_.reset();
                return position + 3;
            }
            output_.push_back(line[position]);
            ++position;
        }
        return position;
    }

    std::string output_;
    std::optional<char> tripleQuote_;
};

}  // namespace

std::string ScriptAdapter::adapt(std::string_view source) {
    return Adapter{}.run(source);
}

}  // namespace warden::sandbox::interpreter
