#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <cstdlib>

namespace utils {

// Wraps a value in single quotes for a POSIX shell.
inline std::string shellQuote(const std::string& str) {
    std::string result = "'";
    for (char c : str) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

inline std::string trim(const std::string& str) {
    size_t begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

inline std::string xmlEscape(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default:   result += c; break;
        }
    }
    return result;
}

inline std::string xmlUnescape(const std::string& str) {
    static const std::pair<const char*, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}
    };
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        bool replaced = false;
        if (str[i] == '&') {
            for (const auto& entity : entities) {
                std::string name(entity.first);
                if (str.compare(i, name.size(), name) == 0) {
                    result += entity.second;
                    i += name.size() - 1;
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            result += str[i];
        }
    }
    return result;
}

inline std::string expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

inline std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

} // namespace utils
