#pragma once
#include <string>
#include <vector>

struct Path {
    std::vector<std::string> segments;
    bool absolute = false;
    bool trailingSlash = false;   // "dir/" must name a directory
};

inline std::vector<std::string> splitPath(const std::string& p) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c: p) {
        if (c=='/') {
            if (!cur.empty()) { parts.push_back(cur); cur.clear(); }
        } else cur.push_back(c);
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

inline Path parsePath(const std::string& text) {
    Path p;
    p.segments = splitPath(text);
    p.absolute = !text.empty() && text.front() == '/';
    p.trailingSlash = !p.segments.empty() && text.back() == '/';
    return p;
}
