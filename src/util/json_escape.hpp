// src/util/json_escape.hpp
#pragma once
#include <fmt/format.h>
#include <iterator>
#include <string>
#include <string_view>

namespace repcat {

// JSON string escaper for paths in run.json. Control characters and DEL
// go out as \u00XX; every other byte passes through unchanged.
inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 8);
    for (unsigned char c : in) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20 || c == 0x7f)
                    fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned>(c));
                else
                    out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

}
