#include "multipart.hpp"

#include <algorithm>
#include <cctype>

namespace multipart {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

std::string unquote(std::string_view s) {
    s = trim(s);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return std::string(s);
}

// Iterates "key=value" parameters of a header value like
// form-data; name="file"; filename="a.wav"
template <typename F>
void for_each_param(std::string_view value, F&& fn) {
    while (!value.empty()) {
        auto semi = value.find(';');
        auto item = trim(value.substr(0, semi));
        auto eq = item.find('=');
        if (eq != std::string_view::npos) {
            fn(trim(item.substr(0, eq)), unquote(item.substr(eq + 1)));
        }
        if (semi == std::string_view::npos) break;
        value.remove_prefix(semi + 1);
    }
}

void parse_headers(std::string_view block, Part& part) {
    while (!block.empty()) {
        auto eol = block.find("\r\n");
        auto line = block.substr(0, eol);
        auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            auto name = trim(line.substr(0, colon));
            auto value = trim(line.substr(colon + 1));
            if (iequals(name, "Content-Disposition")) {
                for_each_param(value, [&part](std::string_view key, std::string val) {
                    if (iequals(key, "name")) part.name = std::move(val);
                    else if (iequals(key, "filename")) part.filename = std::move(val);
                });
            } else if (iequals(name, "Content-Type")) {
                part.content_type = std::string(value);
            }
        }
        if (eol == std::string_view::npos) break;
        block.remove_prefix(eol + 2);
    }
}

} // namespace

std::optional<std::string> boundary_from_content_type(std::string_view content_type) {
    auto semi = content_type.find(';');
    if (!iequals(trim(content_type.substr(0, semi)), "multipart/form-data")) {
        return std::nullopt;
    }
    if (semi == std::string_view::npos) return std::nullopt;

    std::optional<std::string> boundary;
    for_each_param(content_type.substr(semi + 1), [&boundary](std::string_view key, std::string val) {
        if (iequals(key, "boundary") && !val.empty()) boundary = std::move(val);
    });
    return boundary;
}

std::expected<std::vector<Part>, std::string> parse(std::string_view body,
                                                    std::string_view boundary) {
    if (boundary.empty()) return std::unexpected("empty boundary");

    const std::string delimiter = "--" + std::string(boundary);
    const std::string separator = "\r\n" + delimiter;

    auto pos = body.find(delimiter);
    if (pos == std::string_view::npos) return std::unexpected("boundary not found in body");

    std::vector<Part> parts;
    while (true) {
        pos += delimiter.size();
        if (body.substr(pos, 2) == "--") return parts;
        if (body.substr(pos, 2) != "\r\n") return std::unexpected("malformed boundary line");
        pos += 2;

        auto headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string_view::npos) {
            return std::unexpected("unterminated part headers");
        }

        Part part;
        parse_headers(body.substr(pos, headers_end - pos), part);

        auto data_start = headers_end + 4;
        auto next = body.find(separator, data_start);
        if (next == std::string_view::npos) return std::unexpected("missing closing boundary");

        part.data = std::string(body.substr(data_start, next - data_start));
        parts.push_back(std::move(part));
        pos = next + 2;
    }
}

const Part* find(const std::vector<Part>& parts, std::string_view name) {
    auto it = std::ranges::find_if(parts, [name](const Part& p) { return p.name == name; });
    return it != parts.end() ? &*it : nullptr;
}

} // namespace multipart
