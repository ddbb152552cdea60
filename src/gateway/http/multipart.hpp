#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// multipart/form-data bodies as sent by browsers and curl.
namespace multipart {

struct Part {
    std::string name;
    std::string filename; // empty for plain form fields
    std::string content_type;
    std::string data;
};

// Extracts the boundary parameter; nullopt unless the type is multipart/form-data.
std::optional<std::string> boundary_from_content_type(std::string_view content_type);

std::expected<std::vector<Part>, std::string> parse(std::string_view body,
                                                    std::string_view boundary);

const Part* find(const std::vector<Part>& parts, std::string_view name);

} // namespace multipart
