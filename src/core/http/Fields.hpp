#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace minnow {

using Bytes = std::vector<std::uint8_t>;

// field name -> values in arrival order
using FieldMap = std::map<std::string, std::vector<std::string>>;

struct FileRecord {
    std::string filename;
    std::string content_type;
    std::string data;  // raw payload, not necessarily text

    bool operator==(const FileRecord&) const = default;
};

using FileMap = std::map<std::string, FileRecord>;

using Header = std::pair<std::string, std::string>;
using HeaderList = std::vector<Header>;

// Case-insensitive header lookup. Returns the first match.
std::optional<std::string_view> find_header(const HeaderList& headers, std::string_view name);

bool has_header(const HeaderList& headers, std::string_view name);

std::string_view trim(std::string_view s) noexcept;

}  // namespace minnow
