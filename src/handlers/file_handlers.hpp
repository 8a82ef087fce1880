#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace acpbridge::handlers {

struct FileReadResult {
    // Empty optional means the path does not exist.
    std::optional<std::string> content;
    bool exists = false;
};

// fs/read_text_file and fs/write_text_file. Paths must be absolute.
class FileHandlers {
public:
    // A missing file is not an error: content is empty and exists is false.
    // line is 1-based; limit caps the number of lines returned.
    core::errors::Result<FileReadResult> read_file(
        const std::string& path, std::optional<std::size_t> line = std::nullopt,
        std::optional<std::size_t> limit = std::nullopt) const;

    // Creates missing parent directories and overwrites existing files.
    core::errors::Result<bool> write_file(const std::string& path,
                                          const std::string& content) const;

    // Wire-level wrappers: validate params and shape the JSON result.
    core::errors::Result<nlohmann::json> handle_read_file(const nlohmann::json& params) const;
    core::errors::Result<nlohmann::json> handle_write_file(const nlohmann::json& params) const;
};

}  // namespace acpbridge::handlers
