#include "handlers/file_handlers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace acpbridge::handlers {

using core::errors::invalid_params;
using core::errors::invalid_state;
using nlohmann::json;

namespace {

core::errors::Result<std::filesystem::path> require_absolute(const std::string& path) {
    const std::filesystem::path candidate(path);
    if (!candidate.is_absolute()) {
        return invalid_params("Path must be absolute: " + path);
    }
    return candidate;
}

std::optional<std::size_t> optional_count(const json& params, const char* key) {
    const auto it = params.find(key);
    if (it == params.end() || !it->is_number_integer() || it->get<long long>() < 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it->get<long long>());
}

std::string slice_lines(const std::string& text, const std::optional<std::size_t> line,
                        const std::optional<std::size_t> limit) {
    const std::size_t first = line.value_or(1) == 0 ? 0 : line.value_or(1) - 1;
    std::istringstream in(text);
    std::ostringstream out;
    std::string current;
    std::size_t index = 0;
    std::size_t taken = 0;
    while (std::getline(in, current)) {
        if (index++ < first) {
            continue;
        }
        if (limit.has_value() && taken >= *limit) {
            break;
        }
        out << current;
        if (!in.eof()) {
            out << "\n";
        }
        ++taken;
    }
    return out.str();
}

}  // namespace

core::errors::Result<FileReadResult> FileHandlers::read_file(
    const std::string& path, const std::optional<std::size_t> line,
    const std::optional<std::size_t> limit) const {
    auto resolved = require_absolute(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return FileReadResult{std::nullopt, false};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return invalid_state("Path is not a file: " + path, "not_a_file");
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return core::errors::internal("Failed to open file: " + path, "read_failed");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return core::errors::internal("I/O error while reading file: " + path,
                                      "read_failed");
    }

    if (line.has_value() || limit.has_value()) {
        return FileReadResult{slice_lines(buffer.str(), line, limit), true};
    }
    return FileReadResult{buffer.str(), true};
}

core::errors::Result<bool> FileHandlers::write_file(const std::string& path,
                                                    const std::string& content) const {
    auto resolved = require_absolute(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return invalid_state("Path is a directory: " + path, "is_a_directory");
    }

    const auto parent = file_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return core::errors::internal(
                "Failed to create parent directories for " + path + ": " + ec.message(),
                "write_failed");
        }
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return core::errors::internal("Failed to open file for writing: " + path,
                                      "write_failed");
    }
    out << content;
    out.flush();
    if (!out.good()) {
        return core::errors::internal("I/O error while writing file: " + path,
                                      "write_failed");
    }
    return true;
}

core::errors::Result<json> FileHandlers::handle_read_file(const json& params) const {
    if (!params.is_object() || !params.contains("path")) {
        return invalid_params("Missing required parameter: path");
    }
    if (!params.at("path").is_string()) {
        return invalid_params("path must be a string");
    }

    auto read = read_file(params.at("path").get<std::string>(),
                          optional_count(params, "line"), optional_count(params, "limit"));
    if (core::errors::is_error(read)) {
        return core::errors::get_error(read);
    }
    const auto& result = core::errors::get_value(read);
    json payload;
    payload["content"] = result.content.has_value() ? json(*result.content) : json(nullptr);
    payload["exists"] = result.exists;
    return payload;
}

core::errors::Result<json> FileHandlers::handle_write_file(const json& params) const {
    if (!params.is_object() || !params.contains("path")) {
        return invalid_params("Missing required parameter: path");
    }
    if (!params.contains("content")) {
        return invalid_params("Missing required parameter: content");
    }
    if (!params.at("path").is_string() || !params.at("content").is_string()) {
        return invalid_params("path and content must be strings");
    }

    auto written = write_file(params.at("path").get<std::string>(),
                              params.at("content").get<std::string>());
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return json{{"success", true}};
}

}  // namespace acpbridge::handlers
