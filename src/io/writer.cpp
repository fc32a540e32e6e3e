#include "dotenv/io/writer.hpp"
#include "dotenv/core/logger.hpp"

#include <fstream>

namespace dotenv::io {

auto needs_quoting(std::string_view value) -> bool {
    return value.find_first_of(" \t\n\r\"'\\#$") != std::string_view::npos;
}

auto quote_value(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\t': out += "\\t";  break;
            case '\r': out += "\\r";  break;
            default:   out += c;      break;
        }
    }
    out += '"';
    return out;
}

auto render_value(std::string_view value) -> std::string {
    if (!needs_quoting(value)) {
        return std::string(value);
    }
    // Double quotes would let the parser expand $NAME again; single quotes
    // keep the text verbatim as long as it has no single quote of its own.
    if (value.find('$') != std::string_view::npos &&
        value.find('\'') == std::string_view::npos) {
        return "'" + std::string(value) + "'";
    }
    return quote_value(value);
}

auto serialize(const EnvMap& vars) -> std::string {
    std::string out;
    // EnvMap is ordered, so the output is sorted by key.
    for (const auto& [key, value] : vars) {
        out += key;
        out += '=';
        out += render_value(value);
        out += '\n';
    }
    return out;
}

auto write_file(const std::filesystem::path& path, const EnvMap& vars) -> VoidResult {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "cannot open file for writing", path.string()));
    }

    file << serialize(vars);
    file.close();
    if (!file) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "failed to write file", path.string()));
    }

    LOG_DEBUG("Wrote {} variables to {}", vars.size(), path.string());
    return {};
}

} // namespace dotenv::io
