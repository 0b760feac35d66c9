#pragma once
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace tcplat {
// Creates an empty file at path if none exists; existing contents are untouched.
bool ensure_file(const std::string& path);

bool file_length(const std::string& path, uint64_t& len);

bool read_json(const std::string& path, nlohmann::json& out);

// Replaces the file with doc: written to "<path>.tmp", fsynced, then renamed over path,
// so readers see either the old document or the new one.
bool overwrite_json(const std::string& path, const nlohmann::json& doc);
}  // namespace tcplat
