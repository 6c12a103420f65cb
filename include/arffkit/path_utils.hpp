#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace ak {

enum class FileFormat { ARFF, JSONL, Unknown };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.arff | .jsonl | .ndjson), case-insensitive.
FileFormat detect_format(std::string_view path);

// Create an empty, uniquely named file under the system temp directory.
// Returns the empty string on failure.
std::string make_temp_file(std::string_view prefix = "arffkit-");

}
