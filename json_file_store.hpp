#pragma once

#include <json/json.h>

#include <filesystem>
#include <string>

// Every durable write and read of the persisted JSON files goes through these
// two functions, serialized by one lock shared across all files. Writes
// truncate in place; a crash mid-write can leave a partial file behind, which
// the next json_file_load treats as malformed.

// returns false, after logging, when the file could not be written
bool json_file_save(std::filesystem::path const &path, std::string const &contents);

// missing file or unreadable content yields default_value; malformed content also logs a warning
Json::Value json_file_load(std::filesystem::path const &path, Json::Value default_value = Json::Value(Json::objectValue));
