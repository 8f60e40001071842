#pragma once

#include <filesystem>

// creates the directory and checks it is writable; throws when it cannot be used
void uptimeping_data_dir_prepare(std::filesystem::path const &dir);
