#pragma once

#include <optional>
#include <string>
#include <vector>

// Runs argv (searched on PATH, no shell) with stdin and stderr on /dev/null and
// returns everything it wrote to stdout. When the child is still running after
// budget_seconds it is killed and nullopt is returned. Throws errno_exception
// when the child cannot be started.
std::optional<std::string> command_output_with_deadline(std::vector<std::string> const &argv, double budget_seconds);
