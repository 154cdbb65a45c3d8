#pragma once

#include <string>
#include <vector>

namespace platform {

std::string config_dir();
std::string data_dir();

// Directory holding the running executable, empty if it cannot be resolved.
std::string executable_dir();

// Candidate locations of the .env credential file, in lookup order.
std::vector<std::string> credential_candidates();

} // namespace platform
