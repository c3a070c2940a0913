#pragma once

#include <string>

// Installs the "cryptotrack" logger on stderr as the spdlog default.
void setup_logging(const std::string& log_level);
