#pragma once

#include <string>

// Installs the default logger: colored stdout plus an optional file sink
void setup_logging(const std::string& service_name, const std::string& log_level, const std::string& log_file);
