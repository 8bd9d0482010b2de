#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <fstream>

std::string read_from_file(const std::string& path);
std::string encode_base64(std::string_view data);
