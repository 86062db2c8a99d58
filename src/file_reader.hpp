#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file and split it into lines; bytes are kept as-is.
 * Usage: read_lines(path, out_lines, msg); returns false with msg on failure.
 */
#include <vector>
#include <string>
#include <filesystem>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg);

/* split text on '\n' only; '\r' stays part of the line so writing back is lossless */
void split_lines(const char* data, size_t n, std::vector<std::string>& out_lines);
