#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file via mmap; optionally split into lines with CRLF normalized.
 * Usage: mmap_read_file(path, out, msg) / mmap_readlines(path, lines, msg); false + msg on failure.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_read_file(const std::filesystem::path& path, std::string& out, std::string& msg);

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
