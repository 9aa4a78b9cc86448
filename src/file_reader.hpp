#pragma once
/*
 * FileReader
 *
 * Purpose: read file via mmap and split into lines; normalize CRLF.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 * Note: a trailing newline yields a final empty line, so joining the lines
 *       with '\n' reproduces the file (minus CRs).
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
