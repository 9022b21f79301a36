#pragma once

#include <string>
#include <string_view>

namespace bfwalk {

bool isInstruction(char c) noexcept;

// Drops every byte outside +-<>[].,
std::string stripSource(std::string_view code);

// Reads a program file, through a read-only mapping when possible.
// Returns true on success; on error, 'err' is set and 'out' left unchanged.
bool loadSource(const std::string& path, std::string& out, std::string& err, bool strip = false);

}  // namespace bfwalk
