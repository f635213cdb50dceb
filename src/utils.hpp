#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>& bytes);
std::vector<unsigned char> sha256_bytes(const std::string& data);
std::string sha256_hex(const std::string& data);

// Streams the file through SHA-256. Throws std::runtime_error when it cannot be read.
std::string sha256_file_hex(const std::filesystem::path& path);

// Cryptographically random bytes from OpenSSL. Throws std::runtime_error if the
// generator is not seeded.
std::vector<unsigned char> random_bytes(std::size_t count);
std::string random_token(std::size_t bytes = 16);
std::string random_uuid();

std::uint64_t unix_now_secs();
std::uint64_t unix_now_millis();
std::string iso8601_from_secs(std::uint64_t secs);

std::string trim(const std::string& value);
