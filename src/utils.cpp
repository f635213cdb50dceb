#include "utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& bytes) {
  std::ostringstream oss;
  for(auto c : bytes) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string& data) {
  std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
  return out;
}

std::string sha256_hex(const std::string& data) {
  return hex_from_bytes(sha256_bytes(data));
}

std::string sha256_file_hex(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) throw std::runtime_error("Unable to open " + path.string());

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  std::vector<char> buffer(64 * 1024);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  if(in.bad()) throw std::runtime_error("Read error on " + path.string());

  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  digest.resize(length);
  return hex_from_bytes(digest);
}

std::vector<unsigned char> random_bytes(std::size_t count) {
  std::vector<unsigned char> out(count);
  if(count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

std::string random_token(std::size_t bytes) {
  return hex_from_bytes(random_bytes(bytes));
}

std::string random_uuid() {
  auto b = random_bytes(16);
  b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
  b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);
  auto hex = hex_from_bytes(b);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20);
}

std::uint64_t unix_now_secs() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

std::uint64_t unix_now_millis() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string iso8601_from_secs(std::uint64_t secs) {
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string trim(const std::string& value) {
  auto begin = std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); });
  auto end = std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base();
  if(begin >= end) return std::string();
  return std::string(begin, end);
}
