#include "util.h"

#include <array>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace stackctl {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

std::string util_load_text_file(std::filesystem::path const &path) {
  std::ifstream in{ path, std::ios::binary };
  if (!in) {
    throw std::runtime_error("util_load_text_file: failed to open file: " + path.string());
  }

  std::string content{ std::istreambuf_iterator<char>{ in },
                       std::istreambuf_iterator<char>{} };
  if (in.bad()) {
    throw std::runtime_error("util_load_text_file: failed to read file: " + path.string());
  }
  return content;
}

std::string_view util_trim(std::string_view text) {
  constexpr std::string_view kWhitespace{ " \t\r\n" };
  auto const first{ text.find_first_not_of(kWhitespace) };
  if (first == std::string_view::npos) { return {}; }
  auto const last{ text.find_last_not_of(kWhitespace) };
  return text.substr(first, last - first + 1);
}

std::vector<std::string> util_split(std::string_view text, char delim) {
  std::vector<std::string> parts;
  size_t start{ 0 };
  while (true) {
    auto const pos{ text.find(delim, start) };
    if (pos == std::string_view::npos) {
      parts.emplace_back(text.substr(start));
      break;
    }
    parts.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string util_join(std::vector<std::string> const &parts, std::string_view sep) {
  std::string out;
  for (size_t i{ 0 }; i < parts.size(); ++i) {
    if (i) { out.append(sep); }
    out.append(parts[i]);
  }
  return out;
}

std::string util_make_uuid() {
  thread_local std::mt19937_64 rng{ std::random_device{}() };

  std::array<unsigned char, 16> bytes{};
  for (size_t i{ 0 }; i < bytes.size(); i += 8) {
    auto const word{ rng() };
    for (size_t j{ 0 }; j < 8; ++j) {
      bytes[i + j] = static_cast<unsigned char>((word >> (j * 8)) & 0xff);
    }
  }

  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);  // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);  // RFC 4122 variant

  std::string const hex{ util_bytes_to_hex(bytes.data(), bytes.size()) };
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace stackctl
