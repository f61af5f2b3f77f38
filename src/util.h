#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace stackctl {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Load entire file into a string.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_text_file(std::filesystem::path const &path);

// Strip leading/trailing spaces, tabs, CR and LF.
std::string_view util_trim(std::string_view text);

// Split on a single delimiter. Empty fields are preserved ("a,,b" -> {"a", "", "b"}).
std::vector<std::string> util_split(std::string_view text, char delim);

// Join with a separator; empty input yields an empty string.
std::string util_join(std::vector<std::string> const &parts, std::string_view sep);

// Random RFC 4122 version-4 UUID in canonical lowercase 8-4-4-4-12 form.
std::string util_make_uuid();

// Removes the owned path (recursively) on destruction unless released.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace stackctl
