#include "build_context.h"

#include "errors.h"
#include "util.h"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace stackctl {
namespace {

la_ssize_t append_to_string(archive *, void *client_data, void const *buffer, size_t length) {
  static_cast<std::string *>(client_data)->append(static_cast<char const *>(buffer), length);
  return static_cast<la_ssize_t>(length);
}

struct archive_memory_writer : unmovable {
  explicit archive_memory_writer(std::string &out) : handle(archive_write_new()) {
    if (!handle) { throw stack_error("archive_write_new failed"); }
    if (archive_write_set_format_pax_restricted(handle) != ARCHIVE_OK ||
        archive_write_add_filter_none(handle) != ARCHIVE_OK ||
        archive_write_set_bytes_in_last_block(handle, 1) != ARCHIVE_OK ||
        archive_write_open(handle, &out, nullptr, append_to_string, nullptr) != ARCHIVE_OK) {
      std::string const msg{ archive_error_string(handle) ? archive_error_string(handle)
                                                          : "unknown error" };
      archive_write_free(handle);
      throw stack_error("Failed to open tar writer: " + msg);
    }
  }

  ~archive_memory_writer() {
    if (handle) { archive_write_free(handle); }
  }

  void close() {
    if (archive_write_close(handle) != ARCHIVE_OK) {
      throw stack_error(std::string("Failed to finish tar: ") + archive_error_string(handle));
    }
  }

  archive *handle{ nullptr };
};

struct entry_deleter {
  void operator()(archive_entry *e) const { archive_entry_free(e); }
};

void write_entry(archive *a,
                 std::filesystem::path const &full,
                 std::string const &relative,
                 std::filesystem::file_status const &status) {
  std::unique_ptr<archive_entry, entry_deleter> entry{ archive_entry_new() };
  if (!entry) { throw stack_error("archive_entry_new failed"); }

  archive_entry_copy_pathname(entry.get(), relative.c_str());
  archive_entry_set_perm(entry.get(),
                         static_cast<__LA_MODE_T>(status.permissions()) & 07777);

  std::string content;
  if (std::filesystem::is_directory(status)) {
    archive_entry_set_filetype(entry.get(), AE_IFDIR);
  } else if (std::filesystem::is_symlink(status)) {
    archive_entry_set_filetype(entry.get(), AE_IFLNK);
    archive_entry_copy_symlink(entry.get(), std::filesystem::read_symlink(full).string().c_str());
  } else {
    content = util_load_text_file(full);
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(content.size()));
  }

  if (int const r{ archive_write_header(a, entry.get()) }; r != ARCHIVE_OK && r != ARCHIVE_WARN) {
    throw stack_error(std::string("Failed to write tar header for ") + relative + ": " +
                      archive_error_string(a));
  }

  if (!content.empty() &&
      archive_write_data(a, content.data(), content.size()) < 0) {
    throw stack_error(std::string("Failed to write tar data for ") + relative + ": " +
                      archive_error_string(a));
  }

  if (archive_write_finish_entry(a) != ARCHIVE_OK) {
    throw stack_error(std::string("Failed to finish tar entry ") + relative + ": " +
                      archive_error_string(a));
  }
}

}  // namespace

std::string build_context_tar(std::filesystem::path const &context_dir) {
  if (!std::filesystem::is_directory(context_dir)) {
    throw stack_error("build context is not a directory: " + context_dir.string());
  }

  std::vector<std::filesystem::directory_entry> entries;
  for (auto const &entry : std::filesystem::recursive_directory_iterator(context_dir)) {
    entries.push_back(entry);
  }
  std::sort(entries.begin(), entries.end(), [](auto const &a, auto const &b) {
    return a.path() < b.path();
  });

  std::string out;
  archive_memory_writer writer{ out };
  for (auto const &entry : entries) {
    auto const relative{ entry.path().lexically_relative(context_dir).generic_string() };
    write_entry(writer.handle, entry.path(), relative, entry.symlink_status());
  }
  writer.close();
  return out;
}

}  // namespace stackctl
