#include "util.h"

#include <array>
#include <cstdio>
#include <stdexcept>

namespace tfx {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_read_stdin() {
  std::string out;
  std::array<char, 64 * 1024> chunk{};
  while (true) {
    size_t const n{ std::fread(chunk.data(), 1, chunk.size(), stdin) };
    out.append(chunk.data(), n);
    if (n < chunk.size()) {
      if (std::ferror(stdin)) { throw std::runtime_error("util_read_stdin: read failed"); }
      break;
    }
  }
  return out;
}

void util_write_file(std::filesystem::path const &path, std::string_view contents) {
  auto file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::runtime_error("util_write_file: failed to open file: " + path.string());
  }

  if (!contents.empty() &&
      std::fwrite(contents.data(), 1, contents.size(), file.get()) != contents.size()) {
    throw std::runtime_error("util_write_file: failed to write file: " + path.string());
  }

  if (std::fclose(file.release()) != 0) {
    throw std::runtime_error("util_write_file: failed to close file: " + path.string());
  }
}

}  // namespace tfx
