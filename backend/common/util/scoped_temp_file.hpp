#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace common {

// Exclusively owned temporary file. The file is removed when the owner goes
// away; ownership moves but is never shared.
class ScopedTempFile {
public:
  static std::expected<ScopedTempFile, std::string> create(const std::filesystem::path& dir,
                                                           const std::string& stem,
                                                           const std::string& extension);

  ScopedTempFile() = default;
  ~ScopedTempFile();

  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;
  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  const std::filesystem::path& path() const { return path_; }
  bool empty() const { return path_.empty(); }
  std::uintmax_t size() const;

  // Deletes the file now. Safe to call more than once.
  void release();

private:
  explicit ScopedTempFile(std::filesystem::path path) : path_(std::move(path)) {}

  std::filesystem::path path_;
};

} // namespace common
