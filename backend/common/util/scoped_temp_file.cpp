#include "scoped_temp_file.hpp"

#include <fstream>
#include <uuid/uuid.h>

namespace common {

std::expected<ScopedTempFile, std::string> ScopedTempFile::create(const std::filesystem::path& dir,
                                                                  const std::string& stem,
                                                                  const std::string& extension) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return std::unexpected("Cannot create temp dir " + dir.string() + ": " + ec.message());
  }

  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);

  auto path = dir / (stem + "_" + uuid_str + "_temp" + extension);
  std::ofstream touch(path, std::ios::binary | std::ios::trunc);
  if (!touch) {
    return std::unexpected("Cannot create temp file " + path.string());
  }
  return ScopedTempFile(path);
}

ScopedTempFile::~ScopedTempFile() {
  release();
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
  : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

std::uintmax_t ScopedTempFile::size() const {
  std::error_code ec;
  auto n = std::filesystem::file_size(path_, ec);
  return ec ? 0 : n;
}

void ScopedTempFile::release() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  path_.clear();
}

} // namespace common
