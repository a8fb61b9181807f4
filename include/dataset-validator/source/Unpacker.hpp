#pragma once
#include "dataset-validator/export.h"

#include <filesystem>
#include <string>
#include <vector>

namespace dsvalidator {
namespace source {

/// Dataset ready to open. Owns the temporary directory (if any) that the
/// dataset was extracted into and removes it on destruction.
class DATASET_VALIDATOR_API UnpackedInput {
public:
  UnpackedInput() = default;
  UnpackedInput(std::filesystem::path dataset, std::string container,
                std::filesystem::path temp_dir = {});
  ~UnpackedInput();

  UnpackedInput(const UnpackedInput &) = delete;
  UnpackedInput &operator=(const UnpackedInput &) = delete;
  UnpackedInput(UnpackedInput &&other) noexcept;
  UnpackedInput &operator=(UnpackedInput &&other) noexcept;

  const std::filesystem::path &dataset_path() const { return dataset_; }

  /// "none", "gzip", "bzip2", "xz", "zip", "tar", "tar+gzip", ...
  const std::string &container() const { return container_; }

  bool extracted() const { return !temp_dir_.empty(); }

private:
  friend class Unpacker;

  void cleanup() noexcept;

  std::filesystem::path dataset_;
  std::string container_{"none"};
  std::filesystem::path temp_dir_;
};

/// Turns compressed files and archives into exactly one dataset path.
///
/// Plain files pass through untouched. Compressed delimited text also passes
/// through since the text reader decompresses on the fly. Other single-file
/// .gz/.bz2/.xz inputs are decompressed to a temporary directory. .zip and
/// .tar (optionally compressed) archives are extracted; the archive must
/// contain one file, or one .shp with its .shx and .dbf. Throws UnpackError.
class DATASET_VALIDATOR_API Unpacker {
public:
  static UnpackedInput prepare(const std::filesystem::path &input);

  /// Archive member names that are absolute or climb out with ".." are
  /// rejected
  static bool is_safe_member_path(const std::string &name);
};

} // namespace source
} // namespace dsvalidator
