#pragma once
#include "dataset-validator/Template.hpp"
#include "dataset-validator/export.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dsvalidator {

struct TemplateIndexEntry {
  std::string template_id;
  std::string version;
  std::filesystem::path path;
  std::optional<std::string> label;
  std::vector<std::string> aliases;
};

/// Resolves templates by id and version across search directories.
///
/// Search order: the directories given to the constructor, then the
/// `DS_TEMPLATES_DIR` environment variable (':'-separated). Within the
/// directories an `index.json` entry (id, then alias) is tried first, then a
/// direct `<template_id>.json`, then a scan of every `*.json` file.
class DATASET_VALIDATOR_API TemplateRegistry {
public:
  explicit TemplateRegistry(std::vector<std::string> search_dirs,
                            bool use_environment = true);

  /// Load the template; highest semantic version wins when version is
  /// not given. Throws TemplateLoadError.
  Template resolve(const std::string &template_id,
                   const std::optional<std::string> &version = std::nullopt) const;

  /// Entries of every index.json; first occurrence of (id, version) wins
  std::vector<TemplateIndexEntry> list_templates() const;

  const std::vector<std::filesystem::path> &search_dirs() const {
    return search_dirs_;
  }

private:
  std::vector<std::filesystem::path> search_dirs_;

  std::vector<TemplateIndexEntry>
  read_index(const std::filesystem::path &dir) const;
};

/// Compare major.minor.patch versions; missing or non-numeric parts count
/// as zero. Returns <0, 0 or >0.
DATASET_VALIDATOR_API int compare_versions(const std::string &a,
                                           const std::string &b);

} // namespace dsvalidator
