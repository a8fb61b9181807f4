#include "dataset-validator/TemplateRegistry.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Logger.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace dsvalidator {

namespace {

std::array<long, 3> version_tuple(const std::string &version) {
  std::array<long, 3> out{0, 0, 0};
  std::stringstream ss(version);
  std::string part;
  for (size_t i = 0; i < out.size() && std::getline(ss, part, '.'); ++i) {
    char *end = nullptr;
    long v = std::strtol(part.c_str(), &end, 10);
    out[i] = (end && *end == '\0' && !part.empty()) ? v : 0;
  }
  return out;
}

std::optional<nlohmann::json> read_json(const fs::path &path) {
  std::ifstream file(path);
  if (!file)
    return std::nullopt;
  try {
    return nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error &e) {
    LOG_WARN("REGISTRY", "SCAN", "Skipping unparsable {}: {}", path.string(),
             e.what());
    return std::nullopt;
  }
}

struct Candidate {
  fs::path path;
  nlohmann::json doc;
};

} // namespace

int compare_versions(const std::string &a, const std::string &b) {
  auto ta = version_tuple(a);
  auto tb = version_tuple(b);
  if (ta < tb)
    return -1;
  if (tb < ta)
    return 1;
  return 0;
}

TemplateRegistry::TemplateRegistry(std::vector<std::string> search_dirs,
                                   bool use_environment) {
  for (auto &dir : search_dirs) {
    if (!dir.empty())
      search_dirs_.emplace_back(dir);
  }
  if (use_environment) {
    if (const char *env = std::getenv("DS_TEMPLATES_DIR")) {
      std::stringstream ss(env);
      std::string dir;
      while (std::getline(ss, dir, ':')) {
        if (!dir.empty())
          search_dirs_.emplace_back(dir);
      }
    }
  }
}

std::vector<TemplateIndexEntry>
TemplateRegistry::read_index(const fs::path &dir) const {
  std::vector<TemplateIndexEntry> entries;
  auto index = read_json(dir / "index.json");
  if (!index || !index->is_object() || !index->contains("templates") ||
      !(*index)["templates"].is_array())
    return entries;

  for (const auto &t : (*index)["templates"]) {
    if (!t.is_object() || !t.contains("template_id") || !t.contains("path"))
      continue;
    TemplateIndexEntry entry;
    entry.template_id = t.value("template_id", std::string());
    entry.version = t.value("version", std::string());
    entry.path = dir / t.value("path", std::string());
    if (t.contains("label") && t["label"].is_string())
      entry.label = t["label"].get<std::string>();
    if (t.contains("aliases") && t["aliases"].is_array()) {
      for (const auto &a : t["aliases"]) {
        if (a.is_string())
          entry.aliases.push_back(a.get<std::string>());
      }
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

Template
TemplateRegistry::resolve(const std::string &template_id,
                          const std::optional<std::string> &version) const {
  std::vector<Candidate> candidates;
  std::set<fs::path> seen;

  auto add_candidate = [&](const fs::path &path, bool require_id_match) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec)
      canonical = path;
    if (seen.count(canonical))
      return;
    auto doc = read_json(path);
    if (!doc || !doc->is_object())
      return;
    if (require_id_match &&
        doc->value("template_id", std::string()) != template_id)
      return;
    seen.insert(canonical);
    candidates.push_back({path, std::move(*doc)});
  };

  // 1) index.json by id, then by alias
  for (const auto &dir : search_dirs_) {
    auto entries = read_index(dir);
    for (const auto &entry : entries) {
      if (entry.template_id == template_id && fs::exists(entry.path))
        add_candidate(entry.path, false);
    }
    for (const auto &entry : entries) {
      if (std::find(entry.aliases.begin(), entry.aliases.end(), template_id) !=
              entry.aliases.end() &&
          fs::exists(entry.path))
        add_candidate(entry.path, false);
    }
  }

  // 2) direct <template_id>.json
  for (const auto &dir : search_dirs_) {
    fs::path direct = dir / (template_id + ".json");
    if (fs::exists(direct))
      add_candidate(direct, true);
  }

  auto has_version_match = [&]() {
    if (!version)
      return !candidates.empty();
    return std::any_of(candidates.begin(), candidates.end(),
                       [&](const Candidate &c) {
                         return c.doc.value("version", std::string()) ==
                                *version;
                       });
  };

  // 3) scan all json files
  if (!has_version_match()) {
    for (const auto &dir : search_dirs_) {
      std::error_code ec;
      if (!fs::is_directory(dir, ec))
        continue;
      std::vector<fs::path> files;
      for (const auto &entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json" &&
            entry.path().filename() != "index.json")
          files.push_back(entry.path());
      }
      std::sort(files.begin(), files.end());
      for (const auto &file : files)
        add_candidate(file, true);
    }
  }

  if (candidates.empty()) {
    std::string dirs;
    for (const auto &d : search_dirs_)
      dirs += (dirs.empty() ? "" : ", ") + d.string();
    throw TemplateLoadError("Template '" + template_id +
                            "' not found in: [" + dirs + "]");
  }

  const Candidate *chosen = nullptr;
  if (version) {
    for (const auto &c : candidates) {
      if (c.doc.value("version", std::string()) == *version) {
        chosen = &c;
        break;
      }
    }
    if (!chosen) {
      throw TemplateLoadError("Template '" + template_id + "' version '" +
                              *version + "' not found");
    }
  } else {
    for (const auto &c : candidates) {
      if (!chosen ||
          compare_versions(c.doc.value("version", std::string("0.0.0")),
                           chosen->doc.value("version", std::string("0.0.0"))) >
              0)
        chosen = &c;
    }
  }

  LOG_INFO("REGISTRY", template_id, "Resolved template from {}",
           chosen->path.string());
  return Template::from_json(chosen->doc, chosen->path.string());
}

std::vector<TemplateIndexEntry> TemplateRegistry::list_templates() const {
  std::vector<TemplateIndexEntry> out;
  std::set<std::pair<std::string, std::string>> seen;
  for (const auto &dir : search_dirs_) {
    for (auto &entry : read_index(dir)) {
      if (seen.insert({entry.template_id, entry.version}).second)
        out.push_back(std::move(entry));
    }
  }
  return out;
}

} // namespace dsvalidator
