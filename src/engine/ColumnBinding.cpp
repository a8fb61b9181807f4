#include "dataset-validator/engine/ColumnBinding.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace dsvalidator {
namespace engine {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace

std::vector<std::string>
geometry_alias_candidates(const Template &tmpl, const std::string &column) {
  auto it = tmpl.geometry_aliases.find(column);
  if (it != tmpl.geometry_aliases.end())
    return it->second;
  if (column == "lpis_geom")
    return {"geom", "geometry"};
  if (column == "gsa_geom")
    return {"gem", "geometry"};
  return {"geom", "geometry", "the_geom", "wkb_geometry", "shape"};
}

SchemaBinding bind_columns(const Template &tmpl,
                           const source::PhysicalSchema &schema) {
  SchemaBinding binding;
  std::set<std::string> used;

  auto exact = [&](const std::string &name) -> const source::PhysicalColumn * {
    for (const auto &col : schema) {
      if (col.name == name)
        return &col;
    }
    return nullptr;
  };
  auto folded = [&](const std::string &name) -> const source::PhysicalColumn * {
    const std::string key = lower(name);
    for (const auto &col : schema) {
      if (lower(col.name) == key)
        return &col;
    }
    return nullptr;
  };

  for (const auto &spec : tmpl.columns) {
    const source::PhysicalColumn *found = exact(spec.name);
    if (!found && spec.dtype == DType::Geometry) {
      for (const auto &alias : geometry_alias_candidates(tmpl, spec.name)) {
        found = folded(alias);
        if (found) {
          binding.aliases[spec.name] = found->name;
          break;
        }
      }
    }
    if (found) {
      binding.bound.push_back({&spec, found->name});
      used.insert(found->name);
    } else if (spec.required) {
      binding.missing_required.push_back(spec.name);
    } else {
      binding.missing_optional.push_back(spec.name);
    }
  }

  for (const auto &col : schema) {
    if (!used.count(col.name))
      binding.extra.push_back(col.name);
  }
  return binding;
}

} // namespace engine
} // namespace dsvalidator
