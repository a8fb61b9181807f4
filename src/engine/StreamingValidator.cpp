#include "dataset-validator/engine/StreamingValidator.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Logger.hpp"
#include "dataset-validator/ValueCoercion.hpp"
#include "dataset-validator/engine/ColumnBinding.hpp"
#include "dataset-validator/engine/UniqueTracker.hpp"
#include "dataset-validator/source/FormatDetector.hpp"
#include "dataset-validator/source/Unpacker.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <unordered_set>

namespace fs = std::filesystem;

namespace dsvalidator {
namespace engine {

std::string to_string(RunState state) {
  switch (state) {
  case RunState::Init:
    return "INIT";
  case RunState::SchemaCheck:
    return "SCHEMA_CHECK";
  case RunState::Scanning:
    return "SCANNING";
  case RunState::Finalized:
    return "FINALIZED";
  }
  return "UNKNOWN";
}

namespace {

Violation make_violation(ViolationKind kind, std::string message,
                         std::optional<std::string> column = std::nullopt,
                         std::optional<uint64_t> row = std::nullopt,
                         Severity severity = Severity::Error) {
  Violation v;
  v.kind = kind;
  v.severity = severity;
  v.column = std::move(column);
  v.row_index = row;
  v.message = std::move(message);
  return v;
}

std::string join(const std::vector<std::string> &parts,
                 const std::string &sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      out += sep;
    out += parts[i];
  }
  return out;
}

/// Per-column rule state for one run
struct ColumnRules {
  const ColumnSpec *spec;
  std::unordered_set<std::string> enum_keys;
  std::unique_ptr<UniqueTracker> unique;
  bool needs_keys{false}; // feeds a composite duplicate check
};

struct CompositeRules {
  std::vector<size_t> columns; // positions in the projection
  std::string label;
  Severity severity;
  std::unique_ptr<UniqueTracker> seen;
};

/// Applies template rules to chunks
class RuleSet {
public:
  RuleSet(const Template &tmpl, const SchemaBinding &binding,
          const ValidatorConfig &config, const std::string &run_id)
      : null_equivalents_(tmpl.null_equivalents.begin(),
                          tmpl.null_equivalents.end()) {
    for (const auto &bound : binding.bound) {
      ColumnRules rules;
      rules.spec = bound.spec;
      for (const auto &raw : bound.spec->enum_values) {
        auto cell = cell_from_json(raw);
        if (!cell)
          continue;
        if (auto typed = coerce(*cell, bound.spec->dtype))
          rules.enum_keys.insert(canonical_key(*typed));
      }
      if (bound.spec->unique)
        rules.unique = make_unique_tracker(config);
      columns_.push_back(std::move(rules));
    }

    for (const auto &check : tmpl.duplicate_checks) {
      CompositeRules composite;
      composite.label = join(check.keys, ",");
      composite.severity = check.severity;
      bool complete = true;
      for (const auto &key : check.keys) {
        auto it = std::find_if(
            binding.bound.begin(), binding.bound.end(),
            [&](const BoundColumn &b) { return b.spec->name == key; });
        if (it == binding.bound.end()) {
          complete = false;
          break;
        }
        size_t pos = static_cast<size_t>(it - binding.bound.begin());
        composite.columns.push_back(pos);
        columns_[pos].needs_keys = true;
      }
      if (!complete) {
        LOG_WARN("VALIDATOR", run_id,
                 "Duplicate check ({}) skipped: key column not in the file",
                 composite.label);
        continue;
      }
      composite.seen = make_unique_tracker(config);
      composites_.push_back(std::move(composite));
    }
  }

  void apply(const source::RowChunk &chunk, ViolationAggregator &agg,
             std::map<std::string, uint64_t> &null_counts) {
    keys_.resize(columns_.size());
    for (size_t c = 0; c < columns_.size(); ++c) {
      ColumnRules &rules = columns_[c];
      const ColumnSpec &spec = *rules.spec;
      const auto &cells = chunk.columns[c];
      auto &keys = keys_[c];
      keys.assign(rules.needs_keys ? chunk.row_count : 0, std::nullopt);
      uint64_t &nulls = null_counts[spec.name];

      for (size_t r = 0; r < chunk.row_count; ++r) {
        const CellValue &raw = cells[r];
        const uint64_t row = chunk.first_row + r;

        if (is_null(raw)) {
          ++nulls;
          if (!spec.nullable())
            agg.add(make_violation(ViolationKind::NullError,
                                   "Missing value in non-nullable column '" +
                                       spec.name + "'",
                                   spec.name, row));
          continue;
        }

        auto typed = coerce(raw, spec.dtype);
        if (!typed) {
          agg.add(make_violation(ViolationKind::TypeError,
                                 "Value " + describe(raw) + " is not a valid " +
                                     to_string(spec.dtype),
                                 spec.name, row));
          continue;
        }

        const std::string key = canonical_key(*typed);
        if (!rules.enum_keys.empty() && !rules.enum_keys.count(key))
          agg.add(make_violation(ViolationKind::EnumError,
                                 "Value " + describe(*typed) +
                                     " is not one of the allowed values",
                                 spec.name, row));

        if (spec.range) {
          auto number = numeric_value(*typed);
          if (number && !spec.range->contains(*number))
            agg.add(make_violation(ViolationKind::RangeError,
                                   "Value " + describe(*typed) +
                                       " is outside " + range_text(*spec.range),
                                   spec.name, row));
        }

        if (rules.unique && rules.unique->check_and_insert(key))
          agg.add(make_violation(ViolationKind::DuplicateError,
                                 "Duplicate value " + describe(*typed) +
                                     " in unique column '" + spec.name + "'",
                                 spec.name, row));

        if (rules.needs_keys)
          keys[r] = key;
      }
    }

    for (auto &composite : composites_) {
      for (size_t r = 0; r < chunk.row_count; ++r) {
        std::string tuple;
        bool complete = true;
        for (size_t pos : composite.columns) {
          const auto &key = keys_[pos][r];
          if (!key) {
            complete = false;
            break;
          }
          // Length prefix keeps ("a,b","c") apart from ("a","b,c")
          tuple += std::to_string(key->size()) + ":" + *key;
        }
        if (complete && composite.seen->check_and_insert(tuple))
          agg.add(make_violation(ViolationKind::DuplicateError,
                                 "Duplicate key (" + composite.label + ")",
                                 composite.label, chunk.first_row + r,
                                 composite.severity));
      }
    }
  }

private:
  bool is_null(const CellValue &raw) const {
    if (is_absent(raw))
      return true;
    if (!null_equivalents_.empty()) {
      if (const auto *text = std::get_if<std::string>(&raw))
        return null_equivalents_.count(*text) > 0;
    }
    return false;
  }

  static std::string range_text(const NumericRange &range) {
    std::string lo = range.min ? fmt::format("{}", *range.min) : "-inf";
    std::string hi = range.max ? fmt::format("{}", *range.max) : "inf";
    return "[" + lo + ", " + hi + "]";
  }

  std::unordered_set<std::string> null_equivalents_;
  std::vector<ColumnRules> columns_;
  std::vector<CompositeRules> composites_;
  std::vector<std::vector<std::optional<std::string>>> keys_;
};

} // namespace

StreamingValidator::StreamingValidator(const Template &tmpl,
                                       ValidatorConfig config,
                                       std::string run_id)
    : template_(tmpl), config_(std::move(config)), run_id_(std::move(run_id)) {
  config_.validate();
}

RunResult StreamingValidator::run(const std::string &input_path,
                                  const RunOptions &options) {
  const auto start = std::chrono::steady_clock::now();
  RunResult result(config_.violation_cap);
  result.started_at = std::chrono::system_clock::now();
  result.input_path = input_path;
  state_ = RunState::Init;

  std::error_code ec;
  result.input_size_bytes = fs::file_size(input_path, ec);
  if (ec)
    result.input_size_bytes = 0;

  LOG_INFO("VALIDATOR", run_id_, "Validating {} against {}", input_path,
           template_.identity());

  std::unique_ptr<source::UnpackedInput> unpacked;
  std::unique_ptr<source::SourceAdapter> adapter;
  try {
    unpacked = std::make_unique<source::UnpackedInput>(
        source::Unpacker::prepare(input_path));
    if (unpacked->container() != "none")
      result.diagnostics["container"] = unpacked->container();
    result.format = options.format
                        ? *options.format
                        : source::detect_format(unpacked->dataset_path());
    adapter = source::make_adapter(*result.format);
  } catch (const std::exception &e) {
    LOG_ERROR("VALIDATOR", run_id_, "Cannot prepare {}: {}", input_path,
              e.what());
    result.aggregator.add(
        make_violation(ViolationKind::CorruptionError, e.what()));
    finalize(result, start);
    return result;
  }

  LOG_DEBUG("VALIDATOR", run_id_, "Format {} for {}",
            source::to_string(*result.format),
            unpacked->dataset_path().string());
  scan(*adapter, unpacked->dataset_path().string(), options.open, result);
  finalize(result, start);
  return result;
}

RunResult StreamingValidator::run_with(source::SourceAdapter &adapter,
                                       const std::string &path,
                                       const source::OpenOptions &options) {
  const auto start = std::chrono::steady_clock::now();
  RunResult result(config_.violation_cap);
  result.started_at = std::chrono::system_clock::now();
  result.input_path = path;
  result.format = adapter.format();
  state_ = RunState::Init;

  std::error_code ec;
  result.input_size_bytes = fs::file_size(path, ec);
  if (ec)
    result.input_size_bytes = 0;

  scan(adapter, path, options, result);
  finalize(result, start);
  return result;
}

void StreamingValidator::scan(source::SourceAdapter &adapter,
                              const std::string &path,
                              const source::OpenOptions &options,
                              RunResult &result) {
  const auto start = std::chrono::steady_clock::now();
  ViolationAggregator &agg = result.aggregator;

  // INIT
  std::unique_ptr<source::DatasetHandle> handle;
  try {
    handle = adapter.open(path, options);
  } catch (const std::exception &e) {
    LOG_ERROR("VALIDATOR", run_id_, "Cannot open {}: {}", path, e.what());
    agg.add(make_violation(ViolationKind::CorruptionError, e.what()));
    return;
  }

  // SCHEMA_CHECK
  state_ = RunState::SchemaCheck;
  SchemaBinding binding;
  try {
    binding = bind_columns(template_, handle->schema_probe());
  } catch (const std::exception &e) {
    LOG_ERROR("VALIDATOR", run_id_, "Schema probe failed: {}", e.what());
    agg.add(make_violation(ViolationKind::CorruptionError, e.what()));
    result.diagnostics.merge(handle->diagnostics());
    return;
  }

  for (const auto &alias : binding.aliases) {
    result.diagnostics["alias." + alias.first] = alias.second;
    LOG_DEBUG("VALIDATOR", run_id_, "Column '{}' read from '{}'", alias.first,
              alias.second);
  }
  for (const auto &name : binding.missing_optional)
    LOG_DEBUG("VALIDATOR", run_id_, "Optional column '{}' not present", name);
  if (!template_.allow_extra_columns) {
    for (const auto &name : binding.extra)
      agg.add(make_violation(ViolationKind::SchemaError,
                             "Column '" + name + "' is not declared",
                             name, std::nullopt, Severity::Warning));
  }
  if (!binding.missing_required.empty()) {
    for (const auto &name : binding.missing_required)
      agg.add(make_violation(ViolationKind::SchemaError,
                             "Required column '" + name + "' is missing",
                             name));
    LOG_WARN("VALIDATOR", run_id_, "{} required column(s) missing, not scanning",
             binding.missing_required.size());
    result.diagnostics.merge(handle->diagnostics());
    return;
  }

  // SCANNING
  state_ = RunState::Scanning;
  std::vector<std::string> projection;
  for (const auto &bound : binding.bound)
    projection.push_back(bound.physical_name);
  for (const auto &bound : binding.bound)
    result.null_counts[bound.spec->name] = 0;

  std::unique_ptr<RuleSet> rules;
  std::unique_ptr<source::ChunkStream> stream;
  try {
    rules = std::make_unique<RuleSet>(template_, binding, config_, run_id_);
    stream = handle->iter_chunks(config_.chunk_size, projection);
  } catch (const CorruptionError &e) {
    agg.add(make_violation(ViolationKind::CorruptionError, e.what(),
                           std::nullopt, e.row_index()));
    result.diagnostics.merge(handle->diagnostics());
    return;
  } catch (const std::exception &e) {
    LOG_ERROR("VALIDATOR", run_id_, "Cannot start scan: {}", e.what());
    result.internal_failure = true;
    result.internal_error = e.what();
    result.diagnostics.merge(handle->diagnostics());
    return;
  }

  source::RowChunk chunk;
  while (true) {
    if (config_.timeout_seconds > 0) {
      std::chrono::duration<double> elapsed =
          std::chrono::steady_clock::now() - start;
      if (elapsed.count() > config_.timeout_seconds) {
        std::string msg = fmt::format("validation timed out after {:.2f}s",
                                      elapsed.count());
        LOG_ERROR("VALIDATOR", run_id_, "{} ({} rows read)", msg,
                  result.row_count);
        agg.add(make_violation(ViolationKind::CorruptionError, msg));
        result.timed_out = true;
        result.internal_failure = true;
        result.internal_error = msg;
        break;
      }
    }

    bool more = false;
    try {
      more = stream->next(chunk);
    } catch (const CorruptionError &e) {
      LOG_ERROR("VALIDATOR", run_id_, "Read failed after {} rows: {}",
                result.row_count, e.what());
      agg.add(make_violation(ViolationKind::CorruptionError, e.what(),
                             std::nullopt, e.row_index()));
      break;
    } catch (const std::exception &e) {
      LOG_ERROR("VALIDATOR", run_id_, "Read failed after {} rows: {}",
                result.row_count, e.what());
      agg.add(make_violation(ViolationKind::CorruptionError, e.what()));
      break;
    }
    if (!more)
      break;

    try {
      rules->apply(chunk, agg, result.null_counts);
    } catch (const std::exception &e) {
      LOG_ERROR("VALIDATOR", run_id_, "Rule application failed at row {}: {}",
                chunk.first_row, e.what());
      result.internal_failure = true;
      result.internal_error = e.what();
      break;
    }
    result.row_count += chunk.row_count;
    LOG_TRACE("VALIDATOR", run_id_, "Chunk of {} rows from row {}",
              chunk.row_count, chunk.first_row);
  }

  result.diagnostics.merge(handle->diagnostics());
}

void StreamingValidator::finalize(RunResult &result,
                                  std::chrono::steady_clock::time_point start) {
  state_ = RunState::Finalized;
  result.finished_at = std::chrono::system_clock::now();
  result.duration_sec = std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - start)
                            .count();
  LOG_INFO("VALIDATOR", run_id_,
           "Finished: {} rows, {} errors, {} warnings in {:.2f}s",
           result.row_count, result.aggregator.error_count(),
           result.aggregator.warning_count(), result.duration_sec);
}

} // namespace engine
} // namespace dsvalidator
