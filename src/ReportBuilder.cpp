#include "dataset-validator/Logger.hpp"
#include "dataset-validator/Report.hpp"
#include "dataset-validator/source/SourceAdapter.hpp"

#include <cstdlib>
#include <fmt/chrono.h>
#include <fstream>
#include <regex>
#include <stdexcept>

#ifndef DATASET_VALIDATOR_VERSION
#define DATASET_VALIDATOR_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

namespace dsvalidator {

namespace {

std::optional<std::string> env(const char *name) {
  const char *value = std::getenv(name);
  if (!value || !*value)
    return std::nullopt;
  return std::string(value);
}

} // namespace

std::string Report::summary_line() const {
  return fmt::format("{} template={}:{} rows={} errors={} warnings={} "
                     "duration={:.2f}s",
                     ok ? "OK" : "FAILED", template_id, template_version,
                     row_count, errors, warnings, duration_sec);
}

void to_json(nlohmann::json &j, const Report &r) {
  nlohmann::json input = {{"path", r.input.path},
                          {"format", r.input.format},
                          {"size_bytes", r.input.size_bytes}};
  input["layer"] = r.input.layer ? nlohmann::json(*r.input.layer)
                                 : nlohmann::json(nullptr);

  nlohmann::json provenance = {{"tool_version", r.provenance.tool_version}};
  provenance["git_rev"] = r.provenance.git_rev
                              ? nlohmann::json(*r.provenance.git_rev)
                              : nlohmann::json(nullptr);
  provenance["run_id"] = r.provenance.run_id
                             ? nlohmann::json(*r.provenance.run_id)
                             : nlohmann::json(nullptr);

  j = nlohmann::json{{"ok", r.ok},
                     {"status", r.ok ? "OK" : "FAILED"},
                     {"exit_code", r.exit_code},
                     {"template_id", r.template_id},
                     {"template_version", r.template_version},
                     {"input", input},
                     {"provenance", provenance},
                     {"row_count", r.row_count},
                     {"counts", r.counts},
                     {"errors", r.errors},
                     {"warnings", r.warnings},
                     {"violations", r.violations},
                     {"metrics",
                      {{"null_counts", r.null_counts},
                       {"adapter_diagnostics", r.adapter_diagnostics}}},
                     {"started_at", r.started_at},
                     {"finished_at", r.finished_at},
                     {"duration_sec", r.duration_sec},
                     {"timed_out", r.timed_out}};
  j["internal_error"] = r.internal_error ? nlohmann::json(*r.internal_error)
                                         : nlohmann::json(nullptr);
}

int ReportBuilder::exit_code_for(const engine::ViolationAggregator &aggregator,
                                 bool internal_failure, bool timed_out) {
  if (timed_out)
    return EXIT_INTERNAL;
  auto severity = aggregator.severity();
  if (!severity)
    return internal_failure ? EXIT_INTERNAL : EXIT_OK;
  switch (*severity) {
  case ViolationKind::CorruptionError:
    return EXIT_CORRUPTION;
  case ViolationKind::SchemaError:
    return EXIT_SCHEMA;
  case ViolationKind::TypeError:
  case ViolationKind::NullError:
  case ViolationKind::EnumError:
  case ViolationKind::RangeError:
    return EXIT_DATA;
  case ViolationKind::DuplicateError:
    return EXIT_DUPLICATES;
  }
  return EXIT_INTERNAL;
}

Report ReportBuilder::build(const Template &tmpl,
                            const engine::RunResult &result,
                            const std::optional<std::string> &run_id) {
  Report report;
  report.template_id = tmpl.template_id;
  report.template_version = tmpl.version;

  report.input.path = redact_credentials(result.input_path);
  report.input.format =
      result.format ? source::to_string(*result.format) : "UNKNOWN";
  auto layer = result.diagnostics.find("layer");
  if (layer != result.diagnostics.end())
    report.input.layer = layer->second;
  report.input.size_bytes = result.input_size_bytes;

  report.provenance.tool_version = tool_version();
  report.provenance.git_rev = env("GIT_REV");
  report.provenance.run_id = run_id ? run_id : env("RUN_ID");

  const auto &agg = result.aggregator;
  report.row_count = result.row_count;
  report.counts = agg.counts();
  report.errors = agg.error_count();
  report.warnings = agg.warning_count();
  report.violations = agg.samples();
  report.null_counts = result.null_counts;
  report.adapter_diagnostics = result.diagnostics;

  report.started_at = format_timestamp(result.started_at);
  report.finished_at = format_timestamp(result.finished_at);
  report.duration_sec = result.duration_sec;
  if (result.internal_failure)
    report.internal_error = result.internal_error;
  report.timed_out = result.timed_out;

  report.exit_code =
      exit_code_for(agg, result.internal_failure, result.timed_out);
  report.ok = report.exit_code == EXIT_OK;
  return report;
}

void ReportBuilder::write(const Report &report, const fs::path &path,
                          bool ndjson) {
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
      throw std::runtime_error("Cannot create directory " +
                               path.parent_path().string() + ": " +
                               ec.message());
  }

  std::ofstream out(path, ndjson ? std::ios::app : std::ios::trunc);
  if (!out)
    throw std::runtime_error("Cannot write report to " + path.string());

  nlohmann::json j = report;
  if (ndjson)
    out << j.dump() << "\n";
  else
    out << j.dump(2) << "\n";
  if (!out)
    throw std::runtime_error("Failed writing report to " + path.string());
  LOG_DEBUG("REPORT", "WRITE", "Report written to {}", path.string());
}

std::string ReportBuilder::redact_credentials(const std::string &path) {
  static const std::regex credentials(R"(^([A-Za-z][A-Za-z0-9+.\-]*://)[^/@]+@)");
  return std::regex_replace(path, credentials, "$1***@");
}

std::string
ReportBuilder::format_timestamp(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(t));
}

std::string ReportBuilder::tool_version() { return DATASET_VALIDATOR_VERSION; }

} // namespace dsvalidator
