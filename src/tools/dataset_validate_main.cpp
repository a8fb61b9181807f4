#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Logger.hpp"
#include "dataset-validator/Report.hpp"
#include "dataset-validator/TemplateRegistry.hpp"
#include "dataset-validator/ValidatorConfig.hpp"
#include "dataset-validator/engine/StreamingValidator.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace dsvalidator;

void print_usage() {
  std::cout << "Usage: dataset-validate --input <path> --template-id <id> "
               "[options]\n\n";
  std::cout << "Required:\n";
  std::cout << "  --input <path>             Dataset file or archive\n";
  std::cout << "  --template-id <id>         Template id or alias\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --template-version <v>     Exact template version "
               "(default: highest)\n";
  std::cout << "  --templates-dir <dir>      Template search directory "
               "(repeatable)\n";
  std::cout << "  --format <name>            CSV|GEOPARQUET|GEOPACKAGE|"
               "SHAPEFILE (default: detect)\n";
  std::cout << "  --layer <name>             GeoPackage layer\n";
  std::cout << "  --delimiter <c>            CSV delimiter (',', ';', 'tab', "
               "'|')\n";
  std::cout << "  --config <file.yaml>       Engine configuration\n";
  std::cout << "  --report <out.json>        Write the JSON report\n";
  std::cout << "  --ndjson                   Append the report as one line\n";
  std::cout << "  --print-json               Print the JSON report\n";
  std::cout << "  --log-level <level>        trace|debug|info|warn|error\n";
  std::cout << "  --list-templates           List indexed templates and exit\n";
  std::cout << "\nExit codes:\n";
  std::cout << "  0 OK, 1 usage, 2 corrupted/unopenable, 3 schema, "
               "4 type/null/enum/range,\n";
  std::cout << "  5 duplicates, 6 template or internal error\n";
}

struct CliOptions {
  std::string input;
  std::string template_id;
  std::optional<std::string> template_version;
  std::vector<std::string> templates_dirs;
  std::optional<std::string> format;
  std::optional<std::string> layer;
  std::optional<std::string> delimiter;
  std::optional<std::string> config;
  std::optional<std::string> report;
  bool ndjson = false;
  bool print_json = false;
  std::optional<std::string> log_level;
  bool list_templates = false;
};

// Returns false on a usage error
bool parse_args(int argc, char **argv, CliOptions &opts) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    auto value = [&](std::string &out) {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return false;
      }
      out = argv[++i];
      return true;
    };
    std::string v;

    if (arg == "--help" || arg == "-h") {
      return false;
    } else if (arg == "--ndjson") {
      opts.ndjson = true;
    } else if (arg == "--print-json") {
      opts.print_json = true;
    } else if (arg == "--list-templates") {
      opts.list_templates = true;
    } else if (!value(v)) {
      return false;
    } else if (arg == "--input") {
      opts.input = v;
    } else if (arg == "--template-id") {
      opts.template_id = v;
    } else if (arg == "--template-version") {
      opts.template_version = v;
    } else if (arg == "--templates-dir") {
      opts.templates_dirs.push_back(v);
    } else if (arg == "--format") {
      opts.format = v;
    } else if (arg == "--layer") {
      opts.layer = v;
    } else if (arg == "--delimiter") {
      opts.delimiter = v;
    } else if (arg == "--config") {
      opts.config = v;
    } else if (arg == "--report") {
      opts.report = v;
    } else if (arg == "--log-level") {
      opts.log_level = v;
    } else {
      std::cerr << "Error: unknown option " << arg << "\n";
      return false;
    }
  }
  if (opts.list_templates)
    return true;
  if (opts.input.empty() || opts.template_id.empty()) {
    std::cerr << "Error: --input and --template-id are required\n";
    return false;
  }
  return true;
}

std::optional<char> parse_delimiter(const std::string &text) {
  if (text == "tab" || text == "\\t" || text == "\t")
    return '\t';
  if (text.size() == 1)
    return text[0];
  return std::nullopt;
}

std::string make_run_id() {
  if (const char *env = std::getenv("RUN_ID"); env && *env)
    return env;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return "run-" + std::to_string(ms);
}

int cmd_list_templates(const TemplateRegistry &registry) {
  auto entries = registry.list_templates();
  if (entries.empty()) {
    std::cout << "No indexed templates found\n";
    return 0;
  }
  for (const auto &entry : entries) {
    std::cout << entry.template_id << " " << entry.version;
    if (entry.label)
      std::cout << "  " << *entry.label;
    std::cout << "  (" << entry.path.string() << ")\n";
  }
  return 0;
}

int cmd_validate(const CliOptions &opts, const ValidatorConfig &config,
                 const TemplateRegistry &registry) {
  engine::RunOptions run_options;
  if (opts.format) {
    run_options.format = source::parse_format(*opts.format);
    if (!run_options.format) {
      std::cerr << "Error: unknown format " << *opts.format << "\n";
      return EXIT_USAGE;
    }
  }
  if (opts.delimiter) {
    run_options.open.delimiter = parse_delimiter(*opts.delimiter);
    if (!run_options.open.delimiter) {
      std::cerr << "Error: delimiter must be a single character\n";
      return EXIT_USAGE;
    }
  }
  run_options.open.layer = opts.layer;

  Template tmpl;
  try {
    tmpl = registry.resolve(opts.template_id, opts.template_version);
  } catch (const TemplateLoadError &e) {
    std::cerr << "Template error: " << e.what() << "\n";
    LOG_ERROR("MAIN", "TEMPLATE", "{}", e.what());
    return EXIT_INTERNAL;
  }

  const std::string run_id = make_run_id();
  engine::StreamingValidator validator(tmpl, config, run_id);
  engine::RunResult result = validator.run(opts.input, run_options);
  Report report = ReportBuilder::build(tmpl, result);

  std::cout << report.summary_line() << "\n";
  if (opts.print_json) {
    nlohmann::json j = report;
    std::cout << j.dump(2) << "\n";
  }

  if (opts.report) {
    try {
      ReportBuilder::write(report, *opts.report, opts.ndjson);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      LOG_ERROR("MAIN", run_id, "{}", e.what());
      return EXIT_INTERNAL;
    }
  }
  return report.exit_code;
}

int main(int argc, char **argv) {
  CliOptions opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage();
    return EXIT_USAGE;
  }

  ValidatorConfig config;
  try {
    if (opts.config)
      config = ValidatorConfig::load_yaml(*opts.config);
    if (opts.log_level)
      config.log_level = *opts.log_level;
    config.validate();
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return EXIT_USAGE;
  }

  ValidatorLogger::instance().init(config.log_file,
                                   parse_log_level(config.log_level));

  // Command line directories are searched before configured ones
  std::vector<std::string> dirs = opts.templates_dirs;
  dirs.insert(dirs.end(), config.template_dirs.begin(),
              config.template_dirs.end());

  try {
    TemplateRegistry registry(dirs);
    if (opts.list_templates)
      return cmd_list_templates(registry);
    return cmd_validate(opts, config, registry);
  } catch (const std::exception &e) {
    std::cerr << "Internal error: " << e.what() << "\n";
    LOG_ERROR("MAIN", "FATAL", "{}", e.what());
    return EXIT_INTERNAL;
  }
}
