#include <dataset-validator/Errors.hpp>
#include <dataset-validator/Template.hpp>
#include <dataset-validator/TemplateSchema.hpp>
#include <iostream>
#include <string>
using namespace dsvalidator;

int main(int argc, char *argv[]) {
  if (argc == 2 && std::string(argv[1]) == "--print-schema") {
    std::cout << TemplateSchema::get_template_schema() << "\n";
    return 0;
  }
  if (argc < 2 || argc > 3 ||
      (argc == 3 && std::string(argv[2]) != "--print-schema")) {
    std::cerr << "Usage: " << argv[0] << " <template.json> [--print-schema]\n";
    return 1;
  }
  if (argc == 3)
    std::cout << TemplateSchema::get_template_schema() << "\n";

  auto result = TemplateSchema::validate_file(argv[1]);
  if (!result.valid) {
    std::cout << "Validation failed:\n";
    for (const auto &err : result.errors) {
      std::cout << "  - " << err.path << ": " << err.message << "\n";
    }
    return 2;
  }

  // Shape is fine; check internal consistency
  try {
    Template tmpl = Template::load(argv[1]);
    std::cout << "Validation succeeded: " << tmpl.identity() << " ("
              << tmpl.columns.size() << " columns)\n";
    return 0;
  } catch (const TemplateLoadError &e) {
    std::cout << "Validation failed:\n  - " << e.what() << "\n";
    return 2;
  }
}
