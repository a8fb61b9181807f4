#pragma once
// Project-wide precompiled header for dataset-validator
// Keep this header stable (only include headers that rarely change)
//
// Notes:
// - CMake's target_precompile_headers will use this file if it exists.
// - Add only headers that are expensive to parse and change infrequently.

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

// Third-party headers used across most translation units.
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <dataset-validator/export.h>

// End of pch.h
