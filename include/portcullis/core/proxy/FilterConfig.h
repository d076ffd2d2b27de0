#pragma once
#include "portcullis/core/proxy/FilterRules.h"
#include <memory>
#include <string>
#include <string_view>

namespace portcullis::core::proxy {
// Document shape:
//   { "mode": "Blacklist" | "Whitelist", "domains": ["example.com", ...] }
// Blacklist selects deny-list mode, Whitelist allow-list mode. Other keys are ignored.
// Both throw util::ConfigError.
FilterRules parse_filter_rules(std::string_view json);
std::shared_ptr<const FilterRules> load_filter_rules(const std::string& path);
}
