#include "portcullis/core/proxy/FilterRules.h"
#include "portcullis/core/util/Error.h"
#include <fmt/format.h>

namespace portcullis::core::proxy {
FilterRules::FilterRules(FilterMode mode, std::vector<std::string> domains) : filterMode(mode) {
    for (auto& d : domains) {
        if (d.empty()) throw util::ConfigError("filter domain must not be empty");
        if (d.find(':') != std::string::npos) throw util::ConfigError(fmt::format("filter domain '{}' must not include a port", d));
        domainSet.insert(std::move(d));
    }
}

FilterRules FilterRules::deny_list(std::vector<std::string> domains) { return FilterRules(FilterMode::Deny, std::move(domains)); }
FilterRules FilterRules::allow_list(std::vector<std::string> domains) { return FilterRules(FilterMode::Allow, std::move(domains)); }

std::string_view FilterRules::domain_of(std::string_view host) {
    return host.substr(0, host.find(':'));
}

bool FilterRules::is_allowed(std::string_view host) const {
    bool listed = domainSet.count(std::string(domain_of(host))) != 0;
    switch (filterMode) {
        case FilterMode::Deny: return !listed;
        case FilterMode::Allow: return listed;
    }
    return false;
}

const char* to_string(FilterMode mode) {
    switch (mode) {
        case FilterMode::Allow: return "allow-list";
        case FilterMode::Deny: return "deny-list";
    }
    return "?";
}

http::HttpResponse blocked_response(std::string_view host) {
    return http::make_response(403, "Forbidden", fmt::format("Access to {} is blocked by proxy filter rules", host), "text/plain");
}
}
