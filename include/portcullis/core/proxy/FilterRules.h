#pragma once
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include "portcullis/core/http/HttpParser.h"

namespace portcullis::core::proxy {
enum class FilterMode { Allow, Deny };

// Allow-list or deny-list of bare host names. Immutable once built, so one
// instance is shared by every session without locking.
class FilterRules {
public:
    // Throws util::ConfigError for an empty domain or one carrying a port.
    FilterRules(FilterMode mode, std::vector<std::string> domains);

    static FilterRules deny_list(std::vector<std::string> domains);
    static FilterRules allow_list(std::vector<std::string> domains);

    // host may carry a ":port" suffix; everything from the first ':' is ignored.
    bool is_allowed(std::string_view host) const;

    FilterMode mode() const { return filterMode; }
    const std::unordered_set<std::string>& domains() const { return domainSet; }

    static std::string_view domain_of(std::string_view host);

private:
    FilterMode filterMode;
    std::unordered_set<std::string> domainSet;
};

const char* to_string(FilterMode mode);

// 403 text/plain: "Access to {host} is blocked by proxy filter rules".
http::HttpResponse blocked_response(std::string_view host);
}
