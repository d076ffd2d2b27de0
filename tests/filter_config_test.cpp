#include "portcullis/core/proxy/FilterConfig.h"
#include "portcullis/core/util/Error.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

using namespace portcullis::core::proxy;
using portcullis::core::util::ConfigError;

static bool rejects(const std::string& json) {
    try { parse_filter_rules(json); }
    catch (const ConfigError&) { return true; }
    return false;
}

int main() {
    // Blacklist -> deny-list
    {
        auto rules = parse_filter_rules(R"({"mode": "Blacklist", "domains": ["example.com", "goldentech.digital"]})");
        assert(rules.mode() == FilterMode::Deny);
        assert(rules.domains().count("example.com") == 1);
        assert(!rules.is_allowed("goldentech.digital:443"));
        assert(rules.is_allowed("other.org"));
    }

    // Whitelist -> allow-list, unknown keys skipped, escapes decoded
    {
        auto rules = parse_filter_rules(
            "{\n  \"comment\": {\"nested\": [1, 2.5e3, true, null]},\n"
            "  \"domains\": [\"ok.example\", \"esc\\u0061ped.example\"],\n"
            "  \"mode\": \"Whitelist\"\n}\n");
        assert(rules.mode() == FilterMode::Allow);
        assert(rules.is_allowed("ok.example:443"));
        assert(rules.is_allowed("escaped.example"));
        assert(!rules.is_allowed("other.example"));
    }

    // \u escapes outside the BMP arrive as surrogate pairs and become one 4-byte sequence
    {
        auto rules = parse_filter_rules(R"({"mode": "Blacklist", "domains": ["x\uD83D\uDE00.example", "caf\u00e9.example"]})");
        assert(rules.domains().count("x\xF0\x9F\x98\x80.example") == 1);
        assert(rules.domains().count("caf\xC3\xA9.example") == 1);
        assert(rejects(R"({"mode": "Blacklist", "domains": ["x\uD83D.example"]})"));
        assert(rejects(R"({"mode": "Blacklist", "domains": ["x\uDE00.example"]})"));
        assert(rejects(R"({"mode": "Blacklist", "domains": ["x\uD83D\u0041.example"]})"));
    }

    // empty domain list is a valid document
    {
        auto rules = parse_filter_rules(R"({"mode":"Whitelist","domains":[]})");
        assert(rules.domains().empty());
        assert(!rules.is_allowed("x.example"));
    }

    // malformed shapes
    assert(rejects(""));
    assert(rejects("[]"));
    assert(rejects(R"({"mode": "Blacklist"})"));
    assert(rejects(R"({"domains": ["a.example"]})"));
    assert(rejects(R"({"mode": "Greylist", "domains": []})"));
    assert(rejects(R"({"mode": "Blacklist", "domains": "a.example"})"));
    assert(rejects(R"({"mode": "Blacklist", "domains": [42]})"));
    assert(rejects(R"({"mode": "Blacklist", "domains": ["a.example:443"]})"));
    assert(rejects(R"({"mode": "Blacklist", "domains": ["a.example"]} trailing)"));
    assert(rejects(R"({"mode": "Blacklist", "domains": ["a.example")"));
    assert(rejects(R"({"mode": 1, "domains": []})"));

    // file loading
    {
        const std::string path = "filter_config_test_rules.json";
        {
            std::ofstream ofs(path);
            ofs << R"({"mode": "Blacklist", "domains": ["blocked.example"]})";
        }
        auto rules = load_filter_rules(path);
        assert(rules);
        assert(!rules->is_allowed("blocked.example"));
        std::filesystem::remove(path);
    }

    // missing file
    {
        bool threw = false;
        try { load_filter_rules("definitely_missing_filter_rules.json"); }
        catch (const ConfigError& e) { threw = std::string(e.what()).find("does not exist") != std::string::npos; }
        assert(threw);
    }
    return 0;
}
