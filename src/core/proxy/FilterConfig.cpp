#include "portcullis/core/proxy/FilterConfig.h"
#include "portcullis/core/util/Error.h"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <vector>
#include <fmt/format.h>

namespace portcullis::core::proxy {
using util::ConfigError;

namespace {
// Small strict JSON reader, just enough for the filter document.
class JsonCursor {
public:
    explicit JsonCursor(std::string_view text) : json(text) {}

    void skip_ws(){ while(i<json.size() && std::isspace((unsigned char)json[i])) ++i; }
    bool at_end(){ skip_ws(); return i>=json.size(); }
    bool consume(char c){ skip_ws(); if(i<json.size() && json[i]==c){ ++i; return true; } return false; }
    void expect(char c){ if(!consume(c)) fail(fmt::format("expected '{}'", c)); }
    char peek(){ skip_ws(); if(i>=json.size()) fail("unexpected end of document"); return json[i]; }

    [[noreturn]] void fail(const std::string& what) const {
        throw ConfigError(fmt::format("malformed filter config at offset {}: {}", i, what));
    }

    std::string string_value(){
        expect('"');
        std::string out;
        while(i<json.size()){
            char c = json[i++];
            if(c=='"') return out;
            if((unsigned char)c < 0x20) fail("control character in string");
            if(c!='\\'){ out.push_back(c); continue; }
            if(i>=json.size()) break;
            char e = json[i++];
            switch(e){
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': append_utf8(out, code_point()); break;
                default: fail("bad escape");
            }
        }
        fail("unterminated string");
    }

    // Skips any value; used for keys the filter does not know.
    void skip_value(int depth = 0){
        if(depth > 64) fail("nesting too deep");
        char c = peek();
        if(c=='"'){ string_value(); return; }
        if(c=='{'){
            ++i; if(consume('}')) return;
            do { string_value(); expect(':'); skip_value(depth+1); } while(consume(','));
            expect('}'); return;
        }
        if(c=='['){
            ++i; if(consume(']')) return;
            do { skip_value(depth+1); } while(consume(','));
            expect(']'); return;
        }
        for(const char* lit : {"true","false","null"}){
            std::string_view l(lit);
            if(json.substr(i, l.size())==l){ i+=l.size(); return; }
        }
        size_t start=i;
        while(i<json.size() && (std::isdigit((unsigned char)json[i]) || json[i]=='-' || json[i]=='+' || json[i]=='.' || json[i]=='e' || json[i]=='E')) ++i;
        if(i==start) fail("unexpected character");
    }

private:
    std::string_view json;
    size_t i{0};

    unsigned hex4(){
        if(i+4 > json.size()) fail("short \\u escape");
        unsigned v=0;
        for(int k=0;k<4;++k){
            char c=json[i++]; v<<=4;
            if(c>='0'&&c<='9') v|=unsigned(c-'0'); else if(c>='a'&&c<='f') v|=unsigned(10+c-'a'); else if(c>='A'&&c<='F') v|=unsigned(10+c-'A'); else fail("bad \\u escape");
        }
        return v;
    }
    // \uXXXX after the 'u'; a surrogate pair is joined into one code point.
    unsigned code_point(){
        unsigned cp = hex4();
        if(cp>=0xDC00 && cp<=0xDFFF) fail("lone low surrogate in \\u escape");
        if(cp>=0xD800 && cp<=0xDBFF){
            if(json.substr(i, 2)!="\\u") fail("high surrogate without its low half");
            i+=2;
            unsigned low = hex4();
            if(low<0xDC00 || low>0xDFFF) fail("high surrogate without its low half");
            cp = 0x10000 + ((cp-0xD800)<<10) + (low-0xDC00);
        }
        return cp;
    }
    static void append_utf8(std::string& out, unsigned cp){
        if(cp<0x80){ out.push_back(char(cp)); }
        else if(cp<0x800){ out.push_back(char(0xC0|(cp>>6))); out.push_back(char(0x80|(cp&0x3F))); }
        else if(cp<0x10000){ out.push_back(char(0xE0|(cp>>12))); out.push_back(char(0x80|((cp>>6)&0x3F))); out.push_back(char(0x80|(cp&0x3F))); }
        else { out.push_back(char(0xF0|(cp>>18))); out.push_back(char(0x80|((cp>>12)&0x3F))); out.push_back(char(0x80|((cp>>6)&0x3F))); out.push_back(char(0x80|(cp&0x3F))); }
    }
};

FilterMode parse_mode(const std::string& value){
    if(value=="Blacklist") return FilterMode::Deny;
    if(value=="Whitelist") return FilterMode::Allow;
    throw ConfigError(fmt::format("unknown filter mode '{}' (expected Blacklist or Whitelist)", value));
}
}

FilterRules parse_filter_rules(std::string_view json){
    JsonCursor cur(json);
    std::optional<FilterMode> mode;
    std::optional<std::vector<std::string>> domains;
    cur.expect('{');
    if(!cur.consume('}')){
        do {
            std::string key = cur.string_value();
            cur.expect(':');
            if(key=="mode"){
                if(cur.peek()!='"') cur.fail("mode must be a string");
                mode = parse_mode(cur.string_value());
            } else if(key=="domains"){
                cur.expect('[');
                std::vector<std::string> list;
                if(!cur.consume(']')){
                    do {
                        if(cur.peek()!='"') cur.fail("domains must be strings");
                        list.push_back(cur.string_value());
                    } while(cur.consume(','));
                    cur.expect(']');
                }
                domains = std::move(list);
            } else {
                cur.skip_value();
            }
        } while(cur.consume(','));
        cur.expect('}');
    }
    if(!cur.at_end()) cur.fail("trailing data after document");
    if(!mode) throw ConfigError("filter config is missing the 'mode' field");
    if(!domains) throw ConfigError("filter config is missing the 'domains' field");
    return FilterRules(*mode, std::move(*domains));
}

std::shared_ptr<const FilterRules> load_filter_rules(const std::string& path){
    std::error_code ec;
    if(!std::filesystem::is_regular_file(path, ec)) throw ConfigError(fmt::format("filter config file does not exist: {}", path));
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if(!ifs) throw ConfigError(fmt::format("failed to read filter config file {}", path));
    std::ostringstream oss; oss << ifs.rdbuf();
    if(ifs.bad()) throw ConfigError(fmt::format("failed to read filter config file {}", path));
    return std::make_shared<const FilterRules>(parse_filter_rules(oss.str()));
}
}
