#include "cook/extensions.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>

namespace cook {

namespace {
struct ExtensionName { Extensions flag; const char* name; };
const ExtensionName kExtensionNames[] = {
    {Extensions::ComponentModifiers, "component_modifiers"},
    {Extensions::ComponentNote, "component_note"},
    {Extensions::ComponentAlias, "component_alias"},
    {Extensions::Sections, "sections"},
    {Extensions::AdvancedUnits, "advanced_units"},
    {Extensions::InlineQuantities, "inline_quantities"},
    {Extensions::RangeValues, "range_values"},
    {Extensions::TimerRequiresTime, "timer_requires_time"},
    {Extensions::IntermediatePreparations, "intermediate_preparations"},
    {Extensions::TextSteps, "text_steps"},
};

std::string trim_lower(std::string_view s){
    size_t b = 0, e = s.size();
    while(b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    std::string out(s.substr(b, e - b));
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}
} // namespace

const char* extension_name(Extensions single){
    for(const auto& e : kExtensionNames) if(e.flag == single) return e.name;
    return "?";
}

std::optional<Extensions> extension_from_name(std::string_view name){
    std::string n = trim_lower(name);
    for(const auto& e : kExtensionNames) if(n == e.name) return e.flag;
    return std::nullopt;
}

Extensions parse_extension_list(std::string_view list, std::string* unknown){
    Extensions out = Extensions::None;
    size_t pos = 0;
    while(pos <= list.size()){
        size_t comma = list.find(',', pos);
        if(comma == std::string_view::npos) comma = list.size();
        std::string item = trim_lower(list.substr(pos, comma - pos));
        pos = comma + 1;
        if(item.empty() || item == "none") continue;
        if(item == "all"){ out |= Extensions::All; continue; }
        if(auto e = extension_from_name(item)) out |= *e;
        else if(unknown){ if(!unknown->empty()) *unknown += ","; *unknown += item; }
    }
    return out;
}

// Reads process env vars and constructs a CookEnv.
CookEnv detect_env(Extensions defaults){
    CookEnv e{};
    e.extensions = defaults;
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    std::string unknown;
    if(const char* v = get("COOK_EXTENSIONS")) e.extensions = parse_extension_list(v, &unknown);
    if(const char* v = get("COOK_DISABLE_EXTENSIONS")) e.extensions &= ~parse_extension_list(v, &unknown);

    e.diag_json = flag_enabled("COOK_DIAG_JSON");
    e.debug_parse = flag_enabled("COOK_DEBUG_PARSE");
    if(const char* v = get("COOK_SUGGEST")) e.suggest = v[0] != '0';

    if(e.debug_parse){
        std::fprintf(stderr, "[dbg][env] extensions=0x%x suggest=%d\n", static_cast<unsigned>(e.extensions), e.suggest ? 1 : 0);
        if(!unknown.empty()) std::fprintf(stderr, "[dbg][env] unknown extensions ignored: %s\n", unknown.c_str());
    }
    return e;
}

} // namespace cook
