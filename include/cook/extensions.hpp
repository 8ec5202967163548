// Optional grammar features and process environment configuration
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace cook {

enum class Extensions : uint32_t {
    None = 0,
    ComponentModifiers = 1u << 0,
    ComponentNote = 1u << 1,
    ComponentAlias = 1u << 2,
    Sections = 1u << 3,
    AdvancedUnits = 1u << 4,
    InlineQuantities = 1u << 5,
    RangeValues = 1u << 6,
    TimerRequiresTime = 1u << 7,
    IntermediatePreparations = 1u << 8,
    TextSteps = 1u << 9,
    All = (1u << 10) - 1
};

inline Extensions operator|(Extensions a, Extensions b) { return static_cast<Extensions>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b)); }
inline Extensions operator&(Extensions a, Extensions b) { return static_cast<Extensions>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b)); }
inline Extensions operator^(Extensions a, Extensions b) { return static_cast<Extensions>(static_cast<uint32_t>(a) ^ static_cast<uint32_t>(b)); }
inline Extensions operator~(Extensions a) { return static_cast<Extensions>(~static_cast<uint32_t>(a)) & Extensions::All; }
inline Extensions& operator|=(Extensions& a, Extensions b) { a = a | b; return a; }
inline Extensions& operator&=(Extensions& a, Extensions b) { a = a & b; return a; }

// True when every bit of `flag` is set in `set`.
inline bool has_extension(Extensions set, Extensions flag) { return (set & flag) == flag && flag != Extensions::None; }

// snake_case names as accepted by COOK_EXTENSIONS, e.g. "range_values".
const char* extension_name(Extensions single);
std::optional<Extensions> extension_from_name(std::string_view name);
// Parses "a,b,c" / "all" / "none". Unknown names are reported through `unknown` (comma joined).
Extensions parse_extension_list(std::string_view list, std::string* unknown = nullptr);

inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}
inline bool debug_parse_enabled(){ return flag_enabled("COOK_DEBUG_PARSE"); }

struct CookEnv {
    Extensions extensions = Extensions::All;
    bool diag_json = false;   // COOK_DIAG_JSON=1
    bool debug_parse = false; // COOK_DEBUG_PARSE=1
    bool suggest = true;      // COOK_SUGGEST=0 disables "did you mean" notes
};

// Reads COOK_EXTENSIONS, COOK_DISABLE_EXTENSIONS, COOK_DIAG_JSON, COOK_DEBUG_PARSE and COOK_SUGGEST.
CookEnv detect_env(Extensions defaults = Extensions::All);

} // namespace cook
