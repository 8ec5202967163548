#include <cstdlib>
#include <iostream>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "cook/cook.hpp"
#include "cook/recipe_json.hpp"

using namespace cook;

static std::optional<std::string> read_file(const std::string& path){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) return std::nullopt;
    std::stringstream ss; ss<<ifs.rdbuf();
    return ss.str();
}

static void usage(){ std::cerr << "usage: cook_driver <file> [--servings N] [--system metric|imperial] [--json]\n"; }

static void print_listing(const ScaledRecipe& r, const Converter& conv){
    for(const auto& [k, v] : r.metadata.entries()) std::cout << k << ": " << v << "\n";
    std::cout << "Ingredients:\n";
    for(const auto& ing : r.ingredients){
        if(!ing.relation.is_definition()) continue;
        std::cout << "  " << ing.display_name();
        GroupedQuantity g = group_quantities(ing, r.ingredients, conv);
        TotalQuantity t = g.total();
        for(size_t i=0;i<t.quantities.size();++i) std::cout << (i ? ", " : ": ") << to_string(t.quantities[i]);
        if(ing.note) std::cout << " (" << *ing.note << ")";
        std::cout << "\n";
    }
    std::cout << "Cookware:\n";
    for(const auto& cw : r.cookware){
        if(!cw.relation.is_definition()) continue;
        std::cout << "  " << cw.display_name();
        auto amounts = group_amounts(cw, r.cookware);
        for(size_t i=0;i<amounts.size();++i) std::cout << (i ? ", " : ": ") << amounts[i].to_string();
        std::cout << "\n";
    }
    for(const auto& s : r.sections){
        if(s.name) std::cout << "== " << *s.name << " ==\n";
        for(const auto& c : s.content){
            if(auto t = c.as_text()){ std::cout << "  > " << *t << "\n"; continue; }
            const Step& st = c.step();
            std::cout << "  " << st.number << ". ";
            for(const auto& it : st.items){
                switch(it.kind()){
                    case Item::Kind::Text: std::cout << *it.as_text(); break;
                    case Item::Kind::Ingredient: std::cout << r.ingredients[*it.index()].display_name(); break;
                    case Item::Kind::Cookware: std::cout << r.cookware[*it.index()].display_name(); break;
                    case Item::Kind::Timer: {
                        const auto& tm = r.timers[*it.index()];
                        if(tm.quantity) std::cout << to_string(*tm.quantity); else std::cout << tm.name.value_or("");
                        break;
                    }
                    case Item::Kind::InlineQuantity: std::cout << to_string(r.inline_quantities[*it.index()]); break;
                }
            }
            std::cout << "\n";
        }
    }
}

int main(int argc, char** argv){
    if(argc<2){ usage(); return 1; }
    std::string file;
    std::optional<uint32_t> servings;
    std::optional<System> system;
    bool json = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--json") json = true;
        else if(a=="--servings" && i+1<argc){
            std::string v = argv[++i];
            char* end = nullptr;
            unsigned long n = std::strtoul(v.c_str(), &end, 10);
            if(v.empty() || *end || n==0){ std::cerr << "invalid servings: " << v << "\n"; return 1; }
            servings = static_cast<uint32_t>(n);
        }
        else if(a=="--system" && i+1<argc){
            system = system_from_name(argv[++i]);
            if(!system){ std::cerr << "unknown system: " << argv[i] << "\n"; return 1; }
        }
        else if(file.empty() && a.rfind("--",0)!=0) file = a;
        else { usage(); return 1; }
    }
    if(file.empty()){ usage(); return 1; }
    auto contents = read_file(file);
    if(!contents){ std::cerr << "failed to read " << file << "\n"; return 1; }
    const std::string& src = *contents;

    RecipeParser parser = RecipeParser::from_env();
    ParseResult res = parser.parse(src);
    for(const auto& e : res.report.errors) std::cerr << file << ":" << format_diagnostic(e, src) << "\n";
    for(const auto& w : res.report.warnings) std::cerr << file << ":" << format_diagnostic(w, src) << "\n";
    if(!res.success) return 2;

    ScaledRecipe scaled = servings ? scale_to_servings(std::move(res.recipe), *servings) : default_scale(std::move(res.recipe));
    if(system){
        for(const auto& e : convert_recipe(scaled, *system, parser.converter())) std::cerr << "conversion: " << e.what() << "\n";
    }
    if(json) std::cout << recipe_to_json(scaled) << "\n";
    else print_listing(scaled, parser.converter());
    return 0;
}
