#include <cassert>
#include <iostream>
#include <string>
#include "cook/cook.hpp"
#include "cook/extensions.hpp"
#include "test_env.hpp"

using namespace cook;

static void test_defaults(){
    _putenv("COOK_EXTENSIONS=");
    _putenv("COOK_DISABLE_EXTENSIONS=");
    _putenv("COOK_SUGGEST=");
    auto env = detect_env();
    assert(env.extensions==Extensions::All);
    assert(env.suggest);
}

static void test_extension_list(){
    ScopedEnv on("COOK_EXTENSIONS", "range_values, Sections");
    auto env = detect_env();
    assert(env.extensions==(Extensions::RangeValues|Extensions::Sections));
    {
        ScopedEnv off("COOK_DISABLE_EXTENSIONS", "sections");
        assert(detect_env().extensions==Extensions::RangeValues);
    }
    std::string unknown;
    auto e = parse_extension_list("all,bogus,none", &unknown);
    assert(e==Extensions::All);
    assert(unknown=="bogus");
    assert(extension_from_name("timer-requires-time")==Extensions::TimerRequiresTime);
    assert(std::string(extension_name(Extensions::TextSteps))=="text_steps");
}

static void test_suggest_flag(){
    ScopedEnv s("COOK_SUGGEST", "0");
    assert(!detect_env().suggest);
    auto p = RecipeParser::from_env();
    auto res = p.parse("Use @butter{} and then @&buter{}.");
    assert(res.report.errors.size()==1);
    assert(res.report.errors[0].notes.empty());
}

static void test_env_disables_ranges(){
    ScopedEnv off("COOK_DISABLE_EXTENSIONS", "range_values");
    auto p = RecipeParser::from_env();
    auto res = p.parse("@eggs{2-3}");
    const auto& v = res.recipe.ingredients.at(0).quantity->value.as_single()->value.value;
    assert(v.is_text() && *v.as_text()=="2-3");
}

void run_env_tests(){
    std::cout << "[cook] env tests...\n";
    test_defaults();
    test_extension_list();
    test_suggest_flag();
    test_env_disables_ranges();
    std::cout << "[cook] env tests passed\n";
}
