#include <cassert>
#include <iostream>
#include <string>
#include "cook/cook.hpp"
#include "cook/diagnostics_json.hpp"

using namespace cook;

// Parse and capture JSON via direct call (no COOK_DIAG_JSON needed)
static std::string to_json(const std::string& src){
    RecipeParser p;
    auto res = p.parse(src);
    return diagnostics_to_json(res.report, src);
}

static void test_json_success(){
    auto js = to_json("Add @salt{1%tsp} to #pot.");
    assert(js.find("\"success\":true")!=std::string::npos);
    assert(js.find("\"errors\":[]")!=std::string::npos);
    assert(js.find("\"warnings\":[]")!=std::string::npos);
}

static void test_json_error_with_hint(){
    // division by zero on line 2
    auto js = to_json("Mix well.\n\nAdd @flour{1/0%cup}.");
    assert(js.find("\"success\":false")!=std::string::npos);
    auto pos = js.find("E0104");
    assert(pos!=std::string::npos);
    assert(js.find("\"line\":3", pos)!=std::string::npos);
    auto hints = js.find("\"hints\":[\"", pos);
    assert(hints!=std::string::npos);
}

static void test_json_suggestion_note(){
    auto js = to_json("Use @butter{} and then @&buter{}.");
    auto pos = js.find("E0209");
    assert(pos!=std::string::npos);
    auto notes = js.find("\"notes\":[", pos);
    assert(notes!=std::string::npos);
    assert(js.find("did you mean 'butter'?", notes)!=std::string::npos);
}

static void test_escape(){
    assert(json_escape("a\"b\\c\n")=="\"a\\\"b\\\\c\\n\"");
    assert(json_escape(std::string(1, '\x01'))=="\"\\u0001\"");
}

int run_diagnostics_json_tests(){
    std::cout << "[cook] diagnostics JSON tests...\n";
    test_json_success();
    test_json_error_with_hint();
    test_json_suggestion_note();
    test_escape();
    std::cout << "[cook] diagnostics JSON tests passed\n";
    return 0;
}
