#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "cook/lexer.hpp"

using namespace cook;

static std::vector<TokenKind> kinds(const std::vector<Token>& ts){
    std::vector<TokenKind> out; for(auto &t: ts) out.push_back(t.kind); return out;
}

static void test_component_tokens(){
    auto ts = tokenize("@flour{1 1/2%cups}");
    std::vector<TokenKind> expected = {
        TokenKind::At, TokenKind::Word, TokenKind::OpenBrace, TokenKind::Int, TokenKind::Whitespace,
        TokenKind::Int, TokenKind::Slash, TokenKind::Int, TokenKind::Percent, TokenKind::Word,
        TokenKind::CloseBrace, TokenKind::Eof };
    assert(kinds(ts)==expected);
}

static void test_every_byte_covered(){
    std::string src = "Mix -- later\n[- hidden -] 01 and 0\r\n> x: \\@y ~ 180°C";
    auto ts = tokenize(src);
    size_t pos = 0;
    for(auto &t: ts){ assert(t.span.start==pos); pos = t.span.end; }
    assert(pos==src.size());
    assert(ts.back().kind==TokenKind::Eof && ts.back().span.empty());
}

static void test_special_kinds(){
    auto ts = tokenize("01 0 -- c\n[- b -]");
    assert(ts[0].kind==TokenKind::ZeroInt);
    assert(ts[2].kind==TokenKind::Int);
    assert(ts[4].kind==TokenKind::LineComment);
    assert(ts[5].kind==TokenKind::Newline);
    assert(ts[6].kind==TokenKind::BlockComment);
    auto w = tokenize("snake_case2");
    assert(w.size()==2 && w[0].kind==TokenKind::Word);
}

void run_lexer_smoke_test(){
    std::cout << "[cook] lexer smoke tests...\n";
    test_component_tokens();
    test_every_byte_covered();
    test_special_kinds();
    std::cout << "[cook] lexer smoke tests passed\n";
}
