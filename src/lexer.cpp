#include "cook/lexer.hpp"
#include "cook/extensions.hpp"
#include "lexer/grammar.hpp"
#include <cstdio>
#include <stdexcept>
#include <string>

namespace cook {

namespace lexer {

struct state {
    const char* base;
    std::vector<Token>& out;
    void push(TokenKind k, const char* begin, size_t size){
        size_t b = static_cast<size_t>(begin - base);
        out.push_back(Token{k, Span{b, b + size}});
    }
};

template<typename Rule>
struct action : tao::pegtl::nothing<Rule> {};

template<TokenKind K>
struct push_kind {
    template<typename ActionInput>
    static void apply(const ActionInput& in, state& st){ st.push(K, in.begin(), in.size()); }
};

template<> struct action<grammar::newline> : push_kind<TokenKind::Newline> {};
template<> struct action<grammar::ws> : push_kind<TokenKind::Whitespace> {};
template<> struct action<grammar::comment_line> : push_kind<TokenKind::LineComment> {};
template<> struct action<grammar::block_comment> : push_kind<TokenKind::BlockComment> {};
template<> struct action<grammar::zeroint> : push_kind<TokenKind::ZeroInt> {};
template<> struct action<grammar::int_lit> : push_kind<TokenKind::Int> {};
template<> struct action<grammar::word> : push_kind<TokenKind::Word> {};
template<> struct action<grammar::punct> : push_kind<TokenKind::Punctuation> {};

static TokenKind symbol_kind(char c){
    switch(c){
        case '@': return TokenKind::At;
        case '#': return TokenKind::Hash;
        case '~': return TokenKind::Tilde;
        case '{': return TokenKind::OpenBrace;
        case '}': return TokenKind::CloseBrace;
        case '(': return TokenKind::OpenParen;
        case ')': return TokenKind::CloseParen;
        case '%': return TokenKind::Percent;
        case '|': return TokenKind::Pipe;
        case '*': return TokenKind::Star;
        case '-': return TokenKind::Minus;
        case '/': return TokenKind::Slash;
        case '\\': return TokenKind::Backslash;
        case ':': return TokenKind::Colon;
        case '=': return TokenKind::Equal;
        case '>': return TokenKind::Greater;
        case '&': return TokenKind::And;
        case '?': return TokenKind::Question;
        case '+': return TokenKind::Plus;
        default: break;
    }
    return TokenKind::Punctuation;
}

template<> struct action<grammar::symbol> {
    template<typename ActionInput>
    static void apply(const ActionInput& in, state& st){ st.push(symbol_kind(*in.begin()), in.begin(), in.size()); }
};

} // namespace lexer

std::vector<Token> tokenize(std::string_view src){
    std::vector<Token> out;
    out.reserve(src.size() / 3 + 1);
    tao::pegtl::memory_input in(src.data(), src.size(), "recipe");
    lexer::state st{src.data(), out};
    // The token rule covers every byte, a failed match is a grammar bug.
    if(!tao::pegtl::parse< lexer::grammar::tokens, lexer::action >(in, st))
        throw std::logic_error("tokenizer did not consume the whole input");
    out.push_back(Token{TokenKind::Eof, Span::pos(src.size())});
    if(debug_parse_enabled()) std::fprintf(stderr, "[dbg][lexer] bytes=%zu tokens=%zu\n", src.size(), out.size());
    return out;
}

const char* token_kind_name(TokenKind k){
    switch(k){
        case TokenKind::Word: return "word";
        case TokenKind::Int: return "int";
        case TokenKind::ZeroInt: return "zeroint";
        case TokenKind::Punctuation: return "punctuation";
        case TokenKind::Whitespace: return "ws";
        case TokenKind::Newline: return "newline";
        case TokenKind::LineComment: return "line comment";
        case TokenKind::BlockComment: return "block comment";
        case TokenKind::At: return "@";
        case TokenKind::Hash: return "#";
        case TokenKind::Tilde: return "~";
        case TokenKind::OpenBrace: return "{";
        case TokenKind::CloseBrace: return "}";
        case TokenKind::OpenParen: return "(";
        case TokenKind::CloseParen: return ")";
        case TokenKind::Percent: return "%";
        case TokenKind::Pipe: return "|";
        case TokenKind::Star: return "*";
        case TokenKind::Minus: return "-";
        case TokenKind::Slash: return "/";
        case TokenKind::Backslash: return "\\";
        case TokenKind::Colon: return ":";
        case TokenKind::Equal: return "=";
        case TokenKind::Greater: return ">";
        case TokenKind::And: return "&";
        case TokenKind::Question: return "?";
        case TokenKind::Plus: return "+";
        case TokenKind::Eof: return "eof";
    }
    return "?";
}

} // namespace cook
