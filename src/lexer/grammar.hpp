#pragma once
#include <tao/pegtl.hpp>

namespace cook::lexer::grammar {
using namespace tao::pegtl;

// Layout
struct newline : sor< string<'\r','\n'>, one<'\n'> > {};
struct blank_char : sor< one<' ','\t','\v','\f'>, seq< one<'\r'>, not_at< one<'\n'> > > > {};
struct ws : plus< blank_char > {};
struct space_char : one<' ','\t','\n','\r','\v','\f'> {};

// Comments: "-- to end of line" and "[- block -]"
struct comment_line : seq< two<'-'>, until< at< sor< one<'\n'>, string<'\r','\n'>, eof > > > > {};
struct block_comment : seq< one<'['>, one<'-'>, until< seq< one<'-'>, one<']'> > > > {};

// Numbers. Leading zeros get their own kind so "01" is never a plain number.
struct zeroint : seq< one<'0'>, plus< digit > > {};
struct int_lit : plus< digit > {};

// Grammar symbols and the rest of ASCII punctuation ('_' belongs to words)
struct symbol : one<'@','#','~','{','}','(',')','%','|','*','-','/','\\',':','=','>','&','?','+'> {};
struct punct : one<'!','"','$','\'',',','.',';','<','[',']','^','`'> {};

struct word_char : seq< not_at< sor< space_char, symbol, punct > >, any > {};
struct word : seq< not_at< digit >, plus< word_char > > {};

struct token : sor< newline, ws, comment_line, block_comment, zeroint, int_lit, word, symbol, punct > {};
struct tokens : seq< star< token >, eof > {};

} // namespace cook::lexer::grammar
