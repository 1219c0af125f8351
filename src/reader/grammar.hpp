#pragma once
#include <tao/pegtl.hpp>

namespace lintexpand::reader_front::grammar {
using namespace tao::pegtl;

// Whitespace, commas and line comments separate forms
struct line_comment : seq< one<';'>, until< eolf > > {};
struct separator : sor< space, one<','>, line_comment > {};
struct skip : star< separator > {};

struct form;

// "text" with backslash escapes
struct string_escape : seq< one<'\\'>, any > {};
struct string_char : sor< string_escape, not_one<'"', '\\'> > {};
struct string_open : one<'"'> {};
struct string_close : one<'"'> {};
struct string_lit : if_must< string_open, star< string_char >, string_close > {};

// Collections
struct list_open : one<'('> {};
struct list_close : one<')'> {};
struct list_form : if_must< list_open, skip, star< form, skip >, list_close > {};

struct vector_open : one<'['> {};
struct vector_close : one<']'> {};
struct vector_form : if_must< vector_open, skip, star< form, skip >, vector_close > {};

struct map_open : one<'{'> {};
struct map_close : one<'}'> {};
struct map_form : if_must< map_open, skip, star< form, skip >, map_close > {};

// 'x  ->  (quote x)
struct quote_open : one<'\''> {};
struct quoted : if_must< quote_open, skip, form > {};

// #_x  ->  nothing
struct discard_open : string<'#','_'> {};
struct discarded : if_must< discard_open, skip, form > {};

// #"re"  ->  string literal holding the pattern text as written
struct regex_open : string<'#','"'> {};
struct regex_lit : if_must< regex_open, star< string_char >, string_close > {};

// #'x  ->  (var x)
struct var_open : string<'#','\''> {};
struct var_quoted : if_must< var_open, skip, form > {};

// @x  ->  (deref x)
struct deref_open : one<'@'> {};
struct dereferenced : if_must< deref_open, skip, form > {};

// #(f %)  ->  (fn* (f %))
struct fn_open : string<'#','('> {};
struct fn_literal : if_must< fn_open, skip, star< form, skip >, list_close > {};

// #{a b}  ->  (hash-set a b)
struct set_open : string<'#','{'> {};
struct set_form : if_must< set_open, skip, star< form, skip >, map_close > {};

// Reader conditionals (#?, #?@) have no node kind
struct dispatch_unsupported : seq< one<'#'>, one<'?'> > {};

// Tokens: symbols, keywords, numbers, nil/true/false, \c characters
struct token_char : not_one< ' ', '\t', '\n', '\r', '\f', '\v', ',', ';', '"', '(', ')', '[', ']', '{', '}' > {};
struct char_lit : seq< one<'\\'>, any, star< token_char > > {};
struct token_rule : plus< token_char > {};

struct form : sor< string_lit, list_form, vector_form, map_form, quoted, dereferenced, discarded,
                   regex_lit, var_quoted, fn_literal, set_form, dispatch_unsupported, char_lit, token_rule > {};

struct file_rule : must< skip, star< form, skip >, eof > {};

} // namespace lintexpand::reader_front::grammar
