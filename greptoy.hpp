#ifndef _GREPTOY_HPP_
#define _GREPTOY_HPP_
/*****************************************************************************
  Tiny backtracking matcher for a grep-like regex subset

    Knows literals, \d, \w, [...] and [^...] classes, the ^ and $ anchors,
    and the + and ? quantifiers. Nothing else: no groups, no alternation,
    no {m,n}, no .* (well, no dot at all). It's a toy, but an honest one.

    The matching is the classic "try greedy, then back off" recursion, so
    it can go exponential with a bunch of adjacent quantifiers. That's
    accepted: only the match/no-match outcome matters here.

  NOTE:

  - Patterns and input are UTF-8 (decoded with ICU's U8_NEXT), matched char
    by char (code points, that is), so "[^x]" eats a whole "é". But \d and
    \w are still ASCII only.

  - Broken patterns are not errors: a dangling \ is dropped, and an
    unterminated [ class eats the rest of the pattern. Keep it that way!

  - If you need to #include this in more than one translation units, then
    #define GREPTOY_DEDUP for all but the first one. (This way the most
    common use case of only including it once can be kept the simplest.)

 -----------------------------------------------------------------------------
  TODO:

  - An explicit work stack in Matcher::attempt() instead of the recursion,
    as patterns of a few hundred thousand tokens could overflow the stack.

 *****************************************************************************/

//=============================================================================
//---------------------------------------------------------------------------
// Ground-levelling base layer (tracing, errors, a few toy macros)...
//---------------------------------------------------------------------------
#include <cassert>
#include <exception>
#include <stdexcept>
#include <format>
	using std::format;
#include <string>
	using std::string;
	using namespace std::literals::string_literals;
#ifndef NDEBUG
#include <iostream>
	using std::cerr, std::endl;
#endif

//!!
//!! These plain macros conflict with the Windows headers (included by doctest),
//!! so they are #undef'd at the end!
//!!
#define CONST constexpr static auto
#define OUT

//! For variadic macros, e.g. for calling std::format(...):
//! GCC & CLANG (and the new MSVC preproc., /Zc:preprocessor) understand
//! __VA_OPT__, the traditional MSVC one only swallows the dangling ','.
#if defined(__GNUC__) \
	|| defined(_MSC_VER) && (!defined(_MSVC_TRADITIONAL) || !_MSVC_TRADITIONAL)
#  define _GREPTOY_CONFORMANT_PREPROCESSOR 1
#elif defined(_MSC_VER) && defined(_MSVC_TRADITIONAL) && _MSVC_TRADITIONAL // Old MS prep.
#  define _GREPTOY_OLD_MSVC_PREPROCESSOR 1
#endif

#ifndef NDEBUG
#  if defined(_GREPTOY_CONFORMANT_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg __VA_OPT__(,) __VA_ARGS__)) << std::endl
     // Same as DBG(), but with no trailing \n (for continuation lines)
#    define DBG_(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg __VA_OPT__(,) __VA_ARGS__))
     // Continuation lines: same as DBG(), but without the prefix
#    define _DBG(msg, ...) std::cerr << std::format(msg __VA_OPT__(,) __VA_ARGS__) << std::endl
     // Line fragment: no prefix, no trailing \n
#    define _DBG_(msg, ...) std::cerr << std::format(msg __VA_OPT__(,) __VA_ARGS__)
#  elif defined(_GREPTOY_OLD_MSVC_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg, __VA_ARGS__)) << std::endl
#    define DBG_(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg, __VA_ARGS__))
#    define _DBG(msg, ...) std::cerr << std::format(msg, __VA_ARGS__) << std::endl
#    define _DBG_(msg, ...) std::cerr << std::format(msg, __VA_ARGS__)
#  else
#    error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#  endif

#  define DBG_DEFAULT_TRIM_LEN 30
   // Trim length is ignored as yet, just using the default:
#  define DBG_TRIM(str, ...) (std::string_view(str).length() > DBG_DEFAULT_TRIM_LEN - 3 ? \
		(std::string(std::string_view(str).substr(0, DBG_DEFAULT_TRIM_LEN - 3))) + "..." : \
		std::string(str))
#else
#  define DBG(msg, ...)
#  define DBG_(msg, ...)
#  define _DBG(msg, ...)
#  define _DBG_(msg, ...)
#  define DBG_TRIM(str, ...) std::string(str)
#endif


// Note: ERROR() below is _not_ a debug feature!
#if defined(_GREPTOY_CONFORMANT_PREPROCESSOR)
#  define ERROR(msg, ...) throw std::runtime_error(std::format("- ERROR: {}", std::format(msg __VA_OPT__(,) __VA_ARGS__)))
#elif defined(_GREPTOY_OLD_MSVC_PREPROCESSOR)
#  define ERROR(msg, ...) throw std::runtime_error(std::format("- ERROR: {}", std::format(msg, __VA_ARGS__)))
#else
#  error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#endif

// Tame MSVC -Wall just a little
#ifdef _MSC_VER
#  pragma warning(disable:5045) // Compiler will insert Spectre mitigation for memory load if /Qspectre switch specified
#  pragma warning(disable:4514) // unreferenced inline function has been removed
#endif
//---------------------------------------------------------------------------
//=============================================================================


//---------------------------------------------------------------------------
#include <string_view>
	using std::string_view, std::u32string_view;
	using std::u32string;
#include <cstdint>
#include <unicode/utf8.h> // U8_NEXT, U8_APPEND_UNSAFE
#include <functional> // function
#include <memory> // shared_ptr
#include <utility> // move
#include <vector>
#include <unordered_map>


//---------------------------------------------------------------------------
namespace Matching {

	void init(); // Implicitly called by tokenize() and Matcher(); harmless to call again.

	//-------------------------------------------------------------------
	// UTF-8 <-> code points...

	// Ill-formed sequences become U+FFFD, one per maximal invalid subsequence
	// (as ICU does it); returns false if there were any.
	inline bool utf8_decode(string_view s, OUT u32string& out)
	{
		out.clear();
		bool valid = true;
		auto bytes = reinterpret_cast<const uint8_t*>(s.data());
		auto length = int32_t(s.length());
		for (int32_t i = 0; i < length; )
		{
			UChar32 cp;
			U8_NEXT(bytes, i, length, cp);
			if (cp < 0) { cp = 0xFFFD; valid = false; }
			out += char32_t(cp);
		}
		return valid;
	}
	inline u32string utf8_decode(string_view s)
	{
		u32string out;
		utf8_decode(s, out);
		return out;
	}

	inline void utf8_append(OUT string& out, char32_t cp)
	{
		uint8_t buf[U8_MAX_LENGTH];
		int32_t n = 0;
		U8_APPEND_UNSAFE(buf, n, cp);
		out.append(reinterpret_cast<const char*>(buf), size_t(n));
	}
	inline string utf8_encode(u32string_view s)
	{
		string out;
		for (auto cp : s) utf8_append(out, cp);
		return out;
	}

	//-------------------------------------------------------------------
	// Quantifiers...
	//
	// Only these two come from the pattern syntax, but the operator table
	// below can be extended by users for hand-built tokens.
	using OPCODE = int;

	CONST _MANY = OPCODE('+');  // 1 or more (greedy, then backing off one by one); expects 1 atom
	CONST _OPT  = OPCODE('?');  // 0 or 1 (tries 1 first); expects 1 atom

	struct Token;
	class Matcher;
	using Tokens = std::vector<Token>;

	// Quantifier operator: tries to match `atom` some times at `pos`, and
	// then the rest of the pattern (from token_index + 1) after that.
	using QUANTIFIER = std::function<bool(Matcher&, size_t token_index, size_t pos, const Token& atom, OUT size_t& end)>;
	using QUANTIFIER_MAP = std::unordered_map<OPCODE, QUANTIFIER>;
	extern QUANTIFIER_MAP QUANTIFIERS; // Populated by init()


//---------------------------------------------------------------------------
// Pattern tokens...
//---------------------------------------------------------------------------
struct Token
{
	enum Type {
		DIGIT,      // \d
		WORD,       // \w
		LITERAL,
		CHAR_CLASS, // [...] or [^...]
		REPEATED,   // atom with a quantifier suffix
	} type;

	char32_t  literal = 0;  // LITERAL
	u32string members;      // CHAR_CLASS (duplicates are fine, only membership counts)
	bool   negated = false; // CHAR_CLASS
	OPCODE quantifier = 0;  // REPEATED
	std::shared_ptr<const Token> atom; // REPEATED: always an atom, never another REPEATED

	//-----------------------------------------------------------
	// Construction...
	Token(Type t): type(t) {
		if (t != DIGIT && t != WORD) {
			ERROR("Token type #{} can't be created without a payload!", int(t));
		}
	}
	Token(char32_t c): type(LITERAL), literal(c) {}
	Token(char c): Token(char32_t((unsigned char)c)) {} // ASCII, really
	Token(u32string set, bool neg): type(CHAR_CLASS), members(std::move(set)), negated(neg) {}
	Token(string_view utf8_set, bool neg): Token(utf8_decode(utf8_set), neg) {}
	Token(OPCODE q, Token a): type(REPEATED), quantifier(q) {
		if (!a.is_atom()) {
			ERROR("Quantifier '{}' applied to {}: only atoms can be repeated!", char(q), a.str());
		}
		atom = std::make_shared<const Token>(std::move(a));
	}

	//-----------------------------------------------------------
	// Queries...
	bool is_atom() const { return type != REPEATED; }
	bool is_repeated() const { return type == REPEATED; }

	// Character predicate of atoms. \d and \w are ASCII only, regardless of the locale.
	bool accepts(char32_t c) const
	{
		switch (type) {
		case DIGIT:      return _is_digit(c);
		case WORD:       return _is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
		case LITERAL:    return c == literal;
		case CHAR_CLASS: return (members.find(c) != u32string::npos) != negated;
		case REPEATED:   break;
		}
		ERROR("Token {} is not an atom, it has no character predicate!", str());
	}

	bool operator==(const Token& other) const
	{
		if (type != other.type) return false;
		switch (type) {
		case DIGIT:
		case WORD:       return true;
		case LITERAL:    return literal == other.literal;
		case CHAR_CLASS: return members == other.members && negated == other.negated;
		case REPEATED:   return quantifier == other.quantifier && *atom == *other.atom;
		}
		return false;
	}

	//-----------------------------------------------------------
	// Back to pattern syntax: tokenize(syntax()) gives this token again,
	// whenever that's possible at all. (It's not for a class with a ']' in
	// it, or a non-negated one starting with '^'; and a '$' literal can't
	// end an unanchored pattern.)
	string syntax() const
	{
		switch (type) {
		case DIGIT:      return "\\d";
		case WORD:       return "\\w";
		case LITERAL:    return literal < 0x80 && string_view("\\[+?^$").find(char(literal)) != string_view::npos
		                        ? "\\"s + char(literal) : utf8_encode(u32string_view(&literal, 1));
		case CHAR_CLASS: return format("[{}{}]", negated ? "^" : "", utf8_encode(members));
		case REPEATED:   return format("{}{}", atom->syntax(), char(quantifier));
		}
		return "";
	}

	//-----------------------------------------------------------
	// Diagnostics...
	string str() const
	{
		switch (type) {
		case DIGIT:      return "\\d";
		case WORD:       return "\\w";
		case LITERAL:    return format("'{}'", utf8_encode(u32string_view(&literal, 1)));
		case CHAR_CLASS: return format("[{}{}]", negated ? "^" : "", utf8_encode(members));
		case REPEATED:   return format("{}{}", atom->str(), char(quantifier));
		}
		return "!!BUG: MISSING NAME FOR Token TYPE!!";
	}
#ifndef NDEBUG
	void DUMP() const { cerr << "     " << str() << endl; }
#else
	void DUMP() const {}
#endif

private:
	static bool _is_digit(char32_t c) { return c >= '0' && c <= '9'; }
};


//---------------------------------------------------------------------------
// Compiled patterns...
//---------------------------------------------------------------------------
struct Anchors
{
	bool start = false; // ^
	bool end   = false; // $
};

// Drop a leading ^ and then a trailing $, recording them in `anchors`.
// Returns the rest: the pattern body.
string_view strip_anchors(string_view pattern, OUT Anchors& anchors);

// Turn a pattern body (UTF-8, anchors already stripped) into tokens. Never fails.
Tokens tokenize(string_view body);

struct Pattern
{
	string  source; // As given (or, for hand-built patterns, as rendered by Token::syntax())
	Anchors anchors;
	string  body;   // source without the anchors
	Tokens  tokens; // tokenize(body)

	Pattern(string_view pattern);
	Pattern(const char* pattern) : Pattern(string_view(pattern)) {} // One implicit conversion is all C++ allows...
	Pattern(const string& pattern) : Pattern(string_view(pattern)) {}
	Pattern(Tokens hand_built, Anchors a = {});

	//-----------------------------------------------------------
	// Diagnostics...
#ifndef NDEBUG
	void DUMP() const {
		cerr << "/------------------------------------------------------------------\\" << endl;
		cerr << format("     pattern: \"{}\"{}{}", source,
			anchors.start ? " (^)" : "", anchors.end ? " ($)" : "") << endl;
		if (tokens.empty()) cerr << "     <no tokens>" << endl;
		for (auto& t : tokens) t.DUMP();
		cerr << "\\------------------------------------------------------------------/\n" << endl;
	}
#else
	void DUMP() const {}
#endif
};


//---------------------------------------------------------------------------
class Matcher
//---------------------------------------------------------------------------
{
public:
	//-------------------------------------------------------------------
	// Matcher state...

	// Input:
	const Pattern pattern;
	u32string text; // Decoded from UTF-8; all the positions are code point indexes
	size_t text_length;

	// Results; valid only after a successful match():
	size_t match_pos;
	size_t match_len;

	// Diagnostics:
	int loopguard;
	int depth_reached;
	int attempts;
	int terminals_tried;

	CONST DEPTH_FROM_PATTERN = 0; // maxnest = tokens + 2: one level per token, the last "nothing left" one, and the guard's zero
	const int maxnest;

	void _reset_counters()
	{
		loopguard = maxnest;
		depth_reached = maxnest;
		attempts = 0;
		terminals_tried = 0;
	}

	void _reset_results()
	{
		_reset_counters();
		match_pos = 0;
		match_len = 0;
	}

	void _set_text(const string& txt)
	{
		_reset_results();
		bool valid [[maybe_unused]] = utf8_decode(txt, text);
#ifndef NDEBUG
if (!valid) { auto src = DBG_TRIM(txt);
DBG("_set_text: invalid UTF-8 in \"{}\", replaced by U+FFFD", src); }
#endif
		text_length = text.length();
	}

	//-------------------------------------------------------------------
	Matcher(const Pattern& pattern, int maxnest = DEPTH_FROM_PATTERN):
		// Sync with _reset*()!
		pattern(pattern),
		text_length(0),
		match_pos(0),
		match_len(0),
		maxnest(maxnest > 0 ? maxnest : int(pattern.tokens.size()) + 2)
	{
		_reset_counters();
		init();
	}

	Matcher(const Matcher& other) = delete;
	Matcher& operator=(const Matcher& other) = delete;
	Matcher(Matcher&&) = delete;

	//-------------------------------------------------------------------
	// Try every allowed start offset, leftmost first
	bool match(const string& txt)
	{
		size_t pos_ignored, len_ignored;
		return match(txt, pos_ignored, len_ignored);
	}
	bool match(const string& txt, OUT size_t& pos, OUT size_t& len);

	string matched() const { return utf8_encode(u32string_view(text).substr(match_pos, match_len)); }

	//-------------------------------------------------------------------
	bool attempt(size_t token_index, size_t pos, OUT size_t& end)
	// Match pattern.tokens[token_index..] against `text` from `pos`.
	// On success `end` is the offset right after the last consumed char.
	//-------------------------------------------------------------------
	{
		--loopguard;
		if (depth_reached > loopguard)
		    depth_reached = loopguard;
		if (!loopguard) {
			ERROR("Recursion level {} is too deep (in attempt())!", maxnest);
		}
		++attempts;

		auto res = _attempt(token_index, pos, end);

		++loopguard;
		return res;
	}

	// Does the code point at `pos` (if any) satisfy the atom?
	bool accepts(const Token& atom, size_t pos)
	{
		++terminals_tried;
		return pos < text_length && atom.accepts(text[pos]);
	}

private:
	bool _attempt(size_t token_index, size_t pos, OUT size_t& end)
	{
		const auto& tokens = pattern.tokens;

		if (token_index == tokens.size()) { // Nothing more to match
			end = pos;
			return true;
		}

		const Token& token = tokens[token_index];
		if (token.is_atom()) {
			return accepts(token, pos) && attempt(token_index + 1, pos + 1, end);
		}

		return quantifier_handler(token)(*this, token_index, pos, *token.atom, end);
	}

	const QUANTIFIER& quantifier_handler(const Token& token) const
	{
		assert(token.is_repeated());
		assert(!QUANTIFIERS.empty());

		if (auto it = QUANTIFIERS.find(token.quantifier); it != QUANTIFIERS.end()) {
			return it->second;
		} else {
			ERROR("Unimplemented quantifier: {} ('{}')", token.quantifier, char(token.quantifier));
		}
	}
};


//---------------------------------------------------------------------------
// Line-level front-end
//---------------------------------------------------------------------------

// Strip trailing whitespace, incl. any "\n" or "\r\n" line ending
inline string_view trim_line_end(string_view line)
{
	auto last = line.find_last_not_of(" \t\n\v\f\r");
	return last == string_view::npos ? string_view() : line.substr(0, last + 1);
}

inline bool match_line(string_view line, const Pattern& pattern)
{
	Matcher m(pattern);
	return m.match(string(trim_line_end(line)));
}

} // namespace


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//


#ifndef GREPTOY_DEDUP
//===========================================================================
namespace Matching {

	QUANTIFIER_MAP QUANTIFIERS = {};

void init()
{
	static auto initialized = false;
	if (initialized) return;

	assert(QUANTIFIERS.empty());

	//-------------------------------------------------------------------
	QUANTIFIERS[_MANY] = [](Matcher& m, size_t token_index, size_t pos, const Token& atom, OUT size_t& end) -> bool
	{
		size_t run = 0;
		while (m.accepts(atom, pos + run)) ++run;
		if (!run) return false; // At least one is a must

DBG("_MANY {}: longest run at {}: {}", atom.str(), pos, run);
		for (auto n = run; n >= 1; --n)
		{
			if (m.attempt(token_index + 1, pos + n, end)) return true;
if (n > 1) DBG("_MANY {}: backing off to {}...", atom.str(), n - 1);
		}
		return false;
	};

	//-------------------------------------------------------------------
	QUANTIFIERS[_OPT] = [](Matcher& m, size_t token_index, size_t pos, const Token& atom, OUT size_t& end) -> bool
	{
		if (m.accepts(atom, pos) && m.attempt(token_index + 1, pos + 1, end)) {
			return true;
		}
DBG("_OPT {}: trying without it at {}", atom.str(), pos);
		return m.attempt(token_index + 1, pos, end);
	};

	assert(!QUANTIFIERS.empty());
	initialized = true;
DBG("+++ Static init done. +++");
} // init()


//---------------------------------------------------------------------------
string_view strip_anchors(string_view pattern, OUT Anchors& anchors)
{
	anchors = {};
	if (pattern.starts_with('^')) {
		anchors.start = true;
		pattern.remove_prefix(1);
	}
	if (pattern.ends_with('$')) {
		anchors.end = true;
		pattern.remove_suffix(1);
	}
	return pattern;
}


//---------------------------------------------------------------------------
Tokens tokenize(string_view utf8_body)
// One atom at a time, each optionally followed by a quantifier char.
//---------------------------------------------------------------------------
{
	init();

	u32string body;
	if (!utf8_decode(utf8_body, body)) {
DBG("tokenize: invalid UTF-8 in \"{}\", replaced by U+FFFD", utf8_body);
	}

	Tokens tokens;
	size_t i = 0;
	auto at_end = [&] { return i >= body.length(); };

	while (!at_end())
	{
		char32_t c = body[i++];
		Token atom = c;

		if (c == '\\')
		{
			if (at_end()) {
DBG("tokenize: dropped the dangling '\\' at the end of \"{}\"", utf8_body);
				break;
			}
			char32_t escaped = body[i++];
			if      (escaped == 'd') atom = Token::DIGIT;
			else if (escaped == 'w') atom = Token::WORD;
			else                     atom = escaped;
		}
		else if (c == '[')
		{
			bool negated = !at_end() && body[i] == '^';
			if (negated) ++i;

			u32string members;
			bool closed = false;
			while (!at_end()) {
				char32_t m = body[i++];
				if (m == ']') { closed = true; break; }
				members += m;
			}
if (!closed) DBG("tokenize: unterminated class \"{}\" runs to the end", utf8_encode(members));
			atom = Token(std::move(members), negated);
		}

		if (!at_end() && (body[i] == _MANY || body[i] == _OPT)) {
			tokens.emplace_back(OPCODE(body[i++]), std::move(atom));
		} else {
			tokens.push_back(std::move(atom));
		}
DBG("tokenize: {}", tokens.back().str());
	}
	return tokens;
}


//---------------------------------------------------------------------------
Pattern::Pattern(string_view pattern)
	: source(pattern)
{
	body = strip_anchors(pattern, anchors);
	tokens = tokenize(body);
}

Pattern::Pattern(Tokens hand_built, Anchors a)
	: anchors(a), tokens(std::move(hand_built))
{
	init();
	for (auto& t : tokens) body += t.syntax();
	source = format("{}{}{}", anchors.start ? "^" : "", body, anchors.end ? "$" : "");
}


//---------------------------------------------------------------------------
bool Matcher::match(const string& txt, OUT size_t& pos, OUT size_t& len)
//---------------------------------------------------------------------------
{
	_set_text(txt);

	// Nothing but anchors (or not even those): only the empty line matches
	if (pattern.body.empty()) {
DBG("match(\"{}\"): empty pattern body, input length: {}", pattern.source, text_length);
		if (text_length) return false;
		pos = len = 0;
		return true;
	}

	size_t last_start = pattern.anchors.start ? 0 : text_length;
	for (size_t start = 0; start <= last_start; ++start)
	{
		size_t end;
		if (!attempt(0, start, end)) continue;

		if (pattern.anchors.end && end != text_length) {
DBG("match(\"{}\"): [{}, {}) doesn't reach the end; rejected", pattern.source, start, end);
			continue;
		}

		match_pos = pos = start;
		match_len = len = end - start;
#ifndef NDEBUG
{ auto src = DBG_TRIM(utf8_encode(text));
DBG("match(\"{}\"): MATCHED \"{}\" at {} with length {} (attempts: {})", pattern.source, src, pos, len, attempts); }
#endif
		return true;
	}
	return false;
}

} // namespace Matching

#endif // GREPTOY_DEDUP

//!! These little macros conflict with e.g. the Windows headers (included by doctest)!
#undef CONST
#undef OUT
#undef ERROR
#endif // _GREPTOY_HPP_
