#include "../greptoy.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

// Global env. for the test cases...
using namespace Matching;

CASE("no anchors") {
	Anchors a;
	CHECK(strip_anchors("abc", a) == "abc");
	CHECK(!a.start);
	CHECK(!a.end);
}

CASE("both anchors") {
	Anchors a;
	CHECK(strip_anchors("^abc$", a) == "abc");
	CHECK(a.start);
	CHECK(a.end);
}

CASE("anchors only") {
	Anchors a;
	CHECK(strip_anchors("^", a) == "");
		CHECK((a.start && !a.end));
	CHECK(strip_anchors("$", a) == "");
		CHECK((!a.start && a.end));
	CHECK(strip_anchors("^$", a) == "");
		CHECK((a.start && a.end));
	CHECK(strip_anchors("", a) == "");
		CHECK((!a.start && !a.end));
}

CASE("only one of each is stripped") {
	Anchors a;
	CHECK(strip_anchors("^^a$$", a) == "^a$");
	CHECK((a.start && a.end));
}

CASE("anchors in the wrong places are just chars") {
	Anchors a;
	CHECK(strip_anchors("$^", a) == "$^");
	CHECK((!a.start && !a.end));
}

CASE("escaped dollar still counts as an anchor") {
	// Anchors are resolved before tokenizing, so "\$" becomes "\" + "$"
	Pattern p("a\\$");
	CHECK(p.anchors.end);
	CHECK(p.body == "a\\");
	CHECK((p.tokens == Tokens{'a'}));
}

CASE("Pattern compiles the stripped body") {
	Pattern p("^\\d+$");
	p.DUMP();
	CHECK(p.source == "^\\d+$");
	CHECK(p.body == "\\d+");
	CHECK((p.anchors.start && p.anchors.end));
	CHECK((p.tokens == Tokens{Token(_MANY, Token::DIGIT)}));
}

CASE("empty body matches only the empty line") {
	for (auto p : {"", "^", "$", "^$"}) {
		CHECK(match_line("", p));
		CHECK(match_line("\n", p));
		CHECK(match_line("  \r\n", p)); // Trailing whitespace is trimmed, too
		CHECK(!match_line("a", p));
		CHECK(!match_line(" a", p));
	}
}

CASE("a body with no tokens is still not empty") {
	// The lone "\" is dropped by the tokenizer, so zero tokens
	// match (with zero length) anywhere...
	CHECK(match_line("xyz", "\\"));
	CHECK(match_line("", "\\"));
	// ...but the anchors still apply:
	CHECK(match_line("", "^\\$"));
	CHECK(!match_line("x", "^\\$"));
}

CASE("start anchor") {
	CHECK(match_line("log: started", "^log"));
	CHECK(!match_line("slog", "^log"));
	CHECK(!match_line("", "^log"));
}

CASE("end anchor") {
	CHECK(match_line("catalog", "log$"));
	CHECK(!match_line("logs", "log$"));
	CHECK(match_line("catalog\n", "log$"));
	CHECK(match_line("catalog\r\n", "log$"));
}

CASE("both anchors: the whole line") {
	CHECK(match_line("log", "^log$"));
	CHECK(!match_line("logs", "^log$"));
	CHECK(!match_line("blog", "^log$"));
}

CASE("hand-built pattern") {
	Pattern p(Tokens{Token(_MANY, Token::DIGIT), 'x'}, Anchors{.start = true, .end = false});
	p.DUMP();
	CHECK(p.source == "^\\d+x");
	CHECK(p.anchors.start);
	CHECK(match_line("12x", p));
	CHECK(!match_line("a12x", p));
}

CASE("hand-built empty pattern") {
	Pattern p(Tokens{});
	CHECK(p.body.empty());
	CHECK(match_line("", p));
	CHECK(!match_line("x", p));
}

CASE("hand-built patterns render as real pattern syntax") {
	Tokens tokens{'^', Token(_MANY, '\\'), Token("$]", false), Token(_OPT, U'\u00e9'), '?'};
	Pattern p(tokens, Anchors{.start = true, .end = true});
	CHECK(p.body == "\\^\\\\+[$]]\xc3\xa9?\\?");
	CHECK(p.source == "^" + p.body + "$");
	// Which is not the same tokens: the first ']' closes the class
	CHECK(tokenize(p.body) != tokens);

	Pattern q(Tokens{'^', Token(_MANY, '\\'), Token("a$", true), Token(_OPT, U'\u00e9'), '?'},
	          Anchors{.start = true, .end = true});
	CHECK(q.source == "^\\^\\\\+[^a$]\xc3\xa9?\\?$");
	Pattern reparsed(q.source);
	CHECK(reparsed.tokens == q.tokens);
	CHECK((reparsed.anchors.start && reparsed.anchors.end));
	CHECK(match_line("^\\\\b\xc3\xa9?", q));
	CHECK(!match_line("^\\a?", q));
}
