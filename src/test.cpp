// ============================================================================
// test.cpp — Self-test suite for the sequent prover
// ============================================================================
//
// Contains tests covering:
//   - Lexer tokenisation (keywords, parenthesis depth, placeholders)
//   - Deparenthesisation (connected pairs, idempotence)
//   - Parser correctness (keywords vs symbols, glued prefixes, grouping)
//   - Parse errors and the fragments they carry
//   - AST queries (complexity, names, variables, substitution, rendering)
//   - Sequent parsing, selection and mutation
//   - Every decomposition rule, including the quantifier rules
//   - Fresh-name supply, closure check, proof search and its bounds
//   - Z3 cross-check of propositional verdicts
//   - Command-line parsing
//
// ============================================================================

#include "seqprover/test.hpp"
#include "seqprover/ast.hpp"
#include "seqprover/cli.hpp"
#include "seqprover/decompose.hpp"
#include "seqprover/lexer.hpp"
#include "seqprover/names.hpp"
#include "seqprover/parser.hpp"
#include "seqprover/prover.hpp"
#include "seqprover/sequent.hpp"
#include "seqprover/utils.hpp"
#include "seqprover/z3_solver.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace seqprover {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

static std::string pp(const std::string& input) {
    return parse_formula(input).to_string();
}

static bool parse_fails(const std::string& input) {
    try {
        parse_formula(input);
        return false;
    } catch (const FormulaError&) {
        return true;
    }
}

// Kind and fragment of the FormulaError thrown for `input`, if any.
struct ParseFailure {
    FormulaError::Kind kind;
    std::string        fragment;
    std::string        message;
};

static std::optional<ParseFailure> parse_failure(const std::string& input,
                                                 std::uint32_t line = 1) {
    try {
        parse_formula(input, line);
    } catch (const FormulaError& e) {
        return ParseFailure{e.kind(), e.fragment(), e.what()};
    }
    return std::nullopt;
}

static std::optional<SequentError::Kind> sequent_failure(const std::string& input,
                                                         std::string* fragment = nullptr) {
    try {
        parse_sequent(input);
    } catch (const SequentError& e) {
        if (fragment) *fragment = e.fragment();
        return e.kind();
    }
    return std::nullopt;
}

static Formula atom(const std::string& text) {
    return Formula::atom(text);
}

// One decomposition step on a freshly parsed sequent.
static Branch step(const std::string& sequent, NameSupply& names) {
    Decomposer d(names);
    auto branch = d.decompose(parse_sequent(sequent));
    if (!branch) {
        throw std::runtime_error("no decomposition for: " + sequent);
    }
    return *branch;
}

static Result prove_text(const std::string& sequent,
                         ClosureMode mode = ClosureMode::Syntactic,
                         int threads = 1,
                         const SearchLimits& limits = SearchLimits{}) {
    SequentialNameSupply names;
    ProofSearch search(names);
    search.set_closure_mode(mode);
    search.set_num_threads(threads);
    search.set_limits(limits);
    return search.prove(parse_sequent(sequent));
}

static Options parse_cli(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static bool cli_fails(std::vector<std::string> args) {
    try {
        parse_cli(std::move(args));
        return false;
    } catch (const std::runtime_error&) {
        return true;
    }
}

// ============================================================================
// Lexer Tests
// ============================================================================

static void test_lexer_keywords(TestContext& ctx) {
    auto toks = tokenise("~ not & and v or > implies ∃ exists ∀ forall cat");
    ctx.check(toks.size() == 13, "13 words");
    ctx.check(toks[0].kind == TokenKind::Negation, "~ negation");
    ctx.check(toks[1].kind == TokenKind::Negation, "not negation");
    ctx.check(toks[2].kind == TokenKind::Conjunction, "& conjunction");
    ctx.check(toks[3].kind == TokenKind::Conjunction, "and conjunction");
    ctx.check(toks[4].kind == TokenKind::Disjunction, "v disjunction");
    ctx.check(toks[5].kind == TokenKind::Disjunction, "or disjunction");
    ctx.check(toks[6].kind == TokenKind::Conditional, "> conditional");
    ctx.check(toks[7].kind == TokenKind::Conditional, "implies conditional");
    ctx.check(toks[8].kind == TokenKind::Existential, "∃ existential");
    ctx.check(toks[9].kind == TokenKind::Existential, "exists existential");
    ctx.check(toks[10].kind == TokenKind::Universal, "∀ universal");
    ctx.check(toks[11].kind == TokenKind::Universal, "forall universal");
    ctx.check(toks[12].kind == TokenKind::Word && toks[12].text == "cat", "plain word");

    ctx.check(classify_word("And") == TokenKind::Word, "keywords are case-sensitive");
    ctx.check(classify_word("vv") == TokenKind::Word, "vv is a word");
    ctx.check(!token_node_kind(TokenKind::Word).has_value(), "word has no node kind");
    ctx.check(token_node_kind(TokenKind::Conditional) == NodeKind::Conditional,
              "conditional token maps to node kind");
}

static void test_lexer_depth(TestContext& ctx) {
    auto toks = tokenise("(A & (B v C))");
    ctx.check(toks.size() == 5, "5 words");
    ctx.check(toks[0].text == "(A" && toks[0].depth == 1, "(A at depth 1");
    ctx.check(toks[1].kind == TokenKind::Conjunction && toks[1].depth == 1, "& at depth 1");
    ctx.check(toks[2].text == "(B" && toks[2].depth == 2, "(B at depth 2");
    ctx.check(toks[3].kind == TokenKind::Disjunction && toks[3].depth == 2, "v at depth 2");
    ctx.check(toks[4].text == "C))" && toks[4].depth == 0, "C)) closes to depth 0");
    ctx.check(toks[4].index == 4, "word index");
    ctx.check_eq(join_tokens(toks, 1, 4), "& (B v", "join middle words");

    Lexer lex("p q");
    ctx.check(lex.peek().text == "p", "peek first");
    ctx.check(lex.next().text == "p", "next after peek");
    ctx.check(lex.next().text == "q", "second word");
    ctx.check(lex.next().kind == TokenKind::Eof, "eof");
}

static void test_deparenthesize(TestContext& ctx) {
    ctx.check_eq(deparenthesize("(A)"), "A", "single pair");
    ctx.check_eq(deparenthesize("((A))"), "A", "nested pairs");
    ctx.check_eq(deparenthesize("(A & B)"), "A & B", "pair around binary");
    ctx.check_eq(deparenthesize("(A) & (B)"), "(A) & (B)", "two groups untouched");
    ctx.check_eq(deparenthesize("((A) & (B))"), "(A) & (B)", "only connected pair stripped");
    ctx.check_eq(deparenthesize("A"), "A", "no parentheses");
    ctx.check_eq(deparenthesize(""), "", "empty string");
    ctx.check(paren_balance("((a)") == 1, "balance of ((a)");

    const std::vector<std::string> samples = {
        "(A)", "((A))", "(A) & (B)", "((A) & (B))", "(((A v B)))", "A", "",
        "()", "(A) v ((B))", "(~(A))",
    };
    for (const auto& s : samples) {
        const std::string once = deparenthesize(s);
        ctx.check_eq(deparenthesize(once), once, "idempotent on '" + s + "'");
    }
}

static void test_placeholders(TestContext& ctx) {
    const std::string text = "<a> loves <bob> and <c>d";
    auto vars = scan_placeholders(text, PlaceholderKind::Variable);
    auto names = scan_placeholders(text, PlaceholderKind::Name);
    ctx.check(vars == std::vector<std::string>{"a", "c"}, "variables a, c");
    ctx.check(names == std::vector<std::string>{"bob"}, "name bob");

    ctx.check(scan_placeholders("<A> <ab1> <>", PlaceholderKind::Variable).empty(),
              "malformed brackets yield no variables");
    ctx.check(scan_placeholders("<A> <ab1> <>", PlaceholderKind::Name).empty(),
              "malformed brackets yield no names");

    ctx.check(is_bound_variable_token("<x>"), "<x> is a bound variable");
    ctx.check(!is_bound_variable_token("<xy>"), "<xy> is not");
    ctx.check(!is_bound_variable_token("<X>"), "<X> is not");
    ctx.check(is_name_text("bob"), "bob is a name");
    ctx.check(!is_name_text("b"), "b is too short");
    ctx.check(!is_name_text("Bob"), "Bob has an upper-case letter");

    ctx.check_eq(replace_placeholder("<x> likes <x> and <xy>", "x", "bob"),
                 "<bob> likes <bob> and <xy>", "replace only exact <x>");
}

// ============================================================================
// Parser Tests
// ============================================================================

static void test_parse_scenarios(TestContext& ctx) {
    Formula cat = parse_formula("the cat is on the mat");
    ctx.check(cat.kind() == NodeKind::Atom, "plain text is an atom");
    ctx.check_eq(cat.text(), "the cat is on the mat", "atom text");
    ctx.check(cat.complexity() == 0, "atom complexity 0");

    Formula neg = parse_formula("~ (the cat is on the mat)");
    ctx.check(neg.kind() == NodeKind::Negation, "negation");
    ctx.check(neg.child(0) == atom("the cat is on the mat"), "negatum");
    ctx.check(neg.complexity() == 1, "negation complexity 1");

    Formula ex = parse_formula("∃<a>(<a> is on the mat)");
    ctx.check(ex.kind() == NodeKind::Existential, "existential");
    ctx.check_eq(ex.variable(), "a", "bound variable a");
    ctx.check(ex.child(0) == atom("<a> is on the mat"), "predicate");
    ctx.check(ex.child(0).names().empty(), "predicate has no names");
    ctx.check(ex.child(0).variables() == std::vector<std::string>{"a"},
              "predicate variables");

    ctx.check(parse_formula("A & (B v C)") == parse_formula("A & (B v C)"),
              "parsing is deterministic");
}

static void test_parse_keyword_words(TestContext& ctx) {
    ctx.check_eq(pp("A and B"), "(A & B)", "and");
    ctx.check_eq(pp("A or B"), "(A v B)", "or");
    ctx.check_eq(pp("A implies B"), "(A > B)", "implies");
    ctx.check_eq(pp("not A"), "~(A)", "not");
    ctx.check_eq(pp("forall <x> (<x> is red)"), "∀<x>(<x> is red)", "forall");
    ctx.check_eq(pp("exists <y> <y> is blue"), "∃<y>(<y> is blue)", "exists without parens");
    ctx.check(parse_formula("A & B") == parse_formula("A and B"), "symbol equals word");
}

static void test_parse_glued_prefixes(TestContext& ctx) {
    ctx.check_eq(pp("~(A)"), "~(A)", "glued negation");
    ctx.check_eq(pp("~(~(A))"), "~(~(A))", "double glued negation");
    ctx.check_eq(pp("~(A) v ~(B)"), "(~(A) v ~(B))", "glued negations on both sides");

    Formula tilde = parse_formula("~ish weather");
    ctx.check(tilde.kind() == NodeKind::Atom, "~ish is an atom word");
    ctx.check_eq(tilde.text(), "~ish weather", "~ish atom text");
    ctx.check(parse_formula("~A").kind() == NodeKind::Atom, "~A is an atom word");
    ctx.check(parse_formula("~~A").kind() == NodeKind::Atom, "~~A is an atom word");
    ctx.check(parse_formula("∀x (A)").kind() == NodeKind::Atom, "∀x is an atom word");
    ctx.check(parse_formula("∃<xy>(A)").kind() == NodeKind::Atom,
              "∃ glued to a name is an atom word");
    ctx.check_eq(pp("∀<x>(<x> is red)"), "∀<x>(<x> is red)", "glued universal");
    ctx.check_eq(pp("~(A) & B"), "(~(A) & B)", "glued prefix binds tightly");
    ctx.check_eq(pp("∀<x>(<x> is red) v B"), "(∀<x>(<x> is red) v B)",
                 "glued quantifier binds tightly");
    ctx.check_eq(pp("~ A & B"), "~((A & B))", "standalone prefix takes the rest");
    ctx.check_eq(pp("(~ A) & B"), "(~(A) & B)", "parenthesised prefix");
}

static void test_parse_leftmost_grouping(TestContext& ctx) {
    ctx.check_eq(pp("A & B v C"), "(A & (B v C))", "leftmost keyword splits");
    ctx.check_eq(pp("A > B > C"), "(A > (B > C))", "chained conditionals");
    ctx.check_eq(pp("(A & B) v C"), "((A & B) v C)", "explicit grouping");
    ctx.check_eq(pp("the cat sleeps and the dog barks"),
                 "(the cat sleeps & the dog barks)", "multi-word atoms");
    ctx.check_eq(pp("  ((A))  "), "A", "outer whitespace and parentheses");
}

static void test_parse_errors(TestContext& ctx) {
    auto check_failure = [&](const std::string& input, FormulaError::Kind kind,
                             const std::string& fragment) {
        auto f = parse_failure(input);
        ctx.check(f.has_value(), "'" + input + "' fails");
        if (!f) return;
        ctx.check(f->kind == kind,
                  "'" + input + "' kind " + formula_error_kind_name(f->kind));
        ctx.check_eq(f->fragment, fragment, "'" + input + "' fragment");
    };

    check_failure("", FormulaError::Kind::EmptyString, "");
    check_failure("   ", FormulaError::Kind::EmptyString, "");
    check_failure("()", FormulaError::Kind::EmptyString, "");
    check_failure("A &", FormulaError::Kind::MalformedString, "A &");
    check_failure("& B", FormulaError::Kind::MalformedString, "& B");
    check_failure("~", FormulaError::Kind::MalformedString, "~");
    check_failure("∀ x (A)", FormulaError::Kind::MalformedString, "∀ x (A)");
    check_failure("forall <xy> (A)", FormulaError::Kind::MalformedString,
                  "forall <xy> (A)");
    check_failure("exists <x>", FormulaError::Kind::MalformedString, "exists <x>");
    check_failure("forall <x>(<x> runs)", FormulaError::Kind::MalformedString,
                  "forall <x>(<x> runs)");
    check_failure("∃ <x>(<x> runs)", FormulaError::Kind::MalformedString,
                  "∃ <x>(<x> runs)");
    check_failure("\v", FormulaError::Kind::EmptyString, "");
    check_failure(" \f\v ", FormulaError::Kind::EmptyString, "");
    check_failure("(\f)", FormulaError::Kind::EmptyString, "");
    check_failure("A & \f", FormulaError::Kind::MalformedString, "A &");
    check_failure("\v & B", FormulaError::Kind::MalformedString, "& B");
    check_failure("A & (B v )", FormulaError::Kind::MalformedString, "B v");

    auto f = parse_failure("A &", 7);
    ctx.check(f && f->message.starts_with("7: ERROR:"), "message carries the line");

    ctx.check(!parse_fails("<x> is red"), "free variable in an atom is fine");
}

// ============================================================================
// AST Tests
// ============================================================================

static void test_builders(TestContext& ctx) {
    std::vector<Formula> two{atom("A"), atom("B")};
    Formula c = Formula::from_connective("and", two);
    ctx.check(c.kind() == NodeKind::Conjunction, "from_connective and");
    ctx.check(c == Formula::conjunction(atom("A"), atom("B")), "same as builder");

    std::vector<Formula> one{atom("<x> runs")};
    Formula q = Formula::from_connective("∃", one, "x");
    ctx.check(q.kind() == NodeKind::Existential && q.variable() == "x",
              "from_connective ∃");

    try {
        Formula::from_connective("xor", two);
        ctx.check(false, "xor should be rejected");
    } catch (const FormulaError& e) {
        ctx.check(e.kind() == FormulaError::Kind::InvalidConnective, "xor invalid");
        ctx.check_eq(e.fragment(), "xor", "xor fragment");
    }

    try {
        Formula::make(NodeKind::Negation, {});
        ctx.check(false, "negation without child should be rejected");
    } catch (const FormulaError& e) {
        ctx.check(e.kind() == FormulaError::Kind::IncorrectArity, "negation arity");
        ctx.check_eq(e.fragment(), "Negation", "arity fragment names the kind");
    }

    try {
        Formula::make(NodeKind::Conjunction, one);
        ctx.check(false, "conjunction with one child should be rejected");
    } catch (const FormulaError& e) {
        ctx.check(e.kind() == FormulaError::Kind::IncorrectArity, "conjunction arity");
    }

    for (const std::string bad : {"", "xy", "X", "1"}) {
        try {
            Formula::make(NodeKind::Universal, one, bad);
            ctx.check(false, "variable '" + bad + "' should be rejected");
        } catch (const FormulaError& e) {
            ctx.check(e.kind() == FormulaError::Kind::MalformedString,
                      "variable '" + bad + "' malformed");
            ctx.check_eq(e.fragment(), bad, "variable fragment");
        }
    }
    try {
        Formula::from_connective("exists", one, "ab");
        ctx.check(false, "exists <ab> should be rejected");
    } catch (const FormulaError& e) {
        ctx.check(e.kind() == FormulaError::Kind::MalformedString,
                  "from_connective checks the variable");
    }

    ctx.check(connective_arity(NodeKind::Conditional) == 2, "conditional arity");
    ctx.check_eq(connective_word(NodeKind::Disjunction), "or", "disjunction word");
    ctx.check_eq(connective_symbol(NodeKind::Universal), "∀", "universal symbol");

    bool threw = false;
    try {
        atom("A").child(0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    ctx.check(threw, "atom has no children");
}

static void test_complexity_laws(TestContext& ctx) {
    ctx.check(parse_formula("~(A & (B v ~(C)))").complexity() == 4, "nested complexity");
    ctx.check(parse_formula("(A & B) v C").complexity() == 2, "max, not sum");
    ctx.check(parse_formula("∀<x>(<x> is red > <x> is blue)").complexity() == 2,
              "quantifier adds one");

    Sequent s = parse_sequent("A & B, C |~ ~(D)");
    ctx.check(s.complexity() == 2, "sequent complexity is a sum");
    ctx.check(!s.is_atomic(), "complex sequent is not atomic");
    ctx.check(parse_sequent("A, B |~ C").is_atomic(), "atomic sequent");
}

static void test_names_and_variables(TestContext& ctx) {
    Formula f = parse_formula("<bob> likes <x> & <x> likes <alice>");
    ctx.check(f.names() == std::vector<std::string>{"bob", "alice"}, "names in order");
    ctx.check(f.variables() == std::vector<std::string>{"x", "x"}, "variables");

    Formula nested = parse_formula("∀<x>(∃<x>(<x> is red))");
    ctx.check(nested.rebinds("x"), "nested quantifier rebinds x");
    ctx.check(!parse_formula("∀<x>(<x> is red)").child(0).rebinds("x"),
              "predicate does not rebind x");

    Formula a = atom("A");
    ctx.check(a.content().size() == 1 && a.content()[0] == &a, "atom content is itself");
    ctx.check(parse_formula("A & B").content().size() == 2, "binary content");
}

static void test_instantiate(TestContext& ctx) {
    Formula f = parse_formula("∀<x>(<x> is red > ~(<x> is blue))");
    Formula g = f.instantiated("x", "bob");
    ctx.check_eq(g.to_string(), "∀<x>((<bob> is red > ~(<bob> is blue)))",
                 "instantiated copy");
    ctx.check_eq(f.to_string(), "∀<x>((<x> is red > ~(<x> is blue)))",
                 "original unchanged");

    const std::vector<std::string> variants = {
        "<x> runs",
        "~(<x> runs)",
        "(<x> runs & <x> jumps)",
        "(<x> runs v <x> jumps)",
        "(<x> runs > <x> jumps)",
        "∃<y>(<x> sees <y>)",
        "∀<y>(<x> sees <y>)",
    };
    for (const auto& text : variants) {
        Formula v = parse_formula(text);
        v.instantiate("x", "bob");
        bool all_bob = !v.names().empty();
        for (const auto& n : v.names()) all_bob = all_bob && n == "bob";
        ctx.check(all_bob, "names after instantiate: " + text);
        for (const auto& var : v.variables()) {
            ctx.check(var != "x", "x gone after instantiate: " + text);
        }
    }
}

static void test_clone_independence(TestContext& ctx) {
    Formula a = parse_formula("(<x> a & <x> b)");
    Formula b = a;
    b.instantiate("x", "cd");
    ctx.check_eq(a.to_string(), "(<x> a & <x> b)", "original untouched");
    ctx.check(a != b, "clone diverged");

    Formula c = a;
    c = b;
    ctx.check(c == b, "copy assignment");

    Sequent s = parse_sequent("A |~ B");
    Sequent t = s;
    t.push_left(atom("C"));
    ctx.check(s.antecedent().size() == 1, "sequent clone independent");
    ctx.check(t.antecedent().size() == 2, "clone mutated");
}

static void test_round_trip(TestContext& ctx) {
    const Formula A = atom("A");
    const Formula B = atom("B");
    const Formula C = atom("C");
    const Formula D = atom("D");

    const std::vector<Formula> formulas = {
        Formula::conjunction(Formula::negation(A), B),
        Formula::disjunction(A, Formula::conditional(B, C)),
        Formula::conditional(Formula::conjunction(A, B),
                             Formula::disjunction(C, Formula::negation(D))),
        Formula::negation(Formula::negation(A)),
        Formula::negation(Formula::conjunction(Formula::negation(A), B)),
        Formula::universal("x", Formula::conditional(atom("<x> is red"),
                                                     Formula::negation(atom("<x> is blue")))),
        Formula::existential("y", Formula::conjunction(
                                      atom("<y> sings"),
                                      Formula::universal("x", atom("<x> hears <y>")))),
        Formula::conjunction(Formula::universal("x", atom("<x> is red")), B),
        Formula::disjunction(Formula::existential("x", atom("<x> is red")),
                             Formula::negation(Formula::universal("x", atom("<x> is red")))),
    };

    for (const auto& f : formulas) {
        const std::string text = f.to_string();
        ctx.check(parse_formula(text) == f, "round trip: " + text);
    }
}

// ============================================================================
// Sequent Tests
// ============================================================================

static void test_sequent_parse(TestContext& ctx) {
    Sequent s = parse_sequent("A, (A > B) |~ B");
    ctx.check(s.antecedent().size() == 2, "two antecedent members");
    ctx.check(s.antecedent()[1].kind() == NodeKind::Conditional, "conditional member");
    ctx.check(s.consequent().size() == 1, "one consequent member");
    ctx.check_eq(s.to_string(), "A, (A > B) |~ B", "rendering");

    Sequent e = parse_sequent("|~ A v ~(A)");
    ctx.check(e.antecedent().empty(), "empty antecedent");
    ctx.check_eq(e.to_string(), "|~ (A v ~(A))", "empty antecedent rendering");

    Sequent r = parse_sequent("A |~");
    ctx.check(r.consequent().empty(), "empty consequent");
    ctx.check_eq(r.to_string(), "A |~", "empty consequent rendering");

    std::string fragment;
    ctx.check(sequent_failure("A, B") == SequentError::Kind::TurnstileCount, "no turnstile");
    ctx.check(sequent_failure("A |~ B |~ C") == SequentError::Kind::TurnstileCount,
              "two turnstiles");
    ctx.check(sequent_failure("A & |~ B", &fragment) == SequentError::Kind::InvalidFormula,
              "bad member");
    ctx.check_eq(fragment, "A &", "bad member fragment");
    ctx.check(sequent_failure("A, , B |~ C") == SequentError::Kind::InvalidFormula,
              "empty member");
    fragment = "unset";
    ctx.check(sequent_failure("A, \v |~ B", &fragment) == SequentError::Kind::InvalidFormula,
              "vertical-tab member");
    ctx.check_eq(fragment, "", "vertical-tab member fragment");
    ctx.check(parse_sequent("A |~ \f").consequent().empty(),
              "form-feed side is an empty side");
}

static void test_sequent_selection(TestContext& ctx) {
    Sequent s = parse_sequent("A, B & C |~ ~(D), E");
    auto at = s.first_complex_proposition();
    ctx.check(at && *at == Coordinates{Side::Antecedent, 1}, "antecedent first");
    ctx.check(s.first_complex_proposition() == at, "selection is stable");

    Sequent c = parse_sequent("A, B |~ C, D v E");
    ctx.check(c.first_complex_proposition() == Coordinates{Side::Consequent, 1},
              "consequent when antecedent is atomic");
    ctx.check(!parse_sequent("A |~ B").first_complex_proposition(), "atomic has none");

    Formula removed = s.remove_at(Side::Antecedent, 1);
    ctx.check_eq(removed.to_string(), "(B & C)", "removed member");
    ctx.check(s.antecedent().size() == 1, "antecedent shrank");

    bool threw = false;
    try {
        s.remove_at(Side::Antecedent, 5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    ctx.check(threw, "out-of-range removal throws");

    s.push(Side::Consequent, atom("F"));
    ctx.check(s.consequent().size() == 3, "push to consequent");

    Sequent n = parse_sequent("<bob> runs, <amy> runs |~ <bob> runs");
    ctx.check(n.names() == std::vector<std::string>{"bob", "amy"}, "deduplicated names");

    Sequent m = parse_sequent("A |~ B");
    m.mix(parse_sequent("C |~ D"));
    ctx.check_eq(m.to_string(), "A, C |~ B, D", "mix appends both sides");
}

// ============================================================================
// Decomposition Tests
// ============================================================================

static std::vector<std::string> parents_of(const Leaf& leaf) {
    std::vector<std::string> out;
    for (const auto& p : leaf.parents) out.push_back(p.to_string());
    return out;
}

static void test_decompose_propositional_rows(TestContext& ctx) {
    SequentialNameSupply names;

    struct Row {
        std::string              sequent;
        RuleKind                 rule;
        std::vector<std::string> parents;
    };
    const std::vector<Row> rows = {
        {"~(A) |~",     RuleKind::NegationLeft,     {"|~ A"}},
        {"|~ ~(A)",     RuleKind::NegationRight,    {"A |~"}},
        {"A > B |~",    RuleKind::ConditionalLeft,  {"|~ A", "B |~"}},
        {"|~ A > B",    RuleKind::ConditionalRight, {"A |~ B"}},
        {"A & B |~",    RuleKind::ConjunctionLeft,  {"A, B |~"}},
        {"|~ A & B",    RuleKind::ConjunctionRight, {"|~ A", "|~ B"}},
        {"A v B |~",    RuleKind::DisjunctionLeft,  {"A |~", "B |~"}},
        {"|~ A v B",    RuleKind::DisjunctionRight, {"|~ A, B"}},
        {"C, A > B |~ D", RuleKind::ConditionalLeft, {"C |~ D, A", "C, B |~ D"}},
    };

    for (const auto& row : rows) {
        Branch b = step(row.sequent, names);
        ctx.check(b.rule == row.rule,
                  row.sequent + " rule " + rule_kind_name(b.rule));
        ctx.check(b.leaves.size() == 1, row.sequent + " has one leaf");
        if (b.leaves.size() != 1) continue;
        ctx.check(parents_of(b.leaves[0]) == row.parents, row.sequent + " parents");
        ctx.check(b.leaves[0].witness.empty(), row.sequent + " no witness");
    }

    Branch cond = step("A > B |~", names);
    ctx.check_eq(cond.principal, "(A > B)", "principal rendering");

    Decomposer d(names);
    ctx.check(!d.decompose(parse_sequent("A |~ B")), "atomic sequent does not decompose");

    // Two-parent rules clone: mutating one parent leaves the other alone.
    Branch conj = step("C |~ A & B", names);
    auto& parents = conj.leaves[0].parents;
    parents[0].push_left(atom("X"));
    ctx.check(parents[1].antecedent().size() == 1, "parents are independent");
}

static void test_decompose_quantifier_rows(TestContext& ctx) {
    SequentialNameSupply names;

    Branch er = step("<bob> runs, <amy> walks |~ ∃<x>(<x> runs)", names);
    ctx.check(er.rule == RuleKind::ExistentialRight, "∃R");
    ctx.check(!is_eigenvariable_rule(er.rule), "∃R is reusable");
    ctx.check(er.leaves.size() == 2, "one leaf per name");
    if (er.leaves.size() == 2) {
        ctx.check(parents_of(er.leaves[0]) ==
                      std::vector<std::string>{"<bob> runs, <amy> walks |~ <bob> runs"},
                  "∃R bob");
        ctx.check_eq(er.leaves[0].witness, "bob", "∃R witness bob");
        ctx.check(parents_of(er.leaves[1]) ==
                      std::vector<std::string>{"<bob> runs, <amy> walks |~ <amy> runs"},
                  "∃R amy");
    }

    Branch ul = step("∀<x>(<x> runs) |~ <bob> runs", names);
    ctx.check(ul.rule == RuleKind::UniversalLeft, "∀L");
    ctx.check(ul.leaves.size() == 1 &&
                  parents_of(ul.leaves[0]) ==
                      std::vector<std::string>{"<bob> runs |~ <bob> runs"},
              "∀L instantiates with bob");

    names.reset();
    Branch fresh = step("∀<x>(<x> runs) |~", names);
    ctx.check(fresh.leaves.size() == 1 && fresh.leaves[0].witness == "aa",
              "∀L without names uses a fresh name");

    names.reset();
    Branch el = step("∃<x>(<x> runs) |~ <aa> runs", names);
    ctx.check(el.rule == RuleKind::ExistentialLeft, "∃L");
    ctx.check(is_eigenvariable_rule(el.rule), "∃L is an eigenvariable rule");
    ctx.check(el.leaves.size() == 1 &&
                  parents_of(el.leaves[0]) ==
                      std::vector<std::string>{"<ab> runs |~ <aa> runs"},
              "∃L avoids names of the sequent");

    names.reset();
    Branch ur = step("|~ ∀<x>(<x> runs)", names);
    ctx.check(ur.rule == RuleKind::UniversalRight, "∀R");
    ctx.check(ur.leaves.size() == 1 && ur.leaves[0].witness == "aa", "∀R fresh name");
    ctx.check(parents_of(ur.leaves[0]) == std::vector<std::string>{"|~ <aa> runs"},
              "∀R parent");
}

// ============================================================================
// Name Supply / Closure Tests
// ============================================================================

static void test_name_supply(TestContext& ctx) {
    ctx.check_eq(SequentialNameSupply::candidate(0), "aa", "candidate 0");
    ctx.check_eq(SequentialNameSupply::candidate(1), "ab", "candidate 1");
    ctx.check_eq(SequentialNameSupply::candidate(25), "az", "candidate 25");
    ctx.check_eq(SequentialNameSupply::candidate(26), "ba", "candidate 26");
    ctx.check_eq(SequentialNameSupply::candidate(675), "zz", "candidate 675");
    ctx.check_eq(SequentialNameSupply::candidate(676), "aaa", "candidate 676");

    SequentialNameSupply ns;
    ns.reserve({"aa", "ab"});
    ctx.check_eq(ns.fresh({}), "ac", "skips reserved");
    ctx.check_eq(ns.fresh({"ad"}), "ae", "skips avoided");
    const std::string third = ns.fresh({});
    ctx.check_eq(third, "af", "never repeats");
    ctx.check(ns.issued() == 3, "issued count");
    ctx.check(is_name_text(third), "fresh names are valid names");

    ns.reset();
    ctx.check_eq(ns.fresh({}), "aa", "reset forgets everything");
}

static void test_is_axiom(TestContext& ctx) {
    ctx.check(is_axiom(parse_sequent("A, B |~ C, A")), "shared atom");
    ctx.check(!is_axiom(parse_sequent("A |~ B")), "no shared formula");
    ctx.check(is_axiom(parse_sequent("A & B |~ A & B")), "structural equality");
    ctx.check(!is_axiom(parse_sequent("~(A) |~ A")), "negation is not identity");
    ctx.check(!is_axiom(parse_sequent("|~")), "empty sequent");
}

// ============================================================================
// Proof Search Tests
// ============================================================================

std::vector<TestCase> generate_propositional_tests() {
    return {
        // Valid
        { "A |~ A",                                   true  },
        { "|~ A v ~(A)",                             true  },
        { "A, A > B |~ B",                            true  },
        { "A & B |~ B & A",                           true  },
        { "A v B |~ B v A",                           true  },
        { "|~ (A > B) > (~(B) > ~(A))",              true  },
        { "~(~(A)) |~ A",                            true  },
        { "A |~ ~(~(A))",                            true  },
        { "|~ ((A > B) > A) > A",                     true  },
        { "A v B, ~(A) |~ B",                        true  },
        { "A > B, B > C |~ A > C",                    true  },
        { "~(A & B) |~ ~(A) v ~(B)",                 true  },
        { "~(A) v ~(B) |~ ~(A & B)",                 true  },
        { "~(A v B) |~ ~(A) & ~(B)",                 true  },
        { "A & (B v C) |~ (A & B) v (A & C)",         true  },
        { "A, ~(A) |~ B",                            true  },
        { "|~ A > (B > A)",                           true  },
        { "A implies B, not B |~ not A",              true  },
        // Invalid
        { "A |~ B",                                   false },
        { "A > B, B |~ A",                            false },
        { "|~ A & ~(A)",                             false },
        { "A v B |~ A",                               false },
        { "A > B |~ B > A",                           false },
        { "~(A & B) |~ ~(A) & ~(B)",                 false },
        { "|~ A",                                     false },
        { "A |~",                                     false },
    };
}

std::vector<TestCase> generate_first_order_tests() {
    return {
        { "∀<x>(<x> runs) |~ <bob> runs",                               true  },
        { "<bob> runs |~ ∃<x>(<x> runs)",                               true  },
        { "∀<x>(<x> runs > <x> moves), <bob> runs |~ <bob> moves",      true  },
        { "∃<x>(<x> runs) |~ ∃<y>(<y> runs)",                           true  },
        { "∀<x>(<x> runs & <x> sings) |~ <amy> sings",                  true  },
        { "|~ ∀<x>(<x> runs v ~(<x> runs))",                            true  },
        { "~(∃<x>(<x> runs)) |~ ∀<x>(~(<x> runs))",                     true  },
        { "∃<x>(<x> runs) |~ ∀<y>(<y> runs)",                           false },
        { "<bob> runs |~ <amy> runs",                                   false },
        { "∃<x>(<x> runs), ∃<x>(<x> sings) |~ ∃<x>(<x> runs & <x> sings)", false },
        // Valid, but ∀L fires before ∀R and is not revisited (EXHAUSTED).
        { "∀<x>(<x> runs) |~ ∀<y>(<y> runs)",                           false },
    };
}

// With `must_decide`, an unprovable sequent must come out UNPROVED rather
// than EXHAUSTED.
static void run_test_vector(TestContext& ctx,
                            const std::vector<TestCase>& tests,
                            ClosureMode mode,
                            bool must_decide = true) {
    for (std::size_t i = 0; i < tests.size(); ++i) {
        const auto& tc = tests[i];
        try {
            Result r = prove_text(tc.sequent, mode);
            const bool proved = (r == Result::Proved);
            if (must_decide || tc.expected_provable) {
                ctx.check(r != Result::Exhausted,
                          "Test " + std::to_string(i + 1) + ": " + tc.sequent + " EXHAUSTED");
            }
            ctx.check(proved == tc.expected_provable,
                      "Test " + std::to_string(i + 1) + ": " + tc.sequent +
                      " [" + closure_mode_name(mode) + "] expected " +
                      (tc.expected_provable ? "PROVED" : "UNPROVED") +
                      " got " + result_to_string(r));
        } catch (const std::exception& e) {
            ctx.check(false, "Test " + std::to_string(i + 1) + ": " + tc.sequent +
                             " threw " + e.what());
        }
    }
}

static void test_search_propositional(TestContext& ctx) {
    run_test_vector(ctx, generate_propositional_tests(), ClosureMode::Syntactic);
}

static void test_search_first_order(TestContext& ctx) {
    run_test_vector(ctx, generate_first_order_tests(), ClosureMode::Syntactic, false);
}

static void test_search_counter_sequent(TestContext& ctx) {
    SequentialNameSupply names;
    ProofSearch search(names);
    search.set_num_threads(1);

    Result r = search.prove(parse_sequent("A v B |~ A"));
    ctx.check(r == Result::Unproved, "A v B |~ A unproved");
    ctx.check(search.counter_sequent().has_value(), "counter-sequent recorded");
    if (search.counter_sequent()) {
        ctx.check_eq(search.counter_sequent()->to_string(), "B |~ A", "open leaf");
    }

    r = search.prove(parse_sequent("A |~ A"));
    ctx.check(r == Result::Proved, "A |~ A proved");
    ctx.check(!search.counter_sequent().has_value(), "no counter-sequent when proved");
}

static void test_search_stats_and_trace(TestContext& ctx) {
    SequentialNameSupply names;
    ProofSearch search(names);
    search.set_num_threads(1);
    search.set_record_trace(true);

    Result r = search.prove(parse_sequent("A & B |~ B & A"));
    ctx.check(r == Result::Proved, "proved");
    ctx.check(search.stats().sequents_expanded.load() == 4, "four sequents visited");
    ctx.check(search.stats().axioms.load() == 2, "two axioms");
    ctx.check(search.stats().max_depth.load() == 2, "depth two");
    ctx.check(search.stats().cutoffs.load() == 0, "no cut-offs");

    const auto& trace = search.trace();
    ctx.check(trace.size() == 4, "four trace lines");
    if (trace.size() == 4) {
        ctx.check_eq(trace[0], "(A & B) |~ (B & A)   [&L (A & B)]", "trace root");
        ctx.check_eq(trace[1], "  A, B |~ (B & A)   [&R (B & A)]", "trace step");
        ctx.check_eq(trace[2], "    A, B |~ B   [axiom]", "trace left axiom");
        ctx.check_eq(trace[3], "    A, B |~ A   [axiom]", "trace right axiom");
    }
    ctx.check(search.stats().to_string().find("axioms=2") != std::string::npos,
              "stats rendering");
}

static void test_search_bounds(TestContext& ctx) {
    SearchLimits shallow;
    shallow.max_depth = 1;
    ctx.check(prove_text("|~ (A > B) > (~(B) > ~(A))", ClosureMode::Syntactic, 1, shallow) ==
                  Result::Exhausted,
              "depth bound exhausts");

    SearchLimits none;
    none.max_depth = 0;
    ctx.check(prove_text("A |~ A", ClosureMode::Syntactic, 1, none) == Result::Proved,
              "closure happens before the depth bound");
    ctx.check(prove_text("A & B |~ A", ClosureMode::Syntactic, 1, none) == Result::Exhausted,
              "depth 0 cuts any rule");

    const std::string many = "<aa> p, <ab> p, <ac> q |~ ∃<x>(<x> q)";
    SearchLimits narrow;
    narrow.max_names = 2;
    ctx.check(prove_text(many, ClosureMode::Syntactic, 1, narrow) == Result::Exhausted,
              "witness bound exhausts");
    narrow.max_names = 3;
    ctx.check(prove_text(many, ClosureMode::Syntactic, 1, narrow) == Result::Proved,
              "third witness proves");
    ctx.check(prove_text(many) == Result::Proved, "default bound proves");

    SearchLimits timed;
    timed.timeout = std::chrono::seconds(30);
    ctx.check(prove_text("A, A > B |~ B", ClosureMode::Syntactic, 1, timed) == Result::Proved,
              "generous timeout does not interfere");
}

static void test_search_reusable_failure(TestContext& ctx) {
    SequentialNameSupply names;
    ProofSearch search(names);
    search.set_num_threads(1);

    Result r = search.prove(parse_sequent("∀<x>(<x> runs) |~ ∀<y>(<y> runs)"));
    ctx.check(r == Result::Exhausted, "failed ∀L is not a refutation");
    ctx.check(search.stats().reuse_failures.load() == 1, "one failed ∀L");
    ctx.check(search.stats().cutoffs.load() == 0, "no bound was hit");

    r = search.prove(parse_sequent("<bob> runs |~ ∃<x>(<x> walks)"));
    ctx.check(r == Result::Exhausted, "failed ∃R is not a refutation");
    ctx.check(search.stats().reuse_failures.load() == 1, "one failed ∃R");

    r = search.prove(parse_sequent("∃<x>(<x> runs) |~ ∀<y>(<y> runs)"));
    ctx.check(r == Result::Unproved, "eigenvariable steps alone decide");
    ctx.check(search.stats().reuse_failures.load() == 0, "no reusable step");

    r = search.prove(parse_sequent("∀<x>(<x> runs) |~ <bob> runs"));
    ctx.check(r == Result::Proved, "successful ∀L");
    ctx.check(search.stats().reuse_failures.load() == 0, "success is not recorded");
    ctx.check(search.stats().to_string().find("reuse_failures=0") != std::string::npos,
              "stats rendering");
}

static void test_parallel_equivalence(TestContext& ctx) {
    std::vector<TestCase> cases = generate_propositional_tests();
    for (const auto& tc : generate_first_order_tests()) cases.push_back(tc);

    for (std::size_t i = 0; i < cases.size(); ++i) {
        const auto& tc = cases[i];
        Result r1 = prove_text(tc.sequent, ClosureMode::Syntactic, 1);
        Result r2 = prove_text(tc.sequent, ClosureMode::Syntactic, 0);
        ctx.check(r1.verdict == r2.verdict,
                  "parallel equiv #" + std::to_string(i + 1) + ": " + tc.sequent);
    }
}

// ============================================================================
// Z3 Tests
// ============================================================================

static void test_z3_cross_check(TestContext& ctx) {
    for (const auto& tc : generate_propositional_tests()) {
        Z3Checker checker;
        const bool encoded = checker.add_sequent_negation(parse_sequent(tc.sequent));
        ctx.check(encoded, "encodable: " + tc.sequent);
        if (!encoded) continue;
        const bool valid = (checker.check() == Z3Result::UNSAT);
        ctx.check(valid == tc.expected_provable, "z3 agrees: " + tc.sequent);
    }

    run_test_vector(ctx, generate_propositional_tests(), ClosureMode::Z3);
    run_test_vector(ctx, generate_first_order_tests(), ClosureMode::Z3, false);
}

static void test_z3_model(TestContext& ctx) {
    Z3Checker checker;
    ctx.check(checker.add_sequent_negation(parse_sequent("A |~ B")), "encoded");
    ctx.check(checker.check() == Z3Result::SAT, "A |~ B has a counter-model");
    ctx.check_eq(checker.get_model(), "{A = true, B = false}", "counter-model");

    checker.reset();
    ctx.check(!checker.add_sequent_negation(parse_sequent("∀<x>(<x> runs) |~ <bob> runs")),
              "quantified sequents are not encoded");
    ctx.check(checker.check() == Z3Result::SAT, "nothing was asserted");

    checker.reset();
    checker.add_boolean_literal("A", true);
    ctx.check(checker.add_formula(parse_formula("~(A)")), "negation encodable");
    ctx.check(checker.check() == Z3Result::UNSAT, "A and ~(A) clash");
    ctx.check_eq(z3_result_to_string(Z3Result::UNSAT), "UNSAT", "result name");

    SequentialNameSupply names;
    ProofSearch search(names);
    search.set_num_threads(1);
    search.set_closure_mode(ClosureMode::Z3);
    Result r = search.prove(parse_sequent("|~ ((A > B) > A) > A"));
    ctx.check(r == Result::Proved, "Z3 closes Peirce's law");
    ctx.check(search.stats().sequents_expanded.load() == 1, "in one call");
    ctx.check(search.stats().z3_calls.load() == 1, "one Z3 call");
}

// ============================================================================
// Utility / CLI Tests
// ============================================================================

static void test_utils(TestContext& ctx) {
    ctx.check(split("a,b,,c", ",") == std::vector<std::string>{"a", "b", "", "c"},
              "split keeps empty pieces");
    ctx.check(count_occurrences("A |~ B |~", "|~") == 2, "count turnstiles");
    ctx.check_eq(join({"a", "b", "c"}, ", "), "a, b, c", "join");
    ctx.check_eq(strip_comment("A |~ A   # note"), "A |~ A", "strip comment");
    ctx.check(is_blank_or_comment("   # only a comment"), "comment line");
    ctx.check(!is_blank_or_comment("A |~ A"), "content line");
    ctx.check_eq(trim("  x  "), "x", "trim");
}

static void test_cli_args(TestContext& ctx) {
    Options o = parse_cli({"seq_prove", "--depth", "5", "--names", "3", "--z3",
                           "--stats", "-j", "2", "A |~ A"});
    ctx.check(o.max_depth == 5, "--depth");
    ctx.check(o.max_names == 3, "--names");
    ctx.check(o.use_z3 && o.show_stats, "flags");
    ctx.check(o.num_threads == 2, "-j");
    ctx.check_eq(o.input, "A |~ A", "input sequent");

    Options neg = parse_cli({"seq_prove", "~(A) |~ B"});
    ctx.check_eq(neg.input, "~(A) |~ B", "sequent starting with ~");

    ctx.check(parse_cli({"seq_prove", "--selftest"}).selftest, "--selftest");
    ctx.check(cli_fails({"seq_prove"}), "missing input");
    ctx.check(cli_fails({"seq_prove", "--depth", "x", "A |~ A"}), "bad number");
    ctx.check(cli_fails({"seq_prove", "--depth"}), "missing number");
    ctx.check(cli_fails({"seq_prove", "--bogus", "A |~ A"}), "unknown option");
    ctx.check(cli_fails({"seq_prove", "A |~ A", "B |~ B"}), "two inputs");
}

// ============================================================================
// Test Entry Point
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Lexer tests
    runner.run("lexer_keywords",             test_lexer_keywords);
    runner.run("lexer_depth",                test_lexer_depth);
    runner.run("deparenthesize",             test_deparenthesize);
    runner.run("placeholders",               test_placeholders);

    // Parser tests
    runner.run("parse_scenarios",            test_parse_scenarios);
    runner.run("parse_keyword_words",        test_parse_keyword_words);
    runner.run("parse_glued_prefixes",       test_parse_glued_prefixes);
    runner.run("parse_leftmost_grouping",    test_parse_leftmost_grouping);
    runner.run("parse_errors",               test_parse_errors);

    // AST tests
    runner.run("builders",                   test_builders);
    runner.run("complexity_laws",            test_complexity_laws);
    runner.run("names_and_variables",        test_names_and_variables);
    runner.run("instantiate",                test_instantiate);
    runner.run("clone_independence",         test_clone_independence);
    runner.run("round_trip",                 test_round_trip);

    // Sequent tests
    runner.run("sequent_parse",              test_sequent_parse);
    runner.run("sequent_selection",          test_sequent_selection);

    // Decomposition tests
    runner.run("decompose_propositional",    test_decompose_propositional_rows);
    runner.run("decompose_quantifiers",      test_decompose_quantifier_rows);

    // Name supply / closure
    runner.run("name_supply",                test_name_supply);
    runner.run("is_axiom",                   test_is_axiom);

    // Proof search
    runner.run("search_propositional",       test_search_propositional);
    runner.run("search_first_order",         test_search_first_order);
    runner.run("search_counter_sequent",     test_search_counter_sequent);
    runner.run("search_stats_and_trace",     test_search_stats_and_trace);
    runner.run("search_bounds",              test_search_bounds);
    runner.run("search_reusable_failure",    test_search_reusable_failure);
    runner.run("parallel_equivalence",       test_parallel_equivalence);

    // Z3
    runner.run("z3_cross_check",             test_z3_cross_check);
    runner.run("z3_model",                   test_z3_model);

    // Utilities / CLI
    runner.run("utils",                      test_utils);
    runner.run("cli_args",                   test_cli_args);

    return runner.summarise();
}

}  // namespace seqprover
