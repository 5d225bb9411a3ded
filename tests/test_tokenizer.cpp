#include <gtest/gtest.h>

#include "regex/RegexTokenizer.h"
#include "regex/RegexException.h"


TEST(Tokenizer, empty_pattern) {
    EXPECT_TRUE(RegexTokenizer::tokenize("").empty());

    RegexTokenizer tokenizer("");
    EXPECT_TRUE(tokenizer.atEnd());
}


TEST(Tokenizer, literals_and_wildcard) {
    const SymbolSequence symbols = RegexTokenizer::tokenize("a.c");
    ASSERT_EQ(symbols.size(), 3u);

    EXPECT_EQ(symbols[0], Symbol::atom('a'));
    EXPECT_EQ(symbols[1].type, SymbolType::Atom);
    EXPECT_EQ(symbols[1].kind, AtomKind::AnyChar);
    EXPECT_EQ(symbols[2].kind, AtomKind::Literal);
    EXPECT_EQ(symbols[2].literal, static_cast<char_type>('c'));
}


TEST(Tokenizer, anchors) {
    const SymbolSequence symbols = RegexTokenizer::tokenize("^ab$");
    ASSERT_EQ(symbols.size(), 4u);
    EXPECT_EQ(symbols.front(), Symbol::startAnchor());
    EXPECT_EQ(symbols.back(), Symbol::endAnchor());
}


TEST(Tokenizer, star_binds_to_previous_character) {
    const SymbolSequence symbols = RegexTokenizer::tokenize("ab*.*c");
    ASSERT_EQ(symbols.size(), 4u);
    EXPECT_EQ(symbols[0], Symbol::atom('a'));
    EXPECT_EQ(symbols[1], Symbol::repeated('b'));
    EXPECT_EQ(symbols[2].type, SymbolType::Repeated);
    EXPECT_EQ(symbols[2].kind, AtomKind::AnyChar);
    EXPECT_EQ(symbols[3], Symbol::atom('c'));
}


TEST(Tokenizer, star_without_operand_is_literal) {
    // A leading '*' has nothing to repeat, "**" repeats a literal '*'.
    SymbolSequence symbols = RegexTokenizer::tokenize("*a");
    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[0], Symbol::atom('*'));

    symbols = RegexTokenizer::tokenize("**");
    ASSERT_EQ(symbols.size(), 1u);
    EXPECT_EQ(symbols[0], Symbol::repeated('*'));

    symbols = RegexTokenizer::tokenize("a**");
    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[0], Symbol::repeated('a'));
    EXPECT_EQ(symbols[1], Symbol::atom('*'));
}


TEST(Tokenizer, anchors_are_never_repeated) {
    const SymbolSequence symbols = RegexTokenizer::tokenize("^*$*");
    ASSERT_EQ(symbols.size(), 4u);
    EXPECT_EQ(symbols[0], Symbol::startAnchor());
    EXPECT_EQ(symbols[1], Symbol::atom('*'));
    EXPECT_EQ(symbols[2], Symbol::endAnchor());
    EXPECT_EQ(symbols[3], Symbol::atom('*'));
}


TEST(Tokenizer, misplaced_anchors_are_emitted_as_is) {
    const SymbolSequence symbols = RegexTokenizer::tokenize("a$b^");
    ASSERT_EQ(symbols.size(), 4u);
    EXPECT_EQ(symbols[1], Symbol::endAnchor());
    EXPECT_EQ(symbols[3], Symbol::startAnchor());
}


TEST(Tokenizer, lazy_and_single_pass) {
    RegexTokenizer tokenizer("x*y");
    ASSERT_FALSE(tokenizer.atEnd());
    EXPECT_EQ(tokenizer.next(), Symbol::repeated('x'));
    ASSERT_FALSE(tokenizer.atEnd());
    EXPECT_EQ(tokenizer.next(), Symbol::atom('y'));
    EXPECT_TRUE(tokenizer.atEnd());
    EXPECT_TRUE(tokenizer.remaining().empty());
    EXPECT_THROW(tokenizer.next(), RegexException);
}


TEST(Tokenizer, tokenizing_twice_gives_same_sequence) {
    const QString patterns[] = {"", "^abc$", "a.*b*c", "**.", "^$", "\xc3\xa9*t\xc3\xa9"};

    for (const QString &pattern : patterns) {
        EXPECT_EQ(RegexTokenizer::tokenize(pattern), RegexTokenizer::tokenize(pattern)) << qPrintable(pattern);
    }
}


TEST(Tokenizer, non_bmp_scalar_is_one_symbol) {
    // U+1F438, a surrogate pair in UTF-16.
    const QString frog = QString::fromUtf8("\xf0\x9f\x90\xb8");
    ASSERT_EQ(frog.size(), 2);

    const SymbolSequence symbols = RegexTokenizer::tokenize(frog + "*");
    ASSERT_EQ(symbols.size(), 1u);
    EXPECT_EQ(symbols[0], Symbol::repeated(0x1F438));
}


TEST(Symbol, to_string) {
    EXPECT_EQ(Symbol::startAnchor().toString(), QString("^"));
    EXPECT_EQ(Symbol::endAnchor().toString(), QString("$"));
    EXPECT_EQ(Symbol::atom('.').toString(), QString("."));
    EXPECT_EQ(Symbol::atom('a').toString(), QString("'a'"));
    EXPECT_EQ(Symbol::repeated('b').toString(), QString("'b'*"));
    EXPECT_EQ(Symbol::repeated('.').toString(), QString(".*"));
}


TEST(Symbol, equality) {
    EXPECT_EQ(Symbol::atom('a'), Symbol::atom('a'));
    EXPECT_NE(Symbol::atom('a'), Symbol::atom('b'));
    EXPECT_NE(Symbol::atom('a'), Symbol::repeated('a'));
    EXPECT_NE(Symbol::atom('.'), Symbol::atom('a'));
    EXPECT_NE(Symbol::startAnchor(), Symbol::endAnchor());
}
