
#ifndef REGEX_TOKENIZER_H_
#define REGEX_TOKENIZER_H_

#include "RegexCommon.h"
#include "RegexSymbol.h"
#include <QString>

/* Turns a pattern into symbols, one forward pass with one character of
   lookahead. Each instance can be drained exactly once; it does not validate
   where anchors appear, that is up to the matcher. */
class RegexTokenizer {
public:
	explicit RegexTokenizer(const QString &pattern);
	RegexTokenizer(const RegexTokenizer &) = delete;
	RegexTokenizer &operator=(const RegexTokenizer &) = delete;

public:
	// Materializes the whole sequence for 'pattern'.
	static SymbolSequence tokenize(const QString &pattern);

public:
	bool atEnd() const;

	/**
	 * @brief next - Produces the next symbol.
	 * @return the symbol starting at the current position
	 * @throws RegexException when called after atEnd() became true
	 */
	Symbol next();

	// Drains whatever is left.
	SymbolSequence remaining();

private:
	char_type current() const;
	char_type advance();
	bool peekIsStar() const;

private:
	ScalarString pattern_;
	int          pos_;
};

#endif
