
#include "RegexTokenizer.h"
#include "RegexException.h"

//------------------------------------------------------------------------------
// Name: RegexTokenizer
//------------------------------------------------------------------------------
RegexTokenizer::RegexTokenizer(const QString &pattern) : pattern_(toScalars(pattern)), pos_(0) {
}

//------------------------------------------------------------------------------
// Name: tokenize
//------------------------------------------------------------------------------
SymbolSequence RegexTokenizer::tokenize(const QString &pattern) {
	RegexTokenizer tokenizer(pattern);
	return tokenizer.remaining();
}

//------------------------------------------------------------------------------
// Name: atEnd
//------------------------------------------------------------------------------
bool RegexTokenizer::atEnd() const {
	return pos_ >= pattern_.size();
}

//------------------------------------------------------------------------------
// Name: next
// Desc: '^' and '$' are always anchors, even when followed by '*'. Any other
//       character followed by '*' becomes a repetition and both are consumed.
//------------------------------------------------------------------------------
Symbol RegexTokenizer::next() {

	if (atEnd()) {
		throw RegexException("tokenizer read past the end of the pattern");
	}

	const char_type c = advance();

	if (c == StartAnchorMeta) {
		return Symbol::startAnchor();
	}

	if (c == EndAnchorMeta) {
		return Symbol::endAnchor();
	}

	if (peekIsStar()) {
		advance();
		return Symbol::repeated(c);
	}

	return Symbol::atom(c);
}

//------------------------------------------------------------------------------
// Name: remaining
//------------------------------------------------------------------------------
SymbolSequence RegexTokenizer::remaining() {
	SymbolSequence symbols;
	symbols.reserve(static_cast<size_t>(pattern_.size() - pos_));

	while (!atEnd()) {
		symbols.push_back(next());
	}

	return symbols;
}

char_type RegexTokenizer::current() const {
	return pattern_[pos_];
}

char_type RegexTokenizer::advance() {
	const char_type c = current();
	++pos_;
	return c;
}

bool RegexTokenizer::peekIsStar() const {
	return !atEnd() && current() == StarMeta;
}
