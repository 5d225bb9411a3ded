
#include "Regex.h"
#include "RegexTokenizer.h"

//------------------------------------------------------------------------------
// Name: Regex
//------------------------------------------------------------------------------
Regex::Regex(const QString &pattern) : pattern_(pattern), symbols_(RegexTokenizer::tokenize(pattern)) {
	qCDebug(lcRegex) << "pattern" << pattern_ << "->" << symbols_;
}

//------------------------------------------------------------------------------
// Name: match
//------------------------------------------------------------------------------
bool Regex::match(const QString &text) const {
	const ScalarString scalars = toScalars(text);
	return match(TextSlice(scalars));
}

//------------------------------------------------------------------------------
// Name: match
//------------------------------------------------------------------------------
bool Regex::match(TextSlice text) const {
	const RegexMatch matcher{SymbolSlice(symbols_)};
	return matcher.isMatch(text);
}

//------------------------------------------------------------------------------
// Name: match_regexp
//------------------------------------------------------------------------------
bool match_regexp(const QString &pattern, const QString &text) {
	const Regex regex(pattern);
	return regex.match(text);
}
