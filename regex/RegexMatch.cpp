
#include "RegexMatch.h"
#include "RegexException.h"

//------------------------------------------------------------------------------
// Name: RegexMatch
//------------------------------------------------------------------------------
RegexMatch::RegexMatch(SymbolSlice symbols) : symbols_(symbols), anchored_(false) {

	checkAnchors(symbols);

	if (!symbols_.empty() && symbols_.front().type == SymbolType::StartAnchor) {
		symbols_  = symbols_.rest();
		anchored_ = true;
	}
}

//------------------------------------------------------------------------------
// Name: checkAnchors
// Desc: Anchors are structural. One in the wrong place means the pattern is
//       malformed, and that is reported whatever text it would be run on.
//------------------------------------------------------------------------------
void RegexMatch::checkAnchors(SymbolSlice symbols) {

	const size_t n = symbols.size();

	for (size_t i = 0; i < n; ++i) {
		const SymbolType type = symbols[i].type;

		if (type == SymbolType::StartAnchor && i != 0) {
			qCWarning(lcRegex, "'^' at symbol %d of %d", static_cast<int>(i), static_cast<int>(n));
			throw RegexAnchorException('^', i);
		}

		if (type == SymbolType::EndAnchor && i != n - 1) {
			qCWarning(lcRegex, "'$' at symbol %d of %d", static_cast<int>(i), static_cast<int>(n));
			throw RegexAnchorException('$', i);
		}
	}
}

//------------------------------------------------------------------------------
// Name:     isMatch
// Synopsis: match the pattern against a string
// Desc:     An anchored pattern is only tried at the start of 'text'. Otherwise
//           every suffix is tried in turn, shortest offset first, and the empty
//           suffix at the very end is tried too so that "$" or "x*" can match
//           there.
//------------------------------------------------------------------------------
bool RegexMatch::isMatch(TextSlice text) const {

	if (anchored_) {
		return matchHere(symbols_, text);
	}

	for (;;) {
		if (matchHere(symbols_, text)) {
			return true;
		}

		if (text.empty()) {
			return false;
		}

		text = text.rest();
	}
}

//------------------------------------------------------------------------------
// Name: matchHere
// Desc: Does 'symbols' match at the start of 'text'? Plain atoms recurse on
//       the rest of both; a repetition hands over to matchStar with the rest
//       of the pattern as its continuation.
//------------------------------------------------------------------------------
bool RegexMatch::matchHere(SymbolSlice symbols, TextSlice text) {

	if (symbols.empty()) {
		return true;
	}

	const Symbol &symbol = symbols.front();

	switch (symbol.type) {
	case SymbolType::Repeated:
		return matchStar(symbol, symbols.rest(), text);

	case SymbolType::EndAnchor:
		// checkAnchors() guarantees nothing follows.
		return text.empty();

	case SymbolType::Atom:
		if (!text.empty() && symbol.accepts(text.front())) {
			return matchHere(symbols.rest(), text.rest());
		}
		return false;

	case SymbolType::StartAnchor:
		qCWarning(lcRegex, "internal error, '^' reached 'matchHere'");
		throw RegexException("internal error, '^' reached 'matchHere'");
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: matchStar
// Desc: Zero repetitions are tried before each additional one: first the
//       continuation at the current position, then, if the next character
//       fits 'starred', the same decision one character further on.
//------------------------------------------------------------------------------
bool RegexMatch::matchStar(const Symbol &starred, SymbolSlice continuation, TextSlice text) {

	for (;;) {
		if (matchHere(continuation, text)) {
			return true;
		}

		if (text.empty() || !starred.accepts(text.front())) {
			return false;
		}

		text = text.rest();
	}
}
