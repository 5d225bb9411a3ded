
#include "RegexReference.h"

namespace {

bool match_here(TextSlice re, TextSlice text);

/*--------------------------------------------------------------------*
 * starts_with
 *
 * Does 'text' begin with 'c', where '.' in the pattern stands for any
 * character at all.
 *--------------------------------------------------------------------*/
bool starts_with(char_type c, TextSlice text) {
	return !text.empty() && (c == AnyMeta || c == text.front());
}

/*--------------------------------------------------------------------*
 * match_star - search for c*re at the beginning of text
 *--------------------------------------------------------------------*/
bool match_star(char_type c, TextSlice re, TextSlice text) {
	for (;;) {
		if (match_here(re, text)) {
			return true;
		}

		if (!starts_with(c, text)) {
			return false;
		}

		text = text.rest();
	}
}

/*--------------------------------------------------------------------*
 * match_here - search for re at the beginning of text
 *--------------------------------------------------------------------*/
bool match_here(TextSlice re, TextSlice text) {

	if (re.empty()) {
		return true;
	}

	if (re.size() > 1 && re[1] == StarMeta) {
		return match_star(re[0], TextSlice(re.begin() + 2, re.end()), text);
	}

	if (re.size() == 1 && re[0] == EndAnchorMeta) {
		return text.empty();
	}

	if (starts_with(re[0], text)) {
		return match_here(re.rest(), text.rest());
	}

	return false;
}

}

//------------------------------------------------------------------------------
// Name: reference_match
//------------------------------------------------------------------------------
bool reference_match(TextSlice pattern, TextSlice text) {

	if (!pattern.empty() && pattern.front() == StartAnchorMeta) {
		return match_here(pattern.rest(), text);
	}

	// Must look even if the string is empty.
	for (;;) {
		if (match_here(pattern, text)) {
			return true;
		}

		if (text.empty()) {
			return false;
		}

		text = text.rest();
	}
}

//------------------------------------------------------------------------------
// Name: reference_match
//------------------------------------------------------------------------------
bool reference_match(const QString &pattern, const QString &text) {
	const ScalarString p = toScalars(pattern);
	const ScalarString t = toScalars(text);
	return reference_match(TextSlice(p), TextSlice(t));
}
