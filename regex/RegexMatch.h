
#ifndef REGEX_MATCH_H_
#define REGEX_MATCH_H_

#include "Types.h"
#include "RegexCommon.h"
#include "RegexSymbol.h"

/* Backtracking matcher over a tokenized pattern. It never copies the symbols
   or the text: every step works on suffix slices of the caller's buffers,
   which must outlive the matcher. Nothing is mutated while matching, so one
   instance may be used from several threads. */
class RegexMatch {
public:
	/**
	 * @brief RegexMatch - Checks anchor placement and prepares for matching.
	 * @param symbols - The tokenized pattern.
	 * @throws RegexAnchorException if '^' is not first or '$' is not last.
	 */
	explicit RegexMatch(SymbolSlice symbols);

public:
	/**
	 * @brief isMatch - Does the pattern match somewhere in 'text'?
	 * @param text - Text to search within.
	 * @return true if a leading '^' pattern matches at offset 0, or an
	 *         unanchored pattern matches at any offset including the end.
	 */
	bool isMatch(TextSlice text) const;

	bool anchored() const {
		return anchored_;
	}

private:
	static bool matchHere(SymbolSlice symbols, TextSlice text);
	static bool matchStar(const Symbol &starred, SymbolSlice continuation, TextSlice text);
	static void checkAnchors(SymbolSlice symbols);

private:
	SymbolSlice symbols_; // Without the leading '^', if there was one.
	bool        anchored_;
};

#endif
