
#ifndef REGEX_H_
#define REGEX_H_

#include "Types.h"
#include "RegexCommon.h"
#include "RegexSymbol.h"
#include "RegexMatch.h"
#include "RegexException.h"
#include <QString>

/* A pattern tokenized once and ready to be run against any number of texts.

   Supported syntax:
     c    matches the literal character c
     .    matches any single character
     ^    matches the beginning of the text (first position only)
     $    matches the end of the text (last position only)
     c*   matches zero or more occurrences of c (or of any character for .*)
 */
class Regex {
public:
	/**
	 * @brief Tokenizes a pattern. Never fails; misplaced anchors are reported
	 *        when the pattern is first used for matching.
	 * @param pattern - The regular expression.
	 */
	explicit Regex(const QString &pattern);

private:
	Regex(const Regex &) = delete;
	Regex &operator=(const Regex &) = delete;

public:
	/**
	 * @brief match - Test the pattern against a string.
	 * @param text - Text to search within.
	 * @return true on a match, false otherwise
	 * @throws RegexAnchorException if the pattern has '^' or '$' out of place.
	 */
	bool match(const QString &text) const;

	// Same as above, over already decoded scalars.
	bool match(TextSlice text) const;

public:
	const QString &pattern() const {
		return pattern_;
	}

	const SymbolSequence &symbols() const {
		return symbols_;
	}

	bool anchored() const {
		return !symbols_.empty() && symbols_.front().type == SymbolType::StartAnchor;
	}

private:
	QString        pattern_;
	SymbolSequence symbols_;
};

/**
 * @brief match_regexp - One-shot form of Regex(pattern).match(text).
 * @throws RegexAnchorException if the pattern has '^' or '$' out of place.
 */
bool match_regexp(const QString &pattern, const QString &text);

#endif
