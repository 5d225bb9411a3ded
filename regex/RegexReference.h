
#ifndef REGEX_REFERENCE_H_
#define REGEX_REFERENCE_H_

#include "RegexCommon.h"
#include <QString>

/**
 * @brief reference_match - The classic matcher that walks the raw pattern
 *        string instead of a symbol sequence. It shares no code with
 *        Regex/RegexMatch and is kept to cross-check them.
 *
 * '^' is special only as the first pattern character and '$' only as the
 * last one; anywhere else they are literals, so this never throws.
 */
bool reference_match(const QString &pattern, const QString &text);

bool reference_match(TextSlice pattern, TextSlice text);

#endif
