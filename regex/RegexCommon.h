
#ifndef REGEX_COMMON_H_
#define REGEX_COMMON_H_

#include "Types.h"
#include "Slice.h"
#include <QLoggingCategory>
#include <QString>
#include <QVector>

Q_DECLARE_LOGGING_CATEGORY(lcRegex)

/* Metacharacters understood by the tokenizer. Anything else is a literal. */
const char_type StartAnchorMeta = _T('^');
const char_type EndAnchorMeta   = _T('$');
const char_type AnyMeta         = _T('.');
const char_type StarMeta        = _T('*');

typedef QVector<char_type> ScalarString;
typedef Slice<char_type>   TextSlice;

// Decode to Unicode scalar values so that a surrogate pair counts as one character.
inline ScalarString toScalars(const QString &s) {
	return s.toUcs4();
}

// Renders one scalar for diagnostics.
QString scalarToString(char_type c);

#endif
