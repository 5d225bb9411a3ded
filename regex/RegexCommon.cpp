
#include "RegexCommon.h"

// Debug output is off unless a filter rule switches it on.
Q_LOGGING_CATEGORY(lcRegex, "tinyregex", QtInfoMsg)

//------------------------------------------------------------------------------
// Name: scalarToString
//------------------------------------------------------------------------------
QString scalarToString(char_type c) {
	return QString::fromUcs4(&c, 1);
}
