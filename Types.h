
#ifndef TYPES_H_
#define TYPES_H_

#include <QtGlobal>

// One Unicode scalar value, as produced by QString::toUcs4().
typedef uint char_type;

#define _T(x) static_cast<char_type>(x)

#endif
