
#ifndef REGEX_SYMBOL_H_
#define REGEX_SYMBOL_H_

#include "Types.h"
#include "Slice.h"
#include <QDebug>
#include <QString>
#include <vector>

enum class SymbolType {
	StartAnchor, // ^, only legal as the first symbol
	EndAnchor,   // $, only legal as the last symbol
	Atom,        // exactly one character
	Repeated     // zero or more characters, from "c*"
};

enum class AtomKind {
	AnyChar, // .
	Literal
};

/* One unit of a tokenized pattern. 'kind' and 'literal' only mean something
   for Atom and Repeated symbols; 'literal' only when kind is Literal. */
struct Symbol {
	SymbolType type;
	AtomKind   kind;
	char_type  literal;

public:
	static Symbol startAnchor();
	static Symbol endAnchor();
	static Symbol atom(char_type c);
	static Symbol repeated(char_type c);

public:
	bool isAnchor() const {
		return type == SymbolType::StartAnchor || type == SymbolType::EndAnchor;
	}

	// True if the one character 'c' satisfies this Atom or Repeated symbol.
	bool accepts(char_type c) const {
		return kind == AtomKind::AnyChar || literal == c;
	}

	QString toString() const;
};

typedef std::vector<Symbol> SymbolSequence;
typedef Slice<Symbol>       SymbolSlice;

bool operator==(const Symbol &lhs, const Symbol &rhs);
bool operator!=(const Symbol &lhs, const Symbol &rhs);

QDebug operator<<(QDebug debug, const Symbol &symbol);

#endif
