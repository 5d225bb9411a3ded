
#include "RegexSymbol.h"
#include "RegexCommon.h"

namespace {

Symbol makeSymbol(SymbolType type, char_type c) {
	Symbol s;
	s.type    = type;
	s.kind    = (c == AnyMeta) ? AtomKind::AnyChar : AtomKind::Literal;
	s.literal = (s.kind == AtomKind::Literal) ? c : 0;
	return s;
}

QString kindToString(const Symbol &symbol) {
	if (symbol.kind == AtomKind::AnyChar) {
		return QStringLiteral(".");
	}

	return QStringLiteral("'%1'").arg(scalarToString(symbol.literal));
}

}

Symbol Symbol::startAnchor() {
	return makeSymbol(SymbolType::StartAnchor, 0);
}

Symbol Symbol::endAnchor() {
	return makeSymbol(SymbolType::EndAnchor, 0);
}

Symbol Symbol::atom(char_type c) {
	return makeSymbol(SymbolType::Atom, c);
}

Symbol Symbol::repeated(char_type c) {
	return makeSymbol(SymbolType::Repeated, c);
}

//------------------------------------------------------------------------------
// Name: toString
// Desc: "^", "$", "." or "'c'", with a trailing '*' for repetitions.
//------------------------------------------------------------------------------
QString Symbol::toString() const {
	switch (type) {
	case SymbolType::StartAnchor:
		return QStringLiteral("^");
	case SymbolType::EndAnchor:
		return QStringLiteral("$");
	case SymbolType::Atom:
		return kindToString(*this);
	case SymbolType::Repeated:
		return kindToString(*this) + QLatin1Char('*');
	}

	return QString();
}

bool operator==(const Symbol &lhs, const Symbol &rhs) {
	if (lhs.type != rhs.type) {
		return false;
	}

	if (lhs.isAnchor()) {
		return true;
	}

	return lhs.kind == rhs.kind && lhs.literal == rhs.literal;
}

bool operator!=(const Symbol &lhs, const Symbol &rhs) {
	return !(lhs == rhs);
}

QDebug operator<<(QDebug debug, const Symbol &symbol) {
	QDebugStateSaver saver(debug);
	debug.nospace() << "Symbol(" << qPrintable(symbol.toString()) << ')';
	return debug;
}
