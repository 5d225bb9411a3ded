
#ifndef REGEX_EXCEPTION_H_
#define REGEX_EXCEPTION_H_

#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <stdexcept>

/* Raised for misuse of the tokenizer, and as RegexAnchorException for
   malformed patterns. A pattern that simply does not match is never an error. */
class RegexException : public std::exception {
public:
	explicit RegexException(const char *format, ...) {
		va_list ap;
		va_start(ap, format);
		vsnprintf(error_, sizeof(error_), format, ap);
		va_end(ap);
	}

	const char *what() const noexcept {
		return error_;
	}

private:
	char error_[255];
};

/* A '^' that is not the first symbol or a '$' that is not the last one. */
class RegexAnchorException : public RegexException {
public:
	RegexAnchorException(char anchor, size_t position)
		: RegexException("'%c' in illegal position (symbol %lu)", anchor, static_cast<unsigned long>(position)), anchor_(anchor), position_(position) {
	}

	char anchor() const {
		return anchor_;
	}

	// Index of the offending symbol in the tokenized pattern.
	size_t position() const {
		return position_;
	}

private:
	char   anchor_;
	size_t position_;
};

#endif
