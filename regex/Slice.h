
#ifndef SLICE_H_
#define SLICE_H_

#include <cstddef>
#include <cassert>

/* Read-only window over a contiguous buffer that someone else owns. Slices
   are passed by value; shrinking one never touches the buffer, so every
   suffix handed down a recursive call is free to make. */
template <class T>
class Slice {
public:
	Slice() : first_(nullptr), last_(nullptr) {
	}

	Slice(const T *first, const T *last) : first_(first), last_(last) {
	}

	// Works for std::vector and QVector alike.
	template <class Container>
	explicit Slice(const Container &c) : first_(c.data()), last_(c.data() + c.size()) {
	}

public:
	size_t size() const {
		return static_cast<size_t>(last_ - first_);
	}

	bool empty() const {
		return first_ == last_;
	}

	const T *begin() const { return first_; }
	const T *end() const   { return last_; }

	const T &front() const {
		assert(!empty());
		return *first_;
	}

	const T &back() const {
		assert(!empty());
		return *(last_ - 1);
	}

	const T &operator[](size_t index) const {
		assert(index < size());
		return first_[index];
	}

	// Everything after the first element.
	Slice rest() const {
		assert(!empty());
		return Slice(first_ + 1, last_);
	}

private:
	const T *first_;
	const T *last_;
};

#endif
