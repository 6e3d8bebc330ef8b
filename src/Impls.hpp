#ifndef EXACT_SRC_IMPLS_HPP
#define EXACT_SRC_IMPLS_HPP 1

#include <gmp.h>

#include "exact/AInt.hpp"

struct exact::AInt::Impl{
	Impl(){ mpz_init(value); }
	~Impl(){ mpz_clear(value); }

	Impl(const Impl&) = delete;
	Impl &operator=(const Impl&) = delete;

	mpz_t value;
};

#endif // !EXACT_SRC_IMPLS_HPP
