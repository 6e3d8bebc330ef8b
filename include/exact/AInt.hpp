#ifndef EXACT_AINT_HPP
#define EXACT_AINT_HPP 1

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "Errors.hpp"

namespace exact{
	class AInt{
		public:
			AInt() noexcept;
			AInt(const AInt &other) noexcept;
			AInt(AInt &&other) noexcept;

			~AInt();

			explicit AInt(std::int64_t i) noexcept;
			explicit AInt(std::uint64_t ui) noexcept;
			explicit AInt(std::string_view s);

			AInt &operator=(const AInt &other) noexcept;
			AInt &operator=(AInt &&other) noexcept;

			AInt operator+(const AInt &rhs) const noexcept;
			AInt operator-(const AInt &rhs) const noexcept;
			AInt operator*(const AInt &rhs) const noexcept;
			AInt operator-() const noexcept;

			//! Truncating division, throws DivisionByZero
			AInt operator/(const AInt &rhs) const;

			//! Remainder of truncating division, takes the sign of the dividend
			AInt operator%(const AInt &rhs) const;

			bool operator<(const AInt &rhs) const noexcept;
			bool operator>(const AInt &rhs) const noexcept;
			bool operator<=(const AInt &rhs) const noexcept;
			bool operator>=(const AInt &rhs) const noexcept;
			bool operator==(const AInt &rhs) const noexcept;
			bool operator!=(const AInt &rhs) const noexcept;

			//! -1, 0 or 1
			int sign() const noexcept;
			bool isZero() const noexcept{ return sign() == 0; }

			AInt pow(std::uint64_t exp) const noexcept;

			/**
			 * \brief Raise to a non-negative integer power
			 *
			 * \throws std::domain_error if exp is negative
			 * \throws std::runtime_error if the result can not be held, unless
			 *         the base is 0, 1 or -1
			 **/
			AInt pow(const AInt &exp) const;

			std::string toString() const;

			std::size_t bitsRequired() const noexcept;

			bool fitsInt64() const noexcept;
			std::int64_t toInt64() const;

		private:
			struct Impl;
			std::unique_ptr<Impl> m_impl;

			friend class Rational;
			friend AInt gcd(const AInt &a, const AInt &b) noexcept;
			friend AInt abs(const AInt &a) noexcept;
			friend AInt pow10(std::uint64_t n) noexcept;
	};

	//! Non-negative greatest common divisor, gcd(0, 0) is 0
	AInt gcd(const AInt &a, const AInt &b) noexcept;

	AInt abs(const AInt &a) noexcept;

	//! Number of base 10 digits in |a|, 1 for zero
	std::size_t digitCount(const AInt &a);

	//! 10 raised to n
	AInt pow10(std::uint64_t n) noexcept;
}

#endif // !EXACT_AINT_HPP
