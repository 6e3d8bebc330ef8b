#ifndef EXACT_RATIONAL_HPP
#define EXACT_RATIONAL_HPP 1

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include "AInt.hpp"
#include "Errors.hpp"

//! \file

namespace exact{
	namespace detail{
		template<typename T, typename = void>
		struct FromHelper;
	}

	/**
	 * \brief Exact rational number
	 *
	 * Holds an arbitrary precision numerator over a non-zero arbitrary
	 * precision denominator. Values are never modified after construction,
	 * every operation returns a new Rational.
	 *
	 * Raw construction stores the pair as given. All arithmetic results are
	 * normalized: reduced by their gcd with a positive denominator.
	 **/
	class Rational{
		public:
			//! Default step budget of toDecimalString
			static constexpr std::int64_t defaultPrecision = 16;

			Rational(const Rational &other) = default;
			Rational(Rational &&other) noexcept = default;

			Rational &operator=(const Rational &other) = default;
			Rational &operator=(Rational &&other) noexcept = default;

			//! Throws DivisionByZero if denominator is zero
			Rational(const AInt &numerator, const AInt &denominator = AInt(1L));

			explicit Rational(std::int64_t numerator, std::int64_t denominator = 1);

			/**
			 * \brief Convert a value into a Rational
			 *
			 * Accepts a Rational (copied), an AInt or built-in integer (exact),
			 * a floating point number (read through its shortest round-trip
			 * decimal text) or a string holding a decimal or "n/d" fraction.
			 *
			 * \throws ParseError if a string or floating value can not be read
			 * \throws DivisionByZero if a fraction string has a zero denominator
			 **/
			template<typename T>
			static Rational from(const T &value){
				return detail::FromHelper<std::decay_t<T>>::convert(value);
			}

			static Rational fromString(std::string_view s);

			//! Read through the shortest round-trip decimal text of the given type
			static Rational fromReal(float r);
			static Rational fromReal(double r);
			static Rational fromReal(long double r);

			const AInt &numerator() const noexcept{ return m_num; }
			const AInt &denominator() const noexcept{ return m_den; }

			//! Reduce by gcd and make the denominator positive
			Rational normalize() const;

			Rational operator+(const Rational &rhs) const;
			Rational operator-(const Rational &rhs) const;
			Rational operator*(const Rational &rhs) const;

			//! Throws DivisionByZero if rhs is zero
			Rational operator/(const Rational &rhs) const;

			Rational add(const Rational &rhs) const{ return *this + rhs; }
			Rational subtract(const Rational &rhs) const{ return *this - rhs; }
			Rational multiply(const Rational &rhs) const{ return *this * rhs; }
			Rational divide(const Rational &rhs) const{ return *this / rhs; }

			/**
			 * \brief Raise to an integer valued power
			 *
			 * Negative exponents take the reciprocal first.
			 *
			 * \throws std::domain_error if exponent is not an integer
			 * \throws DivisionByZero for a negative power of zero
			 * \throws std::runtime_error if the exponent does not fit 64 bits
			 **/
			Rational pow(const Rational &exponent) const;

			template<typename T> Rational add(const T &rhs) const{ return add(from(rhs)); }
			template<typename T> Rational subtract(const T &rhs) const{ return subtract(from(rhs)); }
			template<typename T> Rational multiply(const T &rhs) const{ return multiply(from(rhs)); }
			template<typename T> Rational divide(const T &rhs) const{ return divide(from(rhs)); }
			template<typename T> Rational pow(const T &rhs) const{ return pow(from(rhs)); }

			//! -1, 0 or 1 as this is less than, equal to or greater than rhs
			int compare(const Rational &rhs) const noexcept;

			bool operator==(const Rational &rhs) const noexcept{ return compare(rhs) == 0; }
			bool operator!=(const Rational &rhs) const noexcept{ return compare(rhs) != 0; }
			bool operator<(const Rational &rhs) const noexcept{ return compare(rhs) < 0; }
			bool operator>(const Rational &rhs) const noexcept{ return compare(rhs) > 0; }
			bool operator<=(const Rational &rhs) const noexcept{ return compare(rhs) <= 0; }
			bool operator>=(const Rational &rhs) const noexcept{ return compare(rhs) >= 0; }

			template<typename T> bool equals(const T &rhs) const{ return *this == from(rhs); }
			template<typename T> bool lessThan(const T &rhs) const{ return *this < from(rhs); }
			template<typename T> bool lessOrEqual(const T &rhs) const{ return *this <= from(rhs); }
			template<typename T> bool greaterThan(const T &rhs) const{ return *this > from(rhs); }
			template<typename T> bool greaterOrEqual(const T &rhs) const{ return *this >= from(rhs); }

			//! Nearest double to the exact value, lossy
			double toApproximateNumber() const;

			//! "numerator/denominator" exactly as stored
			std::string toFractionString() const;

			std::string toString() const{ return toFractionString(); }

			/**
			 * \brief Render as a decimal by long division
			 *
			 * The integer part is followed by up to \p precision long division
			 * steps. Each step emits the next significant quotient digit(s)
			 * together with the run of zeros in front of it. Rendering stops
			 * early once the expansion terminates. Digits are truncated, not
			 * rounded. A precision of zero or less renders the integer part only.
			 **/
			std::string toDecimalString(std::int64_t precision = defaultPrecision) const;

		private:
			Rational negate() const;

			AInt m_num, m_den;
	};

	namespace detail{
		template<>
		struct FromHelper<Rational, void>{
			static Rational convert(const Rational &q){ return q; }
		};

		template<>
		struct FromHelper<AInt, void>{
			static Rational convert(const AInt &i){ return Rational(i, AInt(1L)); }
		};

		template<typename Int>
		struct FromHelper<Int, std::enable_if_t<std::is_integral_v<Int> && std::is_signed_v<Int>>>{
			static Rational convert(Int i){ return Rational(AInt(static_cast<std::int64_t>(i)), AInt(1L)); }
		};

		template<typename UInt>
		struct FromHelper<UInt, std::enable_if_t<std::is_integral_v<UInt> && !std::is_signed_v<UInt>>>{
			static Rational convert(UInt i){ return Rational(AInt(static_cast<std::uint64_t>(i)), AInt(1L)); }
		};

		template<typename Real>
		struct FromHelper<Real, std::enable_if_t<std::is_floating_point_v<Real>>>{
			static Rational convert(Real r){ return Rational::fromReal(r); }
		};

		template<typename Str>
		struct FromHelper<Str, std::enable_if_t<std::is_convertible_v<const Str&, std::string_view>>>{
			static Rational convert(std::string_view s){ return Rational::fromString(s); }
		};
	}
}

#endif // !EXACT_RATIONAL_HPP
