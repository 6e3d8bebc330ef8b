#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <gmp.h>
#include <mpfr.h>

#include "exact/Rational.hpp"

#include "Impls.hpp"
#include "Scan.hpp"

using namespace exact;

Rational::Rational(const AInt &n, const AInt &d): m_num(n), m_den(d){
	if(m_den.isZero())
		throw DivisionByZero();
}

Rational::Rational(std::int64_t n, std::int64_t d): Rational(AInt(n), AInt(d)){}

Rational Rational::fromString(std::string_view s){
	auto text = detail::trim(s);
	if(text.empty())
		throw ParseError(std::string(s), "Cannot read an empty string as a number");

	auto numSlashes = std::count(begin(text), end(text), '/');

	if(numSlashes == 0){
		auto lit = detail::scanDecimalLiteral(text);
		if(lit.scale >= 0)
			return Rational(lit.value, exact::pow10(lit.scale)).normalize();
		else
			return Rational(lit.value * exact::pow10(-lit.scale), AInt(1L));
	}

	if(numSlashes > 1)
		throw ParseError(std::string(s), "Cannot read '" + std::string(s) + "' because of too many '/'");

	auto slashIdx = text.find('/');
	auto numText = detail::trim(text.substr(0, slashIdx));
	auto denText = detail::trim(text.substr(slashIdx + 1));

	if(numText.empty() || denText.empty())
		throw ParseError(std::string(s), "Cannot read '" + std::string(s) + "' because of an empty operand");

	AInt num, den;

	try{
		num = AInt(numText);
		den = AInt(denText);
	}
	catch(const ParseError &e){
		throw ParseError(std::string(s), "Cannot read '" + std::string(s) + "' as a fraction", e.what());
	}

	return Rational(num, den).normalize();
}

template<typename Real>
static Rational realFromText(Real r){
	if(!std::isfinite(r)){
		std::string str = std::isnan(r) ? "nan" : (r < 0 ? "-inf" : "inf");
		throw ParseError(str, "Cannot represent non-finite number '" + str + "' exactly");
	}

	// leading zeros of the smallest subnormal plus its significant digits
	using Limits = std::numeric_limits<Real>;
	constexpr std::size_t bufSize = Limits::max_exponent10 - Limits::min_exponent10 + 2 * Limits::max_digits10 + 8;

	std::string buf(bufSize, '\0');
	auto[ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), r, std::chars_format::fixed);
	if(ec != std::errc())
		throw ParseError(std::to_string(r), "Cannot render floating point number (std::to_chars)");

	return Rational::fromString(std::string_view(buf.data(), ptr - buf.data()));
}

Rational Rational::fromReal(float r){ return realFromText(r); }
Rational Rational::fromReal(double r){ return realFromText(r); }
Rational Rational::fromReal(long double r){ return realFromText(r); }

Rational Rational::normalize() const{
	auto divisor = gcd(m_num, m_den);
	auto num = m_num / divisor;
	auto den = m_den / divisor;

	if(den.sign() < 0){
		num = -num;
		den = -den;
	}

	return Rational(num, den);
}

Rational Rational::negate() const{
	return Rational(-m_num, m_den);
}

Rational Rational::operator+(const Rational &rhs) const{
	return Rational(m_num * rhs.m_den + rhs.m_num * m_den, m_den * rhs.m_den).normalize();
}

Rational Rational::operator-(const Rational &rhs) const{
	return *this + rhs.negate();
}

Rational Rational::operator*(const Rational &rhs) const{
	return Rational(m_num * rhs.m_num, m_den * rhs.m_den).normalize();
}

Rational Rational::operator/(const Rational &rhs) const{
	return Rational(m_num * rhs.m_den, m_den * rhs.m_num).normalize();
}

Rational Rational::pow(const Rational &exponent) const{
	auto exp = exponent.normalize();
	if(exp.m_den != AInt(1L))
		throw std::domain_error("Cannot raise to non-integer power " + exponent.toFractionString());

	auto base = normalize();

	if(exp.m_num.sign() >= 0)
		return Rational(base.m_num.pow(exp.m_num), base.m_den.pow(exp.m_num)).normalize();

	auto magnitude = -exp.m_num;
	return Rational(base.m_den.pow(magnitude), base.m_num.pow(magnitude)).normalize();
}

int Rational::compare(const Rational &rhs) const noexcept{
	auto lhsCross = m_num * rhs.m_den;
	auto rhsCross = rhs.m_num * m_den;
	int order = lhsCross < rhsCross ? -1 : (lhsCross > rhsCross ? 1 : 0);

	// a negative denominator product flips cross multiplied order
	return m_den.sign() * rhs.m_den.sign() < 0 ? -order : order;
}

double Rational::toApproximateNumber() const{
	auto reduced = normalize();

	mpq_t q;
	mpq_init(q);
	mpq_set_num(q, reduced.m_num.m_impl->value);
	mpq_set_den(q, reduced.m_den.m_impl->value);

	using Limits = std::numeric_limits<double>;

	// round once, straight into the double format including its subnormals
	auto oldEmin = mpfr_get_emin(), oldEmax = mpfr_get_emax();
	mpfr_set_emin(Limits::min_exponent - Limits::digits + 1);
	mpfr_set_emax(Limits::max_exponent);

	mpfr_t real;
	mpfr_init2(real, Limits::digits);
	auto inex = mpfr_set_q(real, q, MPFR_RNDN);
	inex = mpfr_subnormalize(real, inex, MPFR_RNDN);

	auto res = mpfr_get_d(real, MPFR_RNDN);

	mpfr_clear(real);
	mpfr_set_emin(oldEmin);
	mpfr_set_emax(oldEmax);
	mpq_clear(q);
	return res;
}

std::string Rational::toFractionString() const{
	return m_num.toString() + "/" + m_den.toString();
}
