#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>

#include "exact/AInt.hpp"

#include "Impls.hpp"
#include "Scan.hpp"

using namespace exact;

AInt::AInt() noexcept: m_impl(std::make_unique<AInt::Impl>()){}

AInt::AInt(AInt &&other) noexcept: m_impl(std::move(other.m_impl)){}

AInt::AInt(const AInt &other) noexcept: AInt(){
	mpz_set(m_impl->value, other.m_impl->value);
}

AInt::~AInt(){}

AInt::AInt(std::int64_t i) noexcept: AInt(){
	mpz_set_si(m_impl->value, i);
}

AInt::AInt(std::uint64_t i) noexcept: AInt(){
	mpz_set_ui(m_impl->value, i);
}

AInt::AInt(std::string_view s): AInt(){
	auto literal = detail::scanIntLiteral(s);

	// mpz_set_str skips embedded white space, so only hand it checked digits
	if(mpz_set_str(m_impl->value, literal.digits.c_str(), 10) == -1)
		throw ParseError(std::string(s), "Invalid integer literal (mpz_set_str)");

	if(literal.negative)
		mpz_neg(m_impl->value, m_impl->value);
}

AInt &AInt::operator=(const AInt &other) noexcept{
	if(this == &other)
		return *this;

	if(!m_impl)
		m_impl = std::make_unique<Impl>();

	mpz_set(m_impl->value, other.m_impl->value);
	return *this;
}

AInt &AInt::operator=(AInt &&other) noexcept{
	std::swap(m_impl, other.m_impl);
	return *this;
}

#define DEF_AINT_OP(op, fn)\
AInt AInt::operator op(const AInt &rhs) const noexcept{\
	AInt ret;\
	fn(ret.m_impl->value, m_impl->value, rhs.m_impl->value);\
	return ret;\
}

DEF_AINT_OP(+, mpz_add)
DEF_AINT_OP(-, mpz_sub)
DEF_AINT_OP(*, mpz_mul)

AInt AInt::operator-() const noexcept{
	AInt ret;
	mpz_neg(ret.m_impl->value, m_impl->value);
	return ret;
}

AInt AInt::operator/(const AInt &rhs) const{
	if(rhs.isZero())
		throw DivisionByZero("Integer division by zero");

	AInt ret;
	mpz_tdiv_q(ret.m_impl->value, m_impl->value, rhs.m_impl->value);
	return ret;
}

AInt AInt::operator%(const AInt &rhs) const{
	if(rhs.isZero())
		throw DivisionByZero("Integer remainder by zero");

	AInt ret;
	mpz_tdiv_r(ret.m_impl->value, m_impl->value, rhs.m_impl->value);
	return ret;
}

bool AInt::operator<(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) < 0;
}

bool AInt::operator>(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) > 0;
}

bool AInt::operator<=(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) <= 0;
}

bool AInt::operator>=(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) >= 0;
}

bool AInt::operator==(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) == 0;
}

bool AInt::operator!=(const AInt &rhs) const noexcept{
	return mpz_cmp(m_impl->value, rhs.m_impl->value) != 0;
}

int AInt::sign() const noexcept{
	return mpz_sgn(m_impl->value);
}

AInt AInt::pow(std::uint64_t exp) const noexcept{
	AInt res;
	mpz_pow_ui(res.m_impl->value, m_impl->value, exp);
	return res;
}

AInt AInt::pow(const AInt &exp) const{
	if(exp.sign() < 0)
		throw std::domain_error("negative integer exponent");

	// 0, 1 and -1 stay small for any exponent
	if(mpz_cmpabs_ui(m_impl->value, 1) <= 0){
		if(exp.isZero())
			return AInt(1L);
		else if(sign() >= 0 || mpz_even_p(exp.m_impl->value))
			return exact::abs(*this);
		else
			return *this;
	}

	if(!exp.fitsInt64())
		throw std::runtime_error("exponent too large");

	auto n = static_cast<std::uint64_t>(exp.toInt64());

	// result has at least (bits - 1) * n + 1 bits, GMP holds at most INT_MAX limbs
	constexpr auto maxBits = static_cast<std::uint64_t>(std::numeric_limits<int>::max()) * GMP_NUMB_BITS;
	if(n > maxBits / (bitsRequired() - 1))
		throw std::runtime_error("exponent too large");

	return pow(n);
}

std::size_t AInt::bitsRequired() const noexcept{
	return mpz_sizeinbase(m_impl->value, 2);
}

bool AInt::fitsInt64() const noexcept{
	return mpz_fits_slong_p(m_impl->value) != 0;
}

std::int64_t AInt::toInt64() const{
	if(!fitsInt64())
		throw std::range_error("integer does not fit in 64 bits");

	return mpz_get_si(m_impl->value);
}

std::string AInt::toString() const{
	std::string str;
	str.resize(mpz_sizeinbase(m_impl->value, 10) + 2);
	mpz_get_str(&str[0], 10, m_impl->value);

	// mpz_sizeinbase may overestimate by one
	str.resize(std::strlen(str.c_str()));
	return str;
}

AInt exact::gcd(const AInt &a, const AInt &b) noexcept{
	AInt res;
	mpz_gcd(res.m_impl->value, a.m_impl->value, b.m_impl->value);
	return res;
}

AInt exact::abs(const AInt &a) noexcept{
	AInt res;
	mpz_abs(res.m_impl->value, a.m_impl->value);
	return res;
}

std::size_t exact::digitCount(const AInt &a){
	auto str = a.toString();
	return a.sign() < 0 ? str.size() - 1 : str.size();
}

AInt exact::pow10(std::uint64_t n) noexcept{
	AInt res;
	mpz_ui_pow_ui(res.m_impl->value, 10, n);
	return res;
}
