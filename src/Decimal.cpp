#include "exact/Rational.hpp"

using namespace exact;

std::string Rational::toDecimalString(std::int64_t precision) const{
	auto reduced = normalize();
	auto numerator = abs(reduced.m_num);
	const auto &denominator = reduced.m_den;

	auto integerPart = numerator / denominator;
	auto remainder = numerator % denominator;

	std::string str = reduced.m_num.sign() < 0 ? "-" : "";

	if(remainder.isZero() || precision <= 0){
		if(integerPart.isZero())
			return "0";

		return str + integerPart.toString();
	}

	str += integerPart.toString();
	str += '.';

	const auto divisorDigits = digitCount(denominator - AInt(1L));

	while(precision > 0){
		// remainder < denominator, so the shifted carry is at least one digit
		// longer than denominator - 1 and every zero skipped is accounted for
		auto extraZeros = divisorDigits - digitCount(remainder) + 1;
		auto carry = remainder * exact::pow10(extraZeros);
		auto nextDigit = carry / denominator;

		str.append(extraZeros - digitCount(nextDigit), '0');
		str += nextDigit.toString();

		remainder = carry - nextDigit * denominator;
		if(remainder.isZero())
			break;

		--precision;
	}

	return str;
}
