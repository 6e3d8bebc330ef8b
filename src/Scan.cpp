#include <iterator>
#include <string>
#include <utility>

#include "utf8.h"

#include "Scan.hpp"

using namespace exact;

using SourceIter = std::string_view::const_iterator;

// Largest power of ten accepted in an exponent
static constexpr std::int64_t maxExponent = 1000000;

static bool isDigit(std::uint32_t cp) noexcept{
	return cp >= '0' && cp <= '9';
}

static bool isSpace(char c) noexcept{
	switch(c){
		case ' ':
		case '\t':
		case '\n':
		case '\r':
		case '\f':
		case '\v':
			return true;

		default: return false;
	}
}

static std::pair<SourceIter, SourceIter> getIters(std::string_view str) noexcept{
	return {begin(str), end(str)};
}

static std::string unexpectedChar(std::uint32_t cp){
	std::string errMsg = "Unexpected character '";
	utf8::append(cp, std::back_inserter(errMsg));
	errMsg += "'";
	return errMsg;
}

static bool scanSign(SourceIter &it, SourceIter end){
	if(it == end)
		return false;

	auto cp = utf8::peek_next(it, end);
	if(cp != '-' && cp != '+')
		return false;

	utf8::next(it, end);
	return cp == '-';
}

std::string_view exact::detail::trim(std::string_view s) noexcept{
	while(!s.empty() && isSpace(s.front()))
		s.remove_prefix(1);

	while(!s.empty() && isSpace(s.back()))
		s.remove_suffix(1);

	return s;
}

detail::IntLiteral exact::detail::scanIntLiteral(std::string_view s){
	IntLiteral lit;

	try{
		auto[it, end] = getIters(s);
		lit.negative = scanSign(it, end);

		while(it != end){
			auto cp = utf8::next(it, end);
			if(!isDigit(cp))
				throw ParseError(std::string(s), unexpectedChar(cp) + " in integer literal");

			lit.digits += static_cast<char>(cp);
		}
	}
	catch(const utf8::exception &e){
		throw ParseError(std::string(s), "Invalid UTF-8 in integer literal", e.what());
	}

	if(lit.digits.empty())
		throw ParseError(std::string(s), "Expected digits in integer literal");

	return lit;
}

detail::DecimalLiteral exact::detail::scanDecimalLiteral(std::string_view s){
	DecimalLiteral lit;
	std::size_t numDigits = 0;
	bool negative = false;

	try{
		auto[it, end] = getIters(s);
		negative = scanSign(it, end);

		const AInt ten(10L);
		bool foundDot = false;

		while(it != end){
			auto cp = utf8::peek_next(it, end);
			if(isDigit(cp)){
				lit.value = lit.value * ten + AInt(static_cast<std::int64_t>(cp - '0'));
				++numDigits;
				if(foundDot)
					++lit.scale;
			}
			else if(cp == '.' && !foundDot)
				foundDot = true;
			else
				break;

			utf8::next(it, end);
		}

		if(!numDigits)
			throw ParseError(std::string(s), "Expected digits in decimal literal");

		if(it != end && (utf8::peek_next(it, end) == 'e' || utf8::peek_next(it, end) == 'E')){
			utf8::next(it, end);

			auto negativeExp = scanSign(it, end);
			std::int64_t exponent = 0;
			std::size_t expDigits = 0;

			while(it != end && isDigit(utf8::peek_next(it, end))){
				exponent = exponent * 10 + (utf8::next(it, end) - '0');
				++expDigits;

				if(exponent > maxExponent)
					throw ParseError(std::string(s), "Exponent out of range in decimal literal");
			}

			if(!expDigits)
				throw ParseError(std::string(s), "Expected digits in exponent of decimal literal");

			lit.scale += negativeExp ? exponent : -exponent;
		}

		if(it != end)
			throw ParseError(std::string(s), unexpectedChar(utf8::peek_next(it, end)) + " in decimal literal");
	}
	catch(const utf8::exception &e){
		throw ParseError(std::string(s), "Invalid UTF-8 in decimal literal", e.what());
	}

	if(negative)
		lit.value = -lit.value;

	return lit;
}
