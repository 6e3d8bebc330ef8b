#ifndef EXACT_SRC_SCAN_HPP
#define EXACT_SRC_SCAN_HPP 1

#include <cstdint>
#include <string>
#include <string_view>

#include "exact/AInt.hpp"

namespace exact{
	namespace detail{
		//! Sign and digits of an integer literal
		struct IntLiteral{
			bool negative = false;
			std::string digits;
		};

		/**
		 * \brief Scanned decimal literal
		 *
		 * Represents value * 10^-scale
		 **/
		struct DecimalLiteral{
			AInt value;
			std::int64_t scale = 0;
		};

		//! Strip surrounding ASCII white space
		std::string_view trim(std::string_view s) noexcept;

		//! Scan `[+-]? digits`, throws ParseError on anything else
		IntLiteral scanIntLiteral(std::string_view s);

		//! Scan `[+-]? digits? ('.' digits?)? ([eE] [+-]? digits)?`, throws ParseError
		DecimalLiteral scanDecimalLiteral(std::string_view s);
	}
}

#endif // !EXACT_SRC_SCAN_HPP
