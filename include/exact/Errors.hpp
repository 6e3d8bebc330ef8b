#ifndef EXACT_ERRORS_HPP
#define EXACT_ERRORS_HPP 1

#include <exception>
#include <string>

//! \file

namespace exact{
	//! Error thrown whenever a zero denominator or divisor would result
	class DivisionByZero: public std::exception{
		public:
			DivisionByZero(std::string msg = "Cannot divide by zero"): m_msg(std::move(msg)){}

			const char *what() const noexcept override{ return m_msg.c_str(); }

		private:
			std::string m_msg;
	};

	/**
	 * \brief Error thrown when text can not be read as a number
	 *
	 * Carries the offending input and, when an inner read failed,
	 * the message of that failure.
	 **/
	class ParseError: public std::exception{
		public:
			ParseError(std::string input_, std::string msg, std::string cause_ = "");

			const std::string &input() const noexcept{ return m_input; }
			const std::string &cause() const noexcept{ return m_cause; }

			const char *what() const noexcept override{ return m_msg.c_str(); }

		private:
			std::string m_input;
			std::string m_cause;
			std::string m_msg;
	};
}

#endif // !EXACT_ERRORS_HPP
