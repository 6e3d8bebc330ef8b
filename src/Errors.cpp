#include "exact/Errors.hpp"

using namespace exact;

ParseError::ParseError(std::string input_, std::string msg, std::string cause_)
	: m_input(std::move(input_)), m_cause(std::move(cause_)), m_msg(std::move(msg))
{
	if(!m_cause.empty())
		m_msg += " (" + m_cause + ")";
}
