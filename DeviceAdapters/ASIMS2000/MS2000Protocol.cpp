/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#include "MS2000Protocol.h"
#include "ASIMS2000.h"

#include "DeviceUtils.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace {

const char* const g_KnownVerbs[] = {
	"M", "R", "W", "S", "AC", "WT", "PC", "!", "H", "HALT",
	"/", "RS", "V", "BU", "CD", "TTL", "LED"
};

std::string ToUpper(const std::string& s)
{
	std::string result(s);
	for (size_t i = 0; i < result.size(); i++)
	{
		result[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[i])));
	}
	return result;
}

bool IsAllDigits(const std::string& s)
{
	if (s.empty())
	{
		return false;
	}
	for (size_t i = 0; i < s.size(); i++)
	{
		if (!std::isdigit(static_cast<unsigned char>(s[i])))
		{
			return false;
		}
	}
	return true;
}

} // namespace

MS2000Command::MS2000Command(const std::string& verb) :
	verb_(verb)
{
}

MS2000Command& MS2000Command::Axis(char axis)
{
	Field f = { axis, "" };
	fields_.push_back(f);
	return *this;
}

MS2000Command& MS2000Command::Query(char axis)
{
	Field f = { axis, "?" };
	fields_.push_back(f);
	return *this;
}

MS2000Command& MS2000Command::Set(char axis, long value)
{
	std::ostringstream os;
	os << "=" << value;
	Field f = { axis, os.str() };
	fields_.push_back(f);
	return *this;
}

MS2000Command& MS2000Command::Set(char axis, double value, int decimals)
{
	char buf[64];
	snprintf(buf, sizeof(buf), "=%.*f", decimals, value);
	Field f = { axis, buf };
	fields_.push_back(f);
	return *this;
}

MS2000Command& MS2000Command::Set(char axis, const std::string& value)
{
	Field f = { axis, "=" + value };
	fields_.push_back(f);
	return *this;
}

std::string MS2000Command::Format() const
{
	std::string line = verb_;
	for (size_t i = 0; i < fields_.size(); i++)
	{
		line += ' ';
		line += fields_[i].axis;
		line += fields_[i].text;
	}
	return line;
}

bool MS2000Command::IsKnownVerb(const std::string& verb)
{
	const std::string upper = ToUpper(verb);
	for (size_t i = 0; i < sizeof(g_KnownVerbs) / sizeof(g_KnownVerbs[0]); i++)
	{
		if (upper == g_KnownVerbs[i])
		{
			return true;
		}
	}
	return false;
}

MS2000Reply::MS2000Reply() :
	type_(Ack),
	acknowledged_(false),
	errorNumber_(0),
	ignored_(0)
{
}

bool MS2000Reply::ParseNumber(const std::string& text, double& number)
{
	if (text.empty())
	{
		return false;
	}
	const char* begin = text.c_str();
	char* end = 0;
	number = strtod(begin, &end);
	return end != begin && *end == '\0';
}

bool MS2000Reply::ParseItem(const std::string& token, Value& value)
{
	value = Value();
	const size_t eq = token.find('=');
	if (eq == std::string::npos)
	{
		if (!ParseNumber(token, value.number))
		{
			return false;
		}
		value.numeric = true;
		value.text = token;
		return true;
	}

	const std::string key = token.substr(0, eq);
	const std::string text = token.substr(eq + 1);
	if (key.empty() || text.empty())
	{
		return false;
	}
	for (size_t i = 0; i < key.size(); i++)
	{
		if (!std::isalpha(static_cast<unsigned char>(key[i])))
		{
			return false;
		}
	}
	value.key = ToUpper(key);
	value.text = text;
	value.numeric = ParseNumber(text, value.number);
	return true;
}

int MS2000Reply::Parse(const std::string& line, MS2000Reply& reply)
{
	reply = MS2000Reply();
	reply.raw_ = line;

	std::vector<std::string> tokens;
	CDeviceUtils::Tokenize(line, tokens, " \t\r\n");
	if (tokens.empty())
	{
		return ERR_UNRECOGNIZED_ANSWER;
	}

	const std::string first = ToUpper(tokens[0]);
	size_t next = 1;

	if (first.compare(0, 2, ":N") == 0)
	{
		// ":N-3", tolerating ":N -3"
		std::string code = tokens[0].substr(2);
		if (code.empty() && tokens.size() > 1)
		{
			code = tokens[1];
			next = 2;
		}
		if (code.size() < 2 || code.size() > 4 || code[0] != '-' || !IsAllDigits(code.substr(1)))
		{
			return ERR_UNRECOGNIZED_ANSWER;
		}
		reply.type_ = Error;
		reply.errorNumber_ = atoi(code.c_str() + 1);
		reply.ignored_ = tokens.size() - next;
		return MS2K_OK;
	}

	if (tokens.size() == 1 && (first == "N" || first == "B"))
	{
		Value status;
		status.text = first;
		reply.type_ = Values;
		reply.values_.push_back(status);
		return MS2K_OK;
	}

	if (first.compare(0, 2, ":A") == 0)
	{
		reply.acknowledged_ = true;
		if (first.size() > 2)
		{
			// item glued to the marker, e.g. ":A1234"
			Value value;
			if (ParseItem(tokens[0].substr(2), value))
			{
				reply.values_.push_back(value);
			}
			else
			{
				reply.ignored_++;
			}
		}
	}
	else
	{
		// leading KEY=value, optionally prefixed by ':'
		std::string item = tokens[0];
		if (item[0] == ':')
		{
			item = item.substr(1);
		}
		Value value;
		if (item.find('=') == std::string::npos || !ParseItem(item, value))
		{
			return ERR_UNRECOGNIZED_ANSWER;
		}
		reply.values_.push_back(value);
	}

	for (size_t i = next; i < tokens.size(); i++)
	{
		if (ToUpper(tokens[i]) == ":A")
		{
			reply.acknowledged_ = true;
			continue;
		}
		Value value;
		if (ParseItem(tokens[i], value))
		{
			reply.values_.push_back(value);
		}
		else
		{
			reply.ignored_++;
		}
	}

	reply.type_ = reply.values_.empty() ? Ack : Values;
	return MS2K_OK;
}

bool MS2000Reply::FindValue(char axis, double& value) const
{
	const std::string key(1, static_cast<char>(std::toupper(static_cast<unsigned char>(axis))));
	for (size_t i = 0; i < values_.size(); i++)
	{
		if (values_[i].key == key && values_[i].numeric)
		{
			value = values_[i].number;
			return true;
		}
	}
	return false;
}

bool MS2000Reply::FindText(char axis, std::string& text) const
{
	const std::string key(1, static_cast<char>(std::toupper(static_cast<unsigned char>(axis))));
	for (size_t i = 0; i < values_.size(); i++)
	{
		if (values_[i].key == key)
		{
			text = values_[i].text;
			return true;
		}
	}
	return false;
}

int MS2000Reply::ToStatus() const
{
	if (type_ == Error)
	{
		return ERR_OFFSET + errorNumber_;
	}
	return MS2K_OK;
}
