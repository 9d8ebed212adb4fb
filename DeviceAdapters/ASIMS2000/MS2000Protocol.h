/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#ifndef MS2000PROTOCOL_H
#define MS2000PROTOCOL_H

#include <string>
#include <vector>

// A command line for the MS-2000: a verb followed by axis fields.
// Fields are rendered "X=value", "X?" or a bare "X", separated by single
// spaces. The terminator is appended by the serial layer.
class MS2000Command {
public:
	explicit MS2000Command(const std::string& verb);

	MS2000Command& Axis(char axis);
	MS2000Command& Query(char axis);
	MS2000Command& Set(char axis, long value);
	MS2000Command& Set(char axis, double value, int decimals = 6);
	MS2000Command& Set(char axis, const std::string& value);

	std::string Format() const;
	bool HasKnownVerb() const { return IsKnownVerb(verb_); }

	// M, R, W, S, AC, WT, PC, !, H, HALT, /, RS, V, BU, CD, TTL, LED
	static bool IsKnownVerb(const std::string& verb);

private:
	struct Field {
		char axis;
		std::string text; // "", "?" or "=value"
	};

	std::string verb_;
	std::vector<Field> fields_;
};

// One reply line from the MS-2000, without its "\r\n" terminator.
//
// Grammar (markers are case-insensitive, tokens separated by whitespace):
//   ":A" [item ...]            Ack if there are no items, Values otherwise
//   ":N-" code                 Error(code)
//   "N" | "B"                  Values([status]), the answer to "/"
//   [":"]KEY=value [item ...]  Values, e.g. ":X=10" or "X=45 :A"
// where an item is a number or KEY=value. Unknown trailing tokens are
// skipped and counted. Anything else is rejected.
class MS2000Reply {
public:
	enum Type {
		Ack,
		Error,
		Values
	};

	struct Value {
		std::string key;  // axis letter or empty
		std::string text;
		bool numeric;
		double number;

		Value() : numeric(false), number(0.0) { }
	};

	MS2000Reply();

	// Returns MS2K_OK or ERR_UNRECOGNIZED_ANSWER; on failure reply is left as Ack
	// with the raw text set.
	static int Parse(const std::string& line, MS2000Reply& reply);

	Type GetType() const { return type_; }
	bool IsAcknowledged() const { return acknowledged_; }
	int GetErrorNumber() const { return errorNumber_; }
	const std::vector<Value>& GetValues() const { return values_; }
	size_t GetIgnoredCount() const { return ignored_; }
	const std::string& GetRaw() const { return raw_; }

	// Value keyed by axis (case-insensitive); false if absent or not numeric
	bool FindValue(char axis, double& value) const;
	bool FindText(char axis, std::string& text) const;

	// Status code the reply stands for: MS2K_OK, or ERR_OFFSET + n for ":N-n"
	int ToStatus() const;

private:
	static bool ParseItem(const std::string& token, Value& value);
	static bool ParseNumber(const std::string& text, double& number);

	Type type_;
	bool acknowledged_;
	int errorNumber_;
	std::vector<Value> values_;
	size_t ignored_;
	std::string raw_;
};

#endif // MS2000PROTOCOL_H
