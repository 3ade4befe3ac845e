#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace netconn {

// Parse a base-10 integer that must span the whole string and lie in [minVal, maxVal].
// Throws std::invalid_argument (not an integer) or std::out_of_range (outside bounds).
long long parse_int64(const std::string& s, long long minVal, long long maxVal);

// Command-line parser shared by the netconn executables.
// Long options (--name VALUE), one-letter short options (-n VALUE), flags,
// defaults, required options, and options restricted to a fixed set of words.
enum class ArgType { Flag, String, Size, Choice };

struct OptionSpec {
	std::string longName;              // e.g. "parents"
	char shortName = '\0';             // e.g. 'p' (optional)
	ArgType type = ArgType::String;
	std::string valueName;             // e.g. "FILE" or "N"; empty for flags
	std::string help;                  // description for --help
	bool required = false;             // must be provided by user
	std::string defaultValue;          // default string (empty means no default)
	std::vector<std::string> choices;  // accepted words for ArgType::Choice
};

class ArgParser {
public:
	explicit ArgParser(std::string description = "");

	void add_option(const OptionSpec& opt);
	void add_flag(const std::string& longName, char shortName, const std::string& help);

	// Returns false if --help/-h was requested. Throws std::runtime_error on
	// unknown options, missing values, missing required options and values
	// outside an option's choices.
	bool parse(int argc, char** argv);

	// Whether the user supplied the option on the command line.
	bool provided(const std::string& longName) const;

	// Value or default; throws std::runtime_error when neither exists.
	std::string get_string(const std::string& longName) const;
	std::size_t get_size(const std::string& longName) const;
	bool get_flag(const std::string& longName) const;

	std::string usage(const std::string& progName) const;
	std::string help(const std::string& progName) const;

private:
	struct InternalOpt {
		OptionSpec spec;
		bool isFlag = false;
	};

	std::string desc_;
	std::vector<InternalOpt> opts_;
	std::unordered_map<std::string, std::size_t> indexByLong_;
	std::unordered_map<char, std::size_t> indexByShort_;
	std::unordered_map<std::string, std::string> values_; // longName -> value string
	std::unordered_map<std::string, bool> present_;       // longName -> provided by user
	bool helpRequested_ = false;

	void register_option(const InternalOpt& io);
	void store_value(const InternalOpt& io, const std::string& val);
	const InternalOpt* find_long(const std::string& name) const;
	const InternalOpt* find_short(char c) const;
};

} // namespace netconn
