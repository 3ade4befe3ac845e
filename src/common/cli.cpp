#include "netconn/cli.hpp"
#include <algorithm>
#include <charconv>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace netconn {

long long parse_int64(const std::string& s, long long minVal, long long maxVal) {
    long long value = 0;
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    if (begin != end && *begin == '+') ++begin;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec == std::errc::result_out_of_range) {
        throw std::out_of_range("integer out of range: " + s);
    }
    if (ec != std::errc{} || ptr != end || begin == end) {
        throw std::invalid_argument("invalid integer: '" + s + "'");
    }
    if (value < minVal || value > maxVal) {
        throw std::out_of_range("value " + s + " outside [" + std::to_string(minVal) + ", " +
                                std::to_string(maxVal) + "]");
    }
    return value;
}

// ---------------- ArgParser ----------------

ArgParser::ArgParser(std::string description) : desc_(std::move(description)) {}

void ArgParser::register_option(const InternalOpt& io) {
    if (indexByLong_.count(io.spec.longName)) {
        throw std::logic_error("option --" + io.spec.longName + " registered twice");
    }
    const std::size_t idx = opts_.size();
    opts_.push_back(io);
    indexByLong_[io.spec.longName] = idx;
    if (io.spec.shortName) indexByShort_[io.spec.shortName] = idx;
}

void ArgParser::add_option(const OptionSpec& opt) {
    register_option(InternalOpt{opt, false});
    if (!opt.defaultValue.empty()) values_[opt.longName] = opt.defaultValue;
}

void ArgParser::add_flag(const std::string& longName, char shortName, const std::string& help) {
    OptionSpec spec;
    spec.longName = longName;
    spec.shortName = shortName;
    spec.type = ArgType::Flag;
    spec.help = help;
    register_option(InternalOpt{spec, true});
}

const ArgParser::InternalOpt* ArgParser::find_long(const std::string& name) const {
    auto it = indexByLong_.find(name);
    if (it == indexByLong_.end()) return nullptr;
    return &opts_[it->second];
}

const ArgParser::InternalOpt* ArgParser::find_short(char c) const {
    auto it = indexByShort_.find(c);
    if (it == indexByShort_.end()) return nullptr;
    return &opts_[it->second];
}

void ArgParser::store_value(const InternalOpt& io, const std::string& val) {
    if (io.spec.type == ArgType::Choice) {
        const auto& ch = io.spec.choices;
        if (std::find(ch.begin(), ch.end(), val) == ch.end()) {
            std::string allowed;
            for (const auto& c : ch) allowed += (allowed.empty() ? "" : "|") + c;
            throw std::runtime_error("invalid value '" + val + "' for --" + io.spec.longName +
                                     " (expected " + allowed + ")");
        }
    }
    values_[io.spec.longName] = val;
    present_[io.spec.longName] = true;
}

bool ArgParser::parse(int argc, char** argv) {
    helpRequested_ = false;
    if (!find_long("help")) {
        add_flag("help", 'h', "Show this help message and exit");
    }

    for (int i = 1; i < argc; ++i) {
        const std::string tok = argv[i];
        const InternalOpt* io = nullptr;
        std::string shown;
        if (tok.rfind("--", 0) == 0) {
            const std::string name = tok.substr(2);
            if (name.empty()) throw std::runtime_error("invalid option '--'");
            io = find_long(name);
            shown = tok;
        } else if (tok.size() == 2 && tok[0] == '-') {
            io = find_short(tok[1]);
            shown = tok;
        } else if (tok.size() > 2 && tok[0] == '-') {
            // no bundling of short options, no single-dash long options
            throw std::runtime_error("invalid option '" + tok + "'; use --<long> for long options");
        } else {
            throw std::runtime_error("unexpected positional argument: " + tok);
        }
        if (!io) throw std::runtime_error("unknown option '" + shown + "'");

        if (io->isFlag) {
            present_[io->spec.longName] = true;
            if (io->spec.longName == "help") helpRequested_ = true;
            continue;
        }
        if (i + 1 >= argc) throw std::runtime_error("missing value for " + shown);
        store_value(*io, argv[++i]);
    }

    if (helpRequested_) return false;
    for (const auto& io : opts_) {
        if (io.spec.required && !provided(io.spec.longName) && io.spec.defaultValue.empty()) {
            throw std::runtime_error("missing required option --" + io.spec.longName);
        }
    }
    return true;
}

bool ArgParser::provided(const std::string& longName) const {
    auto it = present_.find(longName);
    return it != present_.end() && it->second;
}

std::string ArgParser::get_string(const std::string& longName) const {
    auto it = values_.find(longName);
    if (it != values_.end()) return it->second;
    throw std::runtime_error("option --" + longName + " not provided");
}

std::size_t ArgParser::get_size(const std::string& longName) const {
    const std::string s = get_string(longName);
    try {
        return static_cast<std::size_t>(
            parse_int64(s, 0, std::numeric_limits<long long>::max()));
    } catch (const std::exception& e) {
        throw std::runtime_error("--" + longName + ": " + e.what());
    }
}

bool ArgParser::get_flag(const std::string& longName) const {
    return provided(longName);
}

std::string ArgParser::usage(const std::string& progName) const {
    std::ostringstream oss;
    oss << "Usage: " << progName;
    for (const auto& io : opts_) {
        if (io.spec.longName == "help") continue;
        oss << ' ' << (io.spec.required ? "" : "[");
        if (io.spec.shortName) oss << "-" << io.spec.shortName << "|";
        oss << "--" << io.spec.longName;
        if (!io.isFlag) oss << " " << (io.spec.valueName.empty() ? "VAL" : io.spec.valueName);
        oss << (io.spec.required ? "" : "]");
    }
    return oss.str();
}

std::string ArgParser::help(const std::string& progName) const {
    std::ostringstream oss;
    if (!desc_.empty()) oss << desc_ << "\n";
    oss << usage(progName) << "\n\nOptions:\n";
    for (const auto& io : opts_) {
        if (io.spec.longName == "help") continue;
        oss << "  ";
        if (io.spec.shortName) oss << "-" << io.spec.shortName << ", "; else oss << "    ";
        oss << "--" << io.spec.longName;
        if (!io.isFlag) oss << " " << (io.spec.valueName.empty() ? "VAL" : io.spec.valueName);
        if (!io.spec.help.empty()) oss << "\n      " << io.spec.help;
        if (!io.spec.choices.empty()) {
            oss << " {";
            for (std::size_t c = 0; c < io.spec.choices.size(); ++c) {
                oss << (c ? "," : "") << io.spec.choices[c];
            }
            oss << "}";
        }
        if (!io.spec.defaultValue.empty()) oss << " (default: " << io.spec.defaultValue << ")";
        if (io.spec.required) oss << " [required]";
        oss << "\n";
    }
    oss << "  -h, --help\n      Show this help message and exit\n";
    return oss.str();
}

} // namespace netconn
