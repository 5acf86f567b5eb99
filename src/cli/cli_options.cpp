// SPDX-License-Identifier: MIT
#include "strikeopt/cli/cli_options.hpp"
#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace strikeopt::cli {

namespace {

enum class FlagKind { Double, Count, Bool, String };

struct FlagSpec {
    const char* name;
    const char* help;
    FlagKind kind;
    std::optional<double> lower_bound;  // inclusive, numeric flags only
    bool strict_bound;                  // true: value must exceed lower_bound
    std::function<void(CliOptions&, const std::string&)> assign;
    std::function<std::string(const CliOptions&)> current;
};

std::expected<double, std::string> parse_double(const std::string& name, const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::invalid_argument&) {
        return std::unexpected("--" + name + ": '" + text + "' is not a number");
    } catch (const std::out_of_range&) {
        return std::unexpected("--" + name + ": '" + text + "' is out of range");
    }
    if (consumed != text.size()) {
        return std::unexpected("--" + name + ": '" + text + "' is not a number");
    }
    if (!std::isfinite(value)) {
        return std::unexpected("--" + name + ": value must be finite");
    }
    return value;
}

std::expected<bool, std::string> parse_bool(const std::string& name, const std::string& text) {
    if (text == "true" || text == "1" || text == "yes") {
        return true;
    }
    if (text == "false" || text == "0" || text == "no") {
        return false;
    }
    return std::unexpected("--" + name + ": '" + text + "' is not a boolean");
}

std::string to_text(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

const std::vector<FlagSpec>& flag_table() {
    static const std::vector<FlagSpec> flags = {
        {"current_price", "The current price of the underlying.",
         FlagKind::Double, 0.0, false,
         [](CliOptions& o, const std::string& v) { o.optimizer.market.spot = std::stod(v); },
         [](const CliOptions& o) { return to_text(o.optimizer.market.spot); }},
        {"risk_free_interest_rate", "The current risk free interest rate.",
         FlagKind::Double, 0.0, false,
         [](CliOptions& o, const std::string& v) { o.optimizer.market.rate = std::stod(v); },
         [](const CliOptions& o) { return to_text(o.optimizer.market.rate); }},
        {"days_to_expiration", "The number of days until targeted expiration date.",
         FlagKind::Double, 1.0, false,
         [](CliOptions& o, const std::string& v) { o.optimizer.market.days = std::stod(v); },
         [](const CliOptions& o) { return to_text(o.optimizer.market.days); }},
        {"volatility", "Annualized volatility of the underlying over the next 12 months, "
                       "e.g. the average implied volatility of options on the market.",
         FlagKind::Double, std::nullopt, false,
         [](CliOptions& o, const std::string& v) { o.optimizer.market.volatility = std::stod(v); },
         [](const CliOptions& o) { return to_text(o.optimizer.market.volatility); }},
        {"expected_price_movement", "The fractional price movement expected before expiration "
                                    "(0.3 = +30%).",
         FlagKind::Double, std::nullopt, false,
         [](CliOptions& o, const std::string& v) { o.optimizer.expected_movement = std::stod(v); },
         [](const CliOptions& o) { return to_text(o.optimizer.expected_movement); }},
        {"sample_count", "Number of evenly spaced candidate strikes.",
         FlagKind::Count, 2.0, false,
         [](CliOptions& o, const std::string& v) { o.optimizer.sample_count = std::stoul(v); },
         [](const CliOptions& o) { return std::to_string(o.optimizer.sample_count); }},
        {"min_strike_fraction", "Lowest candidate strike as a fraction of the current price.",
         FlagKind::Double, 0.0, true,
         [](CliOptions& o, const std::string& v) { o.optimizer.min_strike_fraction = std::stod(v); },
         [](const CliOptions& o) { return to_text(o.optimizer.min_strike_fraction); }},
        {"max_strike_fraction", "Highest candidate strike as a fraction of the current price.",
         FlagKind::Double, 0.0, true,
         [](CliOptions& o, const std::string& v) { o.optimizer.max_strike_fraction = std::stod(v); },
         [](const CliOptions& o) { return to_text(o.optimizer.max_strike_fraction); }},
        {"parallel", "Price candidate strikes concurrently.",
         FlagKind::Bool, std::nullopt, false,
         [](CliOptions& o, const std::string& v) { o.optimizer.parallel = (v == "true"); },
         [](const CliOptions& o) { return std::string(o.optimizer.parallel ? "true" : "false"); }},
        {"plot", "Whether or not to write the expected returns for various strike prices.",
         FlagKind::Bool, std::nullopt, false,
         [](CliOptions& o, const std::string& v) { o.plot = (v == "true"); },
         [](const CliOptions& o) { return std::string(o.plot ? "true" : "false"); }},
        {"plot_file", "Where --plot writes the (strike, profit %) data.",
         FlagKind::String, std::nullopt, false,
         [](CliOptions& o, const std::string& v) { o.plot_file = v; },
         [](const CliOptions& o) { return o.plot_file; }},
    };
    return flags;
}

const FlagSpec* find_flag(const std::string& name) {
    for (const FlagSpec& flag : flag_table()) {
        if (name == flag.name) {
            return &flag;
        }
    }
    return nullptr;
}

/// Check a numeric value and hand the normalized text to the setter
std::expected<std::string, std::string> normalize_value(const FlagSpec& flag,
                                                        const std::string& text) {
    switch (flag.kind) {
        case FlagKind::String:
            return text;

        case FlagKind::Bool: {
            auto value = parse_bool(flag.name, text);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            return std::string(*value ? "true" : "false");
        }

        case FlagKind::Double:
        case FlagKind::Count: {
            auto value = parse_double(flag.name, text);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            // 2^digits is the first value unsigned long cannot hold; max() itself
            // rounds up to it as a double
            const double count_limit =
                std::ldexp(1.0, std::numeric_limits<unsigned long>::digits);
            if (flag.kind == FlagKind::Count &&
                (*value != std::floor(*value) || *value >= count_limit)) {
                return std::unexpected("--" + std::string(flag.name) +
                                       ": '" + text + "' is not a whole number");
            }
            if (flag.lower_bound.has_value()) {
                const double bound = *flag.lower_bound;
                const bool ok = flag.strict_bound ? (*value > bound) : (*value >= bound);
                if (!ok) {
                    std::ostringstream oss;
                    oss << "--" << flag.name << " must be " << (flag.strict_bound ? "> " : ">= ")
                        << bound << " (got " << text << ")";
                    return std::unexpected(oss.str());
                }
            }
            if (flag.kind == FlagKind::Count) {
                // "1e3" and "1000.0" both become "1000"
                return std::to_string(static_cast<unsigned long>(*value));
            }
            return text;
        }
    }
    return std::unexpected(std::string("unhandled flag kind"));
}

}  // namespace

std::expected<CliOptions, std::string> parse_cli_options(const std::vector<std::string>& args) {
    CliOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            return std::unexpected("unexpected argument '" + arg + "'");
        }

        std::string name = arg.substr(2);
        std::optional<std::string> value;
        if (size_t eq = name.find('='); eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        const FlagSpec* flag = find_flag(name);
        if (flag == nullptr && !value.has_value() && name.rfind("no", 0) == 0) {
            // --noplot style negation
            const FlagSpec* negated = find_flag(name.substr(2));
            if (negated != nullptr && negated->kind == FlagKind::Bool) {
                negated->assign(options, "false");
                continue;
            }
        }
        if (flag == nullptr) {
            return std::unexpected("unknown flag '--" + name + "'");
        }

        if (!value.has_value()) {
            if (flag->kind == FlagKind::Bool) {
                value = "true";
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                return std::unexpected("--" + name + " requires a value");
            }
        }

        auto normalized = normalize_value(*flag, *value);
        if (!normalized.has_value()) {
            return std::unexpected(normalized.error());
        }
        flag->assign(options, *normalized);
    }

    return options;
}

std::expected<CliOptions, std::string> parse_cli_options(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_cli_options(args);
}

std::string usage(const std::string& program) {
    const CliOptions defaults;
    std::ostringstream oss;
    oss << "Usage: " << program << " [--flag=value ...]\n\n"
        << "Finds the exercise price that maximizes the expected return on premium\n"
        << "for an assumed price movement before expiration.\n\n"
        << "Flags:\n";
    for (const FlagSpec& flag : flag_table()) {
        oss << "  --" << flag.name << " (default: " << flag.current(defaults) << ")\n"
            << "      " << flag.help << "\n";
    }
    oss << "  --help\n"
        << "      Show this message.\n";
    return oss.str();
}

}  // namespace strikeopt::cli
