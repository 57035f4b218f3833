#pragma once
#include "borestitch/deblur/Deblurrer.hpp"
#include "borestitch/features/FeatureDetector.hpp"

#include <algorithm>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

/* Malformed, unknown or out-of-range option. Modes print it next to their usage. */
class ArgError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*
  Options of one CLI mode, parsed once from argv.

  Conventions:
    - --key=value   valued option
    - --key         flag
    - argv[1] is the mode; parsing starts at argv[2].
      Example:   borestitch-cli stitch --folder=frames --save=out --detector=orb
    - Anything else on the command line is an ArgError.

  Typed getters throw ArgError when a value does not parse or is out of
  range; a missing option gives the default.
*/
class CliArgs {
public:
    CliArgs(int argc, char** argv)
    {
        for (int i = 2; i < argc; ++i) {
            const std::string a(argv[i]);
            if (a.size() < 3 || a.compare(0, 2, "--") != 0)
                throw ArgError("unexpected argument '" + a + "'");
            const auto eq = a.find('=');
            if (eq == std::string::npos) flags_.insert(a.substr(2));
            else values_[a.substr(2, eq - 2)] = a.substr(eq + 1);
        }
    }

    /// Reject options the mode does not know. --verbose and --quiet are always accepted.
    void allowOnly(std::initializer_list<const char*> keys) const
    {
        std::set<std::string> known(keys.begin(), keys.end());
        known.insert("verbose");
        known.insert("quiet");
        for (const auto& [k, v] : values_)
            if (!known.count(k)) throw ArgError("unknown option --" + k);
        for (const auto& f : flags_)
            if (!known.count(f)) throw ArgError("unknown option --" + f);
    }

    bool flag(const std::string& key) const
    {
        if (values_.count(key)) throw ArgError("--" + key + " takes no value");
        return flags_.count(key) > 0;
    }

    bool has(const std::string& key) const { return values_.count(key) > 0 || flags_.count(key) > 0; }

    std::string str(const std::string& key, const std::string& def = {}) const
    {
        if (flags_.count(key)) throw ArgError("--" + key + " needs a value");
        const auto it = values_.find(key);
        return it == values_.end() ? def : it->second;
    }

    int integer(const std::string& key, int def, int lo, int hi) const
    {
        const std::string v = str(key);
        if (v.empty()) return def;
        std::size_t used = 0;
        int n = 0;
        try {
            n = std::stoi(v, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used != v.size()) throw ArgError("--" + key + ": expected an integer, got '" + v + "'");
        if (n < lo || n > hi)
            throw ArgError("--" + key + ": " + v + " is outside [" + std::to_string(lo) + ", " +
                           std::to_string(hi) + "]");
        return n;
    }

    double real(const std::string& key, double def, double lo, double hi) const
    {
        const std::string v = str(key);
        if (v.empty()) return def;
        std::size_t used = 0;
        double x = 0.0;
        try {
            x = std::stod(v, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used != v.size()) throw ArgError("--" + key + ": expected a number, got '" + v + "'");
        if (!(x >= lo && x <= hi))
            throw ArgError("--" + key + ": " + v + " is outside [" + std::to_string(lo) + ", " +
                           std::to_string(hi) + "]");
        return x;
    }

    /// Value restricted to a fixed set of names.
    std::string choice(const std::string& key, const std::string& def,
                       std::initializer_list<const char*> allowed) const
    {
        const std::string v = str(key, def);
        if (std::find(allowed.begin(), allowed.end(), v) != allowed.end()) return v;
        std::string list;
        for (const char* a : allowed) list += (list.empty() ? "" : "|") + std::string(a);
        throw ArgError("--" + key + ": '" + v + "' is not one of " + list);
    }

    /// --detector=auto|sift|orb|akaze (case-insensitive); nullopt when absent.
    std::optional<borestitch::DetectorType> detector() const
    {
        const std::string v = str("detector");
        if (v.empty()) return std::nullopt;
        const auto t = borestitch::detectorFromName(v);
        if (!t) throw ArgError("--detector: '" + v + "' is not one of auto|sift|orb|akaze");
        return t;
    }

    /// --defocus=wiener|lr|lucy_richardson; nullopt when absent.
    std::optional<borestitch::DefocusMethod> defocusMethod() const
    {
        const std::string v = choice("defocus", "", {"", "wiener", "lr", "lucy_richardson"});
        if (v.empty()) return std::nullopt;
        return v == "wiener" ? borestitch::DefocusMethod::Wiener
                             : borestitch::DefocusMethod::LucyRichardson;
    }

private:
    std::map<std::string, std::string> values_;
    std::set<std::string> flags_;
};
