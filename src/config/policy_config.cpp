#include "retrykit/config/policy_config.hpp"
#include "retrykit/core/util/error_types.hpp"
#include "retrykit/core/util/logger.hpp"
#include "retrykit/core/util/time.hpp"
#include <fstream>
#include <limits>

namespace retrykit {

    namespace {

        std::int64_t integerField(const nlohmann::json& v, const char* key) {
            if (!v.is_number_integer())
                throw InvalidConfiguration(key, std::string(key) + " must be an integer");
            return v.get<std::int64_t>();
        }

        std::chrono::nanoseconds millisField(const nlohmann::json& v, const char* key) {
            auto ms = integerField(v, key);
            // nanoseconds overflow past roughly 292 years
            constexpr std::int64_t limit = std::numeric_limits<std::int64_t>::max() / 1'000'000;
            if (ms > limit || ms < -limit)
                throw InvalidConfiguration(key, std::string(key) + " is out of range");
            return std::chrono::milliseconds(ms);
        }

        AttemptBudget attemptsField(const nlohmann::json& v) {
            if (v.is_string() && v.get<std::string>() == "unlimited")
                return UnlimitedAttempts;
            if (v.is_number_integer())
                return AttemptBudget::bounded(v.get<std::int64_t>());
            throw InvalidConfiguration("attempts",
                "attempts must be a positive integer or \"unlimited\"");
        }

    }

    CallArgs applyConfig(CallArgs args, const nlohmann::json& doc) {
        if (!doc.is_object())
            throw InvalidConfiguration("config", "policy config must be a JSON object");

        for (auto it = doc.begin(); it != doc.end(); ++it) {
            const std::string& key = it.key();
            const nlohmann::json& value = it.value();

            if (key == "attempts") {
                args.attempts = attemptsField(value);
                LOG_DEBUG("[config] attempts = " + (args.attempts->isBounded()
                    ? std::to_string(args.attempts->limit()) : std::string("unlimited")));
            }
            else if (key == "delay_ms") {
                args.delay = millisField(value, "delay_ms");
                LOG_DEBUG("[config] delay = " + formatDuration(*args.delay));
            }
            else if (key == "backoff_factor") {
                if (!value.is_number())
                    throw InvalidConfiguration("backoff_factor", "backoff_factor must be a number");
                args.backoffFactor = value.get<double>();
                LOG_DEBUG("[config] backoff factor = " + value.dump());
            }
            else if (key == "max_delay_ms") {
                args.maxDelay = millisField(value, "max_delay_ms");
                LOG_DEBUG("[config] max delay = " + formatDuration(args.maxDelay));
            }
            else if (key == "log_level") {
                auto lvl = value.is_string() ? parseLogLevel(value.get<std::string>()) : std::nullopt;
                if (!lvl)
                    throw InvalidConfiguration("log_level", "unknown log_level " + value.dump());
                Logger::inst().setLevel(*lvl);
            }
            else {
                LOG_WARN("[config] ignoring unknown key \"" + key + "\"");
            }
        }
        return args;
    }

    CallArgs parseConfig(std::string_view text, CallArgs base) {
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(text.begin(), text.end());
        }
        catch (const nlohmann::json::parse_error&) {
            std::throw_with_nested(InvalidConfiguration("config", "malformed policy config"));
        }
        return applyConfig(std::move(base), doc);
    }

    CallArgs loadConfig(const std::string& path, CallArgs base) {
        std::ifstream in(path);
        if (!in)
            throw InvalidConfiguration("config", "cannot open policy config " + path);

        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(in);
        }
        catch (const nlohmann::json::parse_error&) {
            std::throw_with_nested(InvalidConfiguration("config", "malformed policy config " + path));
        }
        LOG_DEBUG("[config] loaded " + path);
        return applyConfig(std::move(base), doc);
    }

}
