/**
 * @file policy_config.hpp
 * @brief Loading retry policy parameters from JSON documents.
 *
 * Recognised keys:
 *
 * | Key              | Type                          | CallArgs field |
 * |------------------|-------------------------------|----------------|
 * | attempts         | positive integer, "unlimited" | attempts       |
 * | delay_ms         | integer milliseconds          | delay          |
 * | backoff_factor   | number                        | backoffFactor  |
 * | max_delay_ms     | integer milliseconds          | maxDelay       |
 * | log_level        | "trace" ... "error"           | global Logger level |
 *
 * Only the keys present are applied. The operation, hooks, stop token and
 * clock always come from code. Semantic checks remain validate()'s job.
 *
 * @date 2025
 */
#pragma once
#include "retrykit/core/retry/call_args.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace retrykit {

    /**
     * @brief Overlay the keys of a JSON object on call arguments.
     * @param args Arguments to start from
     * @param doc JSON object
     * @return @p args with the present keys applied
     * @throws InvalidConfiguration naming the key when a value has the wrong type
     */
    CallArgs applyConfig(CallArgs args, const nlohmann::json& doc);

    /**
     * @brief Parse JSON text and apply it to @p base.
     * @throws InvalidConfiguration with the parser error nested when the text is malformed
     */
    CallArgs parseConfig(std::string_view text, CallArgs base = {});

    /**
     * @brief Read a JSON file and apply it to @p base.
     * @throws InvalidConfiguration when the file cannot be read or parsed
     */
    CallArgs loadConfig(const std::string& path, CallArgs base = {});

}
