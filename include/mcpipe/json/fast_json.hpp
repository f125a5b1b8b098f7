#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON decoding for inbound frames
// ─────────────────────────────────────────────────────────────────────────────
//
// Every frame the peer writes is decoded here, on the response listener
// thread. simdjson does the parsing; the result is converted to nlohmann::json
// so the rest of the code works with one JSON type. Outgoing messages are built
// and serialized with nlohmann directly.
//
//   auto doc = mcpipe::fast_parse(line);
//   if (doc.has_value()) {
//       const nlohmann::json& message = *doc;
//   }
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace mcpipe {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using JsonParseResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    /// Nesting limit; deeper documents are rejected instead of recursing further
    std::size_t max_depth{64};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Decode exactly one JSON document; trailing non-whitespace is an error.
    /// Not thread-safe: one parser per reading thread.
    [[nodiscard]] JsonParseResult parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] JsonParseResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] JsonParseResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] JsonParseResult convert_array(simdjson::ondemand::array arr, std::size_t depth);

    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;
};

/// Thread-local parser with the default configuration
[[nodiscard]] JsonParseResult fast_parse(std::string_view text);

/// Name of the simdjson kernel selected at runtime ("haswell", "fallback", ...)
[[nodiscard]] std::string fast_json_implementation();

}  // namespace mcpipe
