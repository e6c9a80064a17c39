#include "config.hpp"

#include <simdjson.h>

#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"

namespace relay::config {
    namespace {
        std::vector<std::string> default_upstream_headers() { return {constants::DEFAULT_CONTENT_TYPE_HEADER}; }
    }  // namespace

    std::optional<std::string> process_env(const char* key) {
        const char* value = std::getenv(key);
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::vector<std::string> parse_upstream_headers(std::string_view json) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(json);
        simdjson::ondemand::document doc;
        if (parser.iterate(padded).get(doc) != simdjson::SUCCESS) {
            return default_upstream_headers();
        }

        simdjson::ondemand::object object;
        if (doc.get_object().get(object) != simdjson::SUCCESS) {
            return default_upstream_headers();
        }

        std::vector<std::string> headers;
        for (auto field : object) {
            std::string_view key;
            std::string_view value;
            if (field.unescaped_key().get(key) != simdjson::SUCCESS || field.value().get_string().get(value) != simdjson::SUCCESS) {
                return default_upstream_headers();
            }
            headers.push_back(std::string(key) + ": " + std::string(value));
        }

        if (!doc.at_end()) {
            return default_upstream_headers();
        }

        return headers;
    }

    std::chrono::milliseconds parse_timeout(const std::optional<std::string>& raw) {
        if (!raw) {
            return std::chrono::milliseconds{constants::DEFAULT_TIMEOUT_MS};
        }
        const std::optional<long> parsed = string_utils::parse_long(*raw);
        if (!parsed || *parsed <= 0) {
            return std::chrono::milliseconds{constants::DEFAULT_TIMEOUT_MS};
        }
        return std::chrono::milliseconds{std::min(*parsed, constants::MAX_TIMEOUT_MS)};
    }

    RelayConfig load_from_env(const EnvLookup& lookup) {
        RelayConfig config;

        config.timeout_ = parse_timeout(lookup(constants::ENV_TIMEOUT_MS));

        if (auto urls = lookup(constants::ENV_UPSTREAM_URLS)) {
            config.upstream_urls_ = string_utils::split_comma_delimited_string(*urls);
        }

        if (auto base = lookup(constants::ENV_UPSTREAM_BASE)) {
            config.upstream_base_ = *base;
        }

        if (auto headers = lookup(constants::ENV_UPSTREAM_HEADERS)) {
            config.upstream_headers_ = parse_upstream_headers(*headers);
        }

        if (auto origin = lookup(constants::ENV_CORS_ORIGIN); origin && !origin->empty()) {
            config.cors_origin_ = *origin;
        }

        if (auto level = lookup(constants::ENV_LOG_LEVEL)) {
            config.log_level_ = log_utils::parse_level(*level).value_or(log_utils::Level::INFO);
        }

        return config;
    }
}  // namespace relay::config
