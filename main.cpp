#include <iostream>
#include <memory>
#include <string>

#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/model/model.hpp"
#include "src/relay/candidates/candidate_builder.hpp"
#include "src/relay/config/config.hpp"
#include "src/relay/handler/cgi_io.hpp"
#include "src/relay/handler/join_handler.hpp"
#include "src/utils/constants.hpp"
#include "src/utils/log_utils.hpp"

int main() {
    std::string cors_origin = constants::DEFAULT_CORS_ORIGIN;

    try {
        //
        // Configure
        //

        const relay::config::RelayConfig config = relay::config::load_from_env();
        log_utils::set_level(config.log_level_);
        cors_origin = config.cors_origin_;

        const auto targets = relay::candidates::resolve_targets(config);
        const char* source = !config.upstream_urls_.empty() ? "UPSTREAM_URLS" : (!config.upstream_base_.empty() ? "UPSTREAM_BASE" : "none");
        log_utils::debug(std::string("candidate source: ") + source + ", " + std::to_string(targets.size()) + " target(s), timeout " +
                         std::to_string(config.timeout_.count()) + "ms");

        http::client::CurlGlobal curl_global;

        auto client = std::make_shared<http::client::CurlEasy>();
        const relay::handler::JoinHandler handler(config, client);

        //
        // Serve
        //

        const relay::handler::InboundRequest request = relay::handler::read_cgi_request(std::cin);
        const relay::handler::HandlerResponse response = handler.handle(request);
        relay::handler::write_cgi_response(std::cout, response);
    } catch (const std::exception& e) {
        log_utils::error(std::string("Fatal Error: ") + e.what());

        const relay::handler::HandlerResponse failure =
            relay::handler::error_response(static_cast<long>(http::model::HttpStatusCode::INTERNAL_SERVER_ERROR), cors_origin, e.what());
        relay::handler::write_cgi_response(std::cout, failure);
        return 1;
    }

    return 0;
};
