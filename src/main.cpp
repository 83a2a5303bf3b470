#include "server.hpp"
#include "config.hpp"
#include "cors_policy.hpp"
#include "env.hpp"
#include "health.hpp"
#include "logger.hpp"

using enum http::method;

namespace {

cors::preflight_spec make_preflight_spec(const config::server_config& cfg) {
    cors::preflight_spec spec;
    spec.allow_credentials = cfg.cors_allow_credentials;
    return spec;
}

} // namespace

int main() {
    try {
        util::log::info("Application starting...");

        const config::server_config cfg = config::load();

        const cors::policy cors_policy{
            cors::origin_list::parse(cfg.cors_allowed_origins, {.validate_origins = cfg.cors_validate_origins}),
            make_preflight_spec(cfg)};

        health::readiness readiness;

        server s(cfg, cors_policy);
        s.register_api(webapi_path{"/chatbox/healthz"}, get, &health::healthz);
        s.register_api(webapi_path{"/chatbox/readyz"}, get, health::make_readyz(readiness, g_version));

        s.start([&readiness] { readiness.set_ready(); });

        util::log::info("Application shutting down gracefully.");

    } catch (const env::error& e) {
        util::log::critical("Configuration could not be read: {}", e.what());
        return 1;
    } catch (const config::error& e) {
        util::log::critical("Invalid configuration: {}", e.what());
        return 1;
    } catch (const server_error& e) {
        util::log::critical("A critical server error occurred: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        util::log::critical("An unexpected error occurred: {}", e.what());
        return 1;
    }

    return 0;
}
