// =============================================================================
// AppConfig.hpp - Runtime configuration value
// =============================================================================
// Built once at startup and handed by value/reference to the components that
// need it. Nothing reads configuration from globals.
// =============================================================================
#pragma once

#include <chrono>
#include <string>

namespace Integra {

class ConfigLoader;

struct FetchPolicy {
    int retries = 3;
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds connect_timeout{3000};
    std::chrono::milliseconds retry_delay{1000};
};

struct AppConfig {
    std::string users_base    = "https://jsonplaceholder.typicode.com/users";
    std::string products_base = "https://fakestoreapi.com/products";

    std::string log_dir    = "logs";
    std::string log_file   = "integration.log";
    std::string result_dir = "results";

    int risk_threshold = 70;   // score >= threshold blocks

    FetchPolicy fetch;

    int user_id_min    = 1;
    int user_id_max    = 10;
    int product_id_min = 1;
    int product_id_max = 20;

    bool color = true;

    std::string logPath() const;
};

// Missing keys keep the defaults above. INTEGRA_USERS_API and
// INTEGRA_PRODUCTS_API override the base URLs when set.
AppConfig loadAppConfig(const ConfigLoader& loader);

} // namespace Integra
