#include "integra/config/AppConfig.hpp"
#include "integra/config/ConfigLoader.hpp"

#include <algorithm>
#include <cstdlib>

namespace Integra {

std::string AppConfig::logPath() const {
    if (log_dir.empty()) return log_file;
    if (log_dir.back() == '/') return log_dir + log_file;
    return log_dir + "/" + log_file;
}

static std::string stripTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

AppConfig loadAppConfig(const ConfigLoader& loader) {
    AppConfig cfg;

    cfg.users_base    = stripTrailingSlash(loader.get("api", "users_base", cfg.users_base));
    cfg.products_base = stripTrailingSlash(loader.get("api", "products_base", cfg.products_base));

    if (const char* env = std::getenv("INTEGRA_USERS_API"); env && *env)
        cfg.users_base = stripTrailingSlash(env);
    if (const char* env = std::getenv("INTEGRA_PRODUCTS_API"); env && *env)
        cfg.products_base = stripTrailingSlash(env);

    cfg.log_dir    = loader.get("paths", "log_dir", cfg.log_dir);
    cfg.log_file   = loader.get("paths", "log_file", cfg.log_file);
    cfg.result_dir = loader.get("paths", "result_dir", cfg.result_dir);

    cfg.risk_threshold = std::clamp(
        loader.getInt("risk", "threshold", cfg.risk_threshold), 0, 100);

    int retries = loader.getInt("fetch", "retries", cfg.fetch.retries);
    cfg.fetch.retries = retries < 1 ? 1 : retries;

    auto ms = [&](const char* key, std::chrono::milliseconds def) {
        int v = loader.getInt("fetch", key, static_cast<int>(def.count()));
        return v < 0 ? def : std::chrono::milliseconds(v);
    };
    cfg.fetch.timeout         = ms("timeout_ms", cfg.fetch.timeout);
    cfg.fetch.connect_timeout = ms("connect_timeout_ms", cfg.fetch.connect_timeout);
    cfg.fetch.retry_delay     = ms("retry_delay_ms", cfg.fetch.retry_delay);

    cfg.user_id_min    = loader.getInt("console", "user_id_min", cfg.user_id_min);
    cfg.user_id_max    = loader.getInt("console", "user_id_max", cfg.user_id_max);
    cfg.product_id_min = loader.getInt("console", "product_id_min", cfg.product_id_min);
    cfg.product_id_max = loader.getInt("console", "product_id_max", cfg.product_id_max);
    cfg.color          = loader.getBool("console", "color", cfg.color);

    return cfg;
}

} // namespace Integra
