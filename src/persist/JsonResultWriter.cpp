#include "integra/persist/JsonResultWriter.hpp"
#include "integra/core/TimeFormat.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace Integra {

JsonResultWriter::JsonResultWriter(std::string directory)
    : dir_(std::move(directory)) {}

std::string JsonResultWriter::pathFor(int64_t user_id, int64_t product_id) const {
    fs::path p = fs::path(dir_) /
        ("result_user" + std::to_string(user_id) +
         "_product" + std::to_string(product_id) + ".json");
    return p.string();
}

static json priceValue(const ProductRecord& p) {
    if (p.price_source.is_number_unsigned()) return p.price_source.get<uint64_t>();
    if (p.price_source.is_number_integer())  return p.price_source.get<int64_t>();
    return p.price;
}

json JsonResultWriter::toJson(const EvaluationRecord& r) {
    json j;
    j["timestamp"] = formatLocalTime(r.timestamp);
    j["user"] = {
        {"id",    r.user.id},
        {"name",  r.user.name},
        {"email", r.user.email},
        {"city",  r.user.city},
    };
    j["product"] = {
        {"id",       r.product.id},
        {"title",    r.product.title},
        {"price",    priceValue(r.product)},
        {"category", r.product.category},
    };
    j["antifraud"] = {
        {"score",   r.assessment.score},
        {"blocked", r.assessment.blocked},
        {"reasons", r.assessment.reasons},
    };
    return j;
}

std::string JsonResultWriter::save(const EvaluationRecord& record) {
    std::error_code ec;
    if (!dir_.empty()) {
        fs::create_directories(dir_, ec);
        if (ec) {
            throw ResultWriteError("[RESULT] cannot create " + dir_ + ": " + ec.message());
        }
    }

    const std::string path = pathFor(record.user.id, record.product.id);
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f.is_open()) {
        throw ResultWriteError("[RESULT] cannot open " + path);
    }

    // Names and titles are written as UTF-8, not \u-escaped. Invalid UTF-8
    // from upstream is replaced rather than aborting the write.
    f << toJson(record).dump(4, ' ', false, json::error_handler_t::replace) << "\n";
    if (!f) {
        throw ResultWriteError("[RESULT] write failed for " + path);
    }
    return path;
}

} // namespace Integra
