#pragma once

#include "integra/persist/ResultSink.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace Integra {

// One file per evaluation:
//   <dir>/result_user{uid}_product{pid}.json
// A later evaluation of the same pair overwrites the earlier file.
class JsonResultWriter final : public ResultSink {
public:
    explicit JsonResultWriter(std::string directory);

    std::string save(const EvaluationRecord& record) override;

    std::string pathFor(int64_t user_id, int64_t product_id) const;

    // Keys keep schema order: timestamp, user, product, antifraud.
    static nlohmann::ordered_json toJson(const EvaluationRecord& record);

private:
    std::string dir_;
};

} // namespace Integra
