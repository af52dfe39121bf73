#pragma once
#include <string>

#include <nlohmann/json.hpp>

namespace listing {

struct TitleRecord {
    std::string id;          // 1-based position in the input, e.g. "17"
    std::string title;       // empty when the input had none (or null)
    nlohmann::json source;   // original object, passed through to the output
};

}  // namespace listing
