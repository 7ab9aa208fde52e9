/**
 * @file errors.cpp
 * @brief Error implementations for chatrelay
 */

#include "chatrelay/errors.hpp"

namespace chatrelay {

nlohmann::json ChatRelayError::to_json() const {
    nlohmann::json error = {
        {"message", what()},
        {"type", type_}
    };
    if (!code_.empty()) {
        error["code"] = code_;
    }
    return {{"error", error}};
}

} // namespace chatrelay
