/**
 * @file authorizer.hpp
 * @brief Capability check consulted before resource-consuming operations.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace adaptive_scheduler {

struct AuthDecision {
    bool allowed{true};
    std::string reason;
};

class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;

    virtual AuthDecision authorize(std::string_view operation,
                                   const std::optional<ProviderId>& provider) = 0;
};

class AllowAllAuthorizer final : public IAuthorizer {
public:
    AuthDecision authorize(std::string_view /*operation*/,
                           const std::optional<ProviderId>& /*provider*/) override {
        return {true, {}};
    }
};

}  // namespace adaptive_scheduler
