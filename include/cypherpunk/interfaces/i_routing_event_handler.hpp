#pragma once
#include "cypherpunk/core/failures.hpp"
#include <cstddef>
#include <string>
#include <vector>
namespace cypherpunk::remailer::interfaces {
class IRoutingEventHandler {
public:
    virtual ~IRoutingEventHandler() = default;
    virtual void OnCopyCompleted(size_t copy_index, const std::vector<std::string>& hop_names) = 0;
    virtual void OnCopyFailed(size_t copy_index, const RemailerFailure& failure) = 0;
};
}
