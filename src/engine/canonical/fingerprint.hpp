#pragma once
#include <set>
#include <string>

#include "../../core/types/constants.hpp"

namespace Spoor {
namespace Engine {
namespace Canonical {

// The structural marker that identifies a target host, e.g. "<key>.myshopify.com".
struct Fingerprint {
    std::string           suffix = Spoor::Core::Constants::DEFAULT_FINGERPRINT;
    std::string           scheme = "https";
    std::set<std::string> reserved{Spoor::Core::get_reserved_keys().begin(),
                                   Spoor::Core::get_reserved_keys().end()};
    size_t                min_length = Spoor::Core::Constants::MIN_KEY_LENGTH;
    size_t                max_length = Spoor::Core::Constants::MAX_KEY_LENGTH;
};

}  // namespace Canonical
}  // namespace Engine
}  // namespace Spoor
