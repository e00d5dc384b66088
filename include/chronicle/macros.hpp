#pragma once

#include <string>

/// Declare this class as an aggregate of the given domain.
#define CHRONICLE_AGGREGATE(domain_name) \
    static constexpr const char* kDomain = domain_name; \
    std::string domain() const override { return kDomain; }

/// Declare this class as a projector.
#define CHRONICLE_PROJECTOR(projector_name) \
    static constexpr const char* kName = projector_name; \
    std::string name() const override { return kName; }
