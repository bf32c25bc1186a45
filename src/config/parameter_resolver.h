#pragma once
#include "config_types.h"
#include "semantic/ports.h"
#include <optional>

namespace parameter_resolver {

// Field by field: CLI value if set, else file value if set, else unset.
ResolvedConfig resolve(const std::optional<SamplingOverrides>& cliOverrides,
                       const std::optional<SamplingOverrides>& fileOverrides);

// temperature and top_p must lie in [0, 1], top_k must be >= 1.
VoidResult validateSamplingDomain(const ResolvedConfig& config);

} // namespace parameter_resolver
