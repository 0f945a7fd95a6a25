#pragma once

#include "untrusted_value/capabilities.hpp"
#include "untrusted_value/config.hpp"
#include "untrusted_value/function.hpp"
#include "untrusted_value/maybe_untrusted.hpp"
#include "untrusted_value/policy.hpp"
#include "untrusted_value/registry.hpp"
#include "untrusted_value/result.hpp"
#include "untrusted_value/sanitize.hpp"
#include "untrusted_value/sanitizers.hpp"
#include "untrusted_value/untrusted.hpp"
#include "untrusted_value/variant.hpp"

#if UNTRUSTED_VALUE_DERIVE
#include "untrusted_value/derive.hpp"
#endif
