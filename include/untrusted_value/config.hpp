#pragma once

// Build-time switches. The CMake options of the same name forward them as
// compile definitions; anything left undefined falls back to these defaults.

// Enables use_untrusted_value(), which clears the taint without sanitizing.
#ifndef UNTRUSTED_VALUE_ALLOW_USAGE_WITHOUT_SANITIZATION
#define UNTRUSTED_VALUE_ALLOW_USAGE_WITHOUT_SANITIZATION 1
#endif

// Enables the UNTRUSTED_VALUE_VARIANT code generation macros.
#ifndef UNTRUSTED_VALUE_DERIVE
#define UNTRUSTED_VALUE_DERIVE 1
#endif

// Generated variants run every field sanitizer before reporting the first error.
#ifndef UNTRUSTED_VALUE_HARDEN_SANITIZE
#define UNTRUSTED_VALUE_HARDEN_SANITIZE 0
#endif
