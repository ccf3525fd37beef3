#pragma once

#include <cstdlib>
#include <strings.h>

namespace Concord {

inline bool IsEnvFalseValue(const char* value) {
	if (!value || !value[0]) return false;
	return strcasecmp(value, "0") == 0 ||
	       strcasecmp(value, "false") == 0 ||
	       strcasecmp(value, "no") == 0 ||
	       strcasecmp(value, "off") == 0;
}

inline bool IsEnvTrueValue(const char* value) {
	if (!value || !value[0]) return false;
	return strcasecmp(value, "1") == 0 ||
	       strcasecmp(value, "true") == 0 ||
	       strcasecmp(value, "yes") == 0 ||
	       strcasecmp(value, "on") == 0;
}

// Unrecognized values read as false.
inline bool ReadEnvBoolStrict(const char* env_name, bool default_value) {
	const char* env = std::getenv(env_name);
	if (!env) return default_value;
	if (IsEnvFalseValue(env)) return false;
	return IsEnvTrueValue(env);
}

}  // namespace Concord
