#pragma once

#include <string_view>

enum class ErrorDisposition { Ignore, Surface };

// Streaming recognizers emit terminal errors as part of a normal shutdown.
// Ignore: own cancellation, "no speech" after input ended, assistant transient.
ErrorDisposition classify(std::string_view domain, int code);

const char* to_string(ErrorDisposition d);
