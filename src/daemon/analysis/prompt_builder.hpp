#pragma once

#include "analysis/analysis_types.hpp"

#include <string>

// Instruction prompt sent as the single user message of a completion request.
std::string build_analysis_prompt(const AnalysisRequest& request);

// Preference block appended to the prompt; empty when there is nothing to add.
std::string build_preferences_context(const UserPreferences& prefs);
