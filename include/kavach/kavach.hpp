#pragma once
// Kavach: privacy core for chatting with third-party language models
//
// Real identifying data is swapped for per-session tokens before text
// leaves the process, leaked values are swapped back in responses, and
// tokens are rendered to real values only for display.

#include "version.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "text.hpp"
#include "registry.hpp"
#include "crypto.hpp"
#include "kv_store.hpp"
#include "session_vault.hpp"
#include "profile.hpp"
#include "profile_store.hpp"
#include "profile_vault.hpp"
#include "audit.hpp"
#include "recreator.hpp"
#include "patterns.hpp"
#include "recognizer.hpp"
#include "detector.hpp"
#include "masking.hpp"
#include "sanitizer.hpp"
#include "unmasker.hpp"
#include "prompt_shield.hpp"
#include "config.hpp"
#include "core.hpp"
