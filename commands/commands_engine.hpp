#pragma once
#include "commands_core.hpp"

namespace Engine { class TranslationEngine; }

// Engine the console commands act on (owned by main)
void bindEngine(Engine::TranslationEngine* engine);

// Translation commands
CommandResult cmdStart(const std::string& arg);
CommandResult cmdStop(const std::string& arg);
CommandResult cmdStatus(const std::string& arg);
CommandResult cmdDevices(const std::string& arg);
