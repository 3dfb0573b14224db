#pragma once

#include "model_manager.hpp"
#include "session_orchestrator.hpp"

#include <nlohmann/json.hpp>

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

// Wire form of the observable states, shared by status replies and watch events.
nlohmann::json to_json(const SessionState& state);
nlohmann::json to_json(const ModelState& state);
nlohmann::json to_json(const Error& error);
