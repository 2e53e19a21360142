#pragma once
/*
Tapline — MessageParser
Role: Decodes one venue frame into a typed MarketEvent.
Inputs/Outputs: Raw JSON text in; MarketEvent out. Unknown but well-formed types become UnknownEvent.
Threading: Pure functions; safe from any thread.
Observability: None; callers count and log failures.
Related: MessageDispatcher.cpp, Channels.hpp, tests/marketdata/fixtures/kalshi_messages.hpp.
*/
#include <chrono>
#include <string_view>
#include "../model/MarketEvents.hpp"

namespace MessageParser {

/// Throws MalformedFrame when the frame is not a JSON object with a string "type", or when a
/// modeled type lacks the fields it needs.
[[nodiscard]] MarketEvent parse(std::string_view raw,
                                std::chrono::system_clock::time_point receivedAt = std::chrono::system_clock::now());

} // namespace MessageParser
