#pragma once

#include "api/messages.hpp"
#include "core/gameController.hpp"

#include <memory>
#include <string>

namespace connex::api {

//! Maps api requests onto a single match.
//! Bot seats move automatically after every request that changes the match.
class MatchHandler {
public:
	//! \note The registry must outlive the handler.
	explicit MatchHandler(const BotRegistry& registry, MatchOptions options = {});

	Response handle(const Request& request);

	//! Parse a JSON request, handle it and serialize the response.
	std::string handleMessage(const std::string& message);

	bool hasMatch() const;
	const GameController* match() const; //!< Current match or nullptr.

private:
	Response handleRequest(const NewGame& request);
	Response handleRequest(const SubmitMove& request);
	Response handleRequest(const ExportTranscript& request);
	Response handleRequest(const ExportPosition& request);
	Response handleRequest(const ChooseMove& request);

	void playBots();           //!< Let bots move until a human is on turn or the match ended.
	MoveResult result() const; //!< Summary of the current match state.

private:
	const BotRegistry& m_registry;
	MatchOptions m_options;
	std::unique_ptr<GameController> m_match;
};

} // namespace connex::api
