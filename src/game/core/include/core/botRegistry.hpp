#pragma once

#include "core/IBot.hpp"
#include "model/errors.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace connex {

inline constexpr std::string_view RANDOM_BOT_NAME = "random_bot";

//! Table of bots available to matches.
//! Filled during startup and then frozen. Lookups are safe from any number of threads.
class BotRegistry {
public:
	//! Add or replace a bot. Returns false once the registry is frozen.
	bool registerBot(std::string name, std::shared_ptr<IBot> bot);

	void freeze(); //!< Reject further registrations.
	bool isFrozen() const;

	//! Find a bot by name.
	//! \param [out] out Set when the bot exists.
	std::optional<BotError> lookup(std::string_view name, std::shared_ptr<IBot>& out) const;

	std::vector<std::string> names() const; //!< Registered names in sorted order.

private:
	mutable std::shared_mutex m_mutex;
	bool m_frozen{false};
	std::map<std::string, std::shared_ptr<IBot>, std::less<>> m_bots;
};

//! Register the bots shipped with the engine. Returns false if the registry is already frozen.
bool registerDefaultBots(BotRegistry& registry);

} // namespace connex
