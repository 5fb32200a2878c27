#include "core/botRegistry.hpp"

#include "Logging.hpp"
#include "core/randomBot.hpp"

#include <format>
#include <mutex>
#include <utility>

namespace connex {

bool BotRegistry::registerBot(std::string name, std::shared_ptr<IBot> bot) {
	std::unique_lock lock(m_mutex);

	if (m_frozen) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[BotRegistry] Rejected registration of '{}': registry is frozen.", name));
		return false;
	}

	if (m_bots.contains(name)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[BotRegistry] Replacing bot '{}'.", name));
	} else {
		Logger().Log(Logging::LogLevel::Info, std::format("[BotRegistry] Registered bot '{}'.", name));
	}
	m_bots.insert_or_assign(std::move(name), std::move(bot));
	return true;
}

void BotRegistry::freeze() {
	std::unique_lock lock(m_mutex);
	m_frozen = true;
}

bool BotRegistry::isFrozen() const {
	std::shared_lock lock(m_mutex);
	return m_frozen;
}

std::optional<BotError> BotRegistry::lookup(std::string_view name, std::shared_ptr<IBot>& out) const {
	std::shared_lock lock(m_mutex);

	const auto it = m_bots.find(name);
	if (it == m_bots.end()) {
		return BotError::NotFound;
	}
	out = it->second;
	return {};
}

std::vector<std::string> BotRegistry::names() const {
	std::shared_lock lock(m_mutex);

	std::vector<std::string> result;
	result.reserve(m_bots.size());
	for (const auto& [name, bot]: m_bots) {
		result.push_back(name);
	}
	return result;
}

bool registerDefaultBots(BotRegistry& registry) {
	return registry.registerBot(std::string{RANDOM_BOT_NAME}, std::make_shared<RandomBot>());
}

} // namespace connex
