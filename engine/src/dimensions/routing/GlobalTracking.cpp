#include <dimensions/routing/GlobalTracking.hpp>

#include <format>

namespace dimensions::routing
{

GlobalTracking::ClaimResult GlobalTracking::claimName(const std::string &name,
                                                      const TrackedPlayer &who)
{
    auto [it, inserted] = names_.try_emplace(name, who);
    if (inserted)
    {
        return ClaimResult::Claimed;
    }
    if (it->second.clientId != who.clientId)
    {
        return ClaimResult::Taken;
    }
    it->second = who;
    return ClaimResult::Refreshed;
}

bool GlobalTracking::releaseName(const std::string &name, std::uint64_t clientId) noexcept
{
    auto it = names_.find(name);
    if (it == names_.end() || it->second.clientId != clientId)
    {
        return false;
    }
    names_.erase(it);
    return true;
}

void GlobalTracking::updateDestination(const std::string &name, std::uint64_t clientId,
                                       std::string_view destination)
{
    auto it = names_.find(name);
    if (it != names_.end() && it->second.clientId == clientId)
    {
        it->second.destination.assign(destination);
    }
}

std::string GlobalTracking::describe() const
{
    if (names_.empty())
    {
        return "(none)";
    }

    std::string out;
    for (const auto &[name, p] : names_)
    {
        if (!out.empty())
        {
            out += ' ';
        }
        out += std::format("{}({}->{})", name, p.listenPort,
                           p.destination.empty() ? "-" : p.destination);
    }
    return out;
}

} // namespace dimensions::routing
