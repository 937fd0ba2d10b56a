#include "core/combatant.hpp"
#include <sstream>

namespace duel {

namespace {

void check_weapons(const char* kind, const std::vector<i32>& damage,
                   std::vector<std::string>& problems) {
    for (size_t i = 0; i < damage.size(); ++i) {
        if (damage[i] < 0) {
            std::ostringstream ss;
            ss << kind << "[" << i << "] has negative damage " << damage[i];
            problems.push_back(ss.str());
        }
    }
}

void append_prefixed(const char* prefix, const std::vector<std::string>& from,
                     std::vector<std::string>& to) {
    for (const auto& problem : from) {
        to.push_back(std::string(prefix) + ": " + problem);
    }
}

} // namespace

std::vector<std::string> CombatantSpec::validate() const {
    std::vector<std::string> problems;

    if (hull <= 0) {
        problems.push_back("hull must be positive, got " + std::to_string(hull));
    }
    check_weapons("missiles", missiles, problems);
    check_weapons("cannons", cannons, problems);

    return problems;
}

std::string SpecError::join(const std::string& context, const std::vector<std::string>& problems) {
    std::string msg = context;
    for (size_t i = 0; i < problems.size(); ++i) {
        msg += (i == 0) ? ": " : "; ";
        msg += problems[i];
    }
    return msg;
}

std::vector<std::string> validate_matchup(const CombatantSpec& first, const CombatantSpec& second) {
    std::vector<std::string> problems;
    append_prefixed("first", first.validate(), problems);
    append_prefixed("second", second.validate(), problems);

    // Without a damaging cannon on either side, a duel that survives the
    // missile phase loops forever
    if (!first.has_damaging_cannon() && !second.has_damaging_cannon()) {
        problems.push_back("neither combatant has a cannon with positive damage; "
                           "the cannon phase could never end");
    }

    return problems;
}

void require_valid_matchup(const CombatantSpec& first, const CombatantSpec& second) {
    auto problems = validate_matchup(first, second);
    if (!problems.empty()) {
        throw SpecError("invalid matchup", problems);
    }
}

} // namespace duel
