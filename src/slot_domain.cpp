///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "slot_domain.hpp"
#include <bitset>


///////////////////////////
///     SLOT DOMAIN     ///
///////////////////////////
int slotCount(SlotSet set) {
    return (int)std::bitset<32>(set).count();
}

/**
 * @brief Precompute every mask and label of the weekly grid.
 */
SlotDomain::SlotDomain()
        : dayMasks_(DAYS, 0),
          partMasks_(3, 0),
          weekdayNames_{"Monday", "Tuesday", "Wednesday", "Thursday", "Friday"},
          periodLabels_{"8:00 - 9:40", "10:00 - 11:40", "14:00 - 15:40",
                        "16:00 - 17:40", "19:20 - 21:00", "21:10 - 22:50"},
          partNames_{"morning", "afternoon", "night"} {
    for (int d = 0; d < DAYS; ++d) {
        for (int p = 0; p < PERIODS_PER_DAY; ++p) {
            SlotSet b = bit(Slot{d, p});
            all_ |= b;
            dayMasks_[d] |= b;
            partMasks_[static_cast<int>(partOfDay(p))] |= b;
        }
    }
}

bool SlotDomain::contains(const Slot& s) const {
    return s.day >= 0 && s.day < DAYS && s.period >= 0 && s.period < PERIODS_PER_DAY;
}

PartOfDay SlotDomain::partOfDay(int period) const {
    if (period < 2) return PartOfDay::MORNING;
    if (period < 4) return PartOfDay::AFTERNOON;
    return PartOfDay::NIGHT;
}

SlotSet SlotDomain::partOfDayMask(PartOfDayMask parts) const {
    SlotSet mask = 0;
    for (int p = 0; p < 3; ++p) {
        if (parts & (1u << p)) mask |= partMasks_[p];
    }
    return mask;
}

std::vector<Slot> SlotDomain::slotsOf(SlotSet set) const {
    std::vector<Slot> out;
    for (int i = 0; i < NUM_SLOTS; ++i) {
        if (set & (SlotSet(1) << i)) out.push_back(slotAt(i));
    }
    return out;
}

SlotSet SlotDomain::toSet(const std::vector<Slot>& slots) const {
    SlotSet set = 0;
    for (const Slot& s : slots) {
        if (contains(s)) set |= bit(s);
    }
    return set;
}

const std::string& SlotDomain::partOfDayName(PartOfDay p) const {
    return partNames_[static_cast<int>(p)];
}
