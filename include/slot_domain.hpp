#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>
#include <vector>


///////////////////////////
///     SLOT DOMAIN     ///
///////////////////////////
/**
 * @brief Number of slots contained in a slot set.
 */
int slotCount(SlotSet set);

/**
 * @brief Immutable universe of (weekday, period) slots.
 *
 * Built once per run and shared by reference by every component; holds the
 * derived part-of-day and per-day masks used by the search and the rules.
 */
class SlotDomain {
public:
    SlotDomain();

    int numDays() const { return DAYS; }
    int periodsPerDay() const { return PERIODS_PER_DAY; }
    int numSlots() const { return NUM_SLOTS; }

    /// True if the slot lies inside the weekly grid.
    bool contains(const Slot& s) const;

    /// Bit index of a slot; the slot must be contained in the grid.
    int index(const Slot& s) const { return s.day * PERIODS_PER_DAY + s.period; }

    /// Inverse of index().
    Slot slotAt(int index) const { return Slot{index / PERIODS_PER_DAY, index % PERIODS_PER_DAY}; }

    SlotSet bit(const Slot& s) const { return SlotSet(1) << index(s); }

    /// morning = periods 0-1, afternoon = 2-3, night = 4-5.
    PartOfDay partOfDay(int period) const;

    /// All slots in any of the given parts of day.
    SlotSet partOfDayMask(PartOfDayMask parts) const;

    /// All slots on one weekday.
    SlotSet dayMask(int day) const { return dayMasks_[day]; }

    SlotSet allSlots() const { return all_; }

    /// Slots of a set in ascending index order.
    std::vector<Slot> slotsOf(SlotSet set) const;

    /// Build a slot set from a list of slots; slots outside the grid are ignored.
    SlotSet toSet(const std::vector<Slot>& slots) const;

    const std::string& weekdayName(int day) const { return weekdayNames_[day]; }
    const std::string& periodLabel(int period) const { return periodLabels_[period]; }
    const std::string& partOfDayName(PartOfDay p) const;

private:
    SlotSet all_ = 0;
    std::vector<SlotSet> dayMasks_;
    std::vector<SlotSet> partMasks_; ///< Indexed by PartOfDay.
    std::vector<std::string> weekdayNames_;
    std::vector<std::string> periodLabels_;
    std::vector<std::string> partNames_;
};
