///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "slot_domain.hpp"
#include <gtest/gtest.h>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(SlotDomainTest, IndexAndSlotAtAreInverse) {
    SlotDomain dom;
    for (int i = 0; i < dom.numSlots(); ++i) {
        EXPECT_EQ(dom.index(dom.slotAt(i)), i);
    }
    EXPECT_EQ(dom.index(Slot{1, 0}), PERIODS_PER_DAY);
}

TEST(SlotDomainTest, PartsOfDayCoverTwoPeriodsEach) {
    SlotDomain dom;
    EXPECT_EQ(dom.partOfDay(0), PartOfDay::MORNING);
    EXPECT_EQ(dom.partOfDay(1), PartOfDay::MORNING);
    EXPECT_EQ(dom.partOfDay(2), PartOfDay::AFTERNOON);
    EXPECT_EQ(dom.partOfDay(3), PartOfDay::AFTERNOON);
    EXPECT_EQ(dom.partOfDay(4), PartOfDay::NIGHT);
    EXPECT_EQ(dom.partOfDay(5), PartOfDay::NIGHT);

    EXPECT_EQ(slotCount(dom.partOfDayMask(partOfDayBit(PartOfDay::MORNING))), 10);
    EXPECT_EQ(slotCount(dom.partOfDayMask(partOfDayBit(PartOfDay::MORNING) | partOfDayBit(PartOfDay::NIGHT))), 20);
    EXPECT_EQ(dom.partOfDayMask(0), 0u);
}

TEST(SlotDomainTest, MasksPartitionTheWeek) {
    SlotDomain dom;
    EXPECT_EQ(slotCount(dom.allSlots()), NUM_SLOTS);

    SlotSet days = 0;
    for (int d = 0; d < DAYS; ++d) {
        EXPECT_EQ(slotCount(dom.dayMask(d)), PERIODS_PER_DAY);
        EXPECT_EQ(days & dom.dayMask(d), 0u);
        days |= dom.dayMask(d);
    }
    EXPECT_EQ(days, dom.allSlots());
}

TEST(SlotDomainTest, ContainsRejectsOutsideSlots) {
    SlotDomain dom;
    EXPECT_TRUE(dom.contains(Slot{4, 5}));
    EXPECT_FALSE(dom.contains(Slot{5, 0}));
    EXPECT_FALSE(dom.contains(Slot{0, 6}));
    EXPECT_FALSE(dom.contains(Slot{-1, 0}));
}

TEST(SlotDomainTest, ToSetAndSlotsOf) {
    SlotDomain dom;
    SlotSet set = dom.toSet({Slot{2, 3}, Slot{0, 1}, Slot{7, 0}, Slot{0, 1}});
    EXPECT_EQ(slotCount(set), 2);

    std::vector<Slot> slots = dom.slotsOf(set);
    ASSERT_EQ(slots.size(), 2u);
    EXPECT_EQ(slots[0], (Slot{0, 1}));
    EXPECT_EQ(slots[1], (Slot{2, 3}));
}

TEST(SlotDomainTest, Labels) {
    SlotDomain dom;
    EXPECT_EQ(dom.weekdayName(0), "Monday");
    EXPECT_EQ(dom.weekdayName(4), "Friday");
    EXPECT_EQ(dom.periodLabel(0), "8:00 - 9:40");
    EXPECT_EQ(dom.periodLabel(5), "21:10 - 22:50");
    EXPECT_EQ(dom.partOfDayName(PartOfDay::AFTERNOON), "afternoon");
}
