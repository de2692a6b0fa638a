#include <gtest/gtest.h>
#include "search/frontier.hpp"
#include "search/step.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <vector>

using namespace astar;

namespace {

struct Point {
    int x = 0;
    int y = 0;

    std::vector<Point> connectedNodes() const {
        return {{x + 1, y}, {x - 1, y}, {x, y + 1}, {x, y - 1}};
    }
    int cost(const Point& to) const { return std::abs(to.x - x) + std::abs(to.y - y); }
    int estimatedCost(const Point& to) const { return cost(to); }

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
};

// Beacons with a negative id report an unusable (NaN) estimate.
struct Beacon {
    int id = 0;

    std::vector<Beacon> connectedNodes() const { return {}; }
    double cost(const Beacon&) const { return 1.0; }
    double estimatedCost(const Beacon&) const {
        return id < 0 ? std::numeric_limits<double>::quiet_NaN() : 10.0 * id;
    }

    bool operator==(const Beacon& o) const { return id == o.id; }
};

} // namespace

namespace std {
template <> struct hash<Beacon> {
    size_t operator()(const Beacon& b) const { return hash<int>()(b.id); }
};
template <> struct hash<Point> {
    size_t operator()(const Point& p) const { return hash<int>()(p.x * 7919 + p.y); }
};
} // namespace std

namespace {

// Start and goal both at the origin: a seeded step at distance d has
// g = d and h = d, so f = 2d.
struct OpenSet {
    Point origin{0, 0};
    StepArena<Point> arena{origin};
    Frontier<Point> frontier{arena};

    StepId seed(int x, int y) {
        StepId id = arena.seed(origin, Point{x, y});
        frontier.push(id);
        return id;
    }
};

} // namespace

TEST(FrontierTest, PopsLowestTotalCostFirst) {
    OpenSet open_set;
    StepId far = open_set.seed(3, 0);     // f = 6
    StepId near = open_set.seed(1, 0);    // f = 2
    StepId mid = open_set.seed(0, 2);     // f = 4

    ASSERT_EQ(open_set.frontier.size(), 3u);
    EXPECT_EQ(open_set.frontier.popMin(), near);
    EXPECT_EQ(open_set.frontier.popMin(), mid);
    EXPECT_EQ(open_set.frontier.popMin(), far);
    EXPECT_TRUE(open_set.frontier.empty());
}

TEST(FrontierTest, EqualCostsLeaveInDiscoveryOrder) {
    OpenSet open_set;
    StepId a = open_set.seed(1, 0);
    StepId b = open_set.seed(0, 1);
    StepId c = open_set.seed(-1, 0);
    StepId d = open_set.seed(0, -1);

    EXPECT_EQ(open_set.frontier.popMin(), a);
    EXPECT_EQ(open_set.frontier.popMin(), b);
    EXPECT_EQ(open_set.frontier.popMin(), c);
    EXPECT_EQ(open_set.frontier.popMin(), d);
}

TEST(FrontierTest, FindsOpenStepByNode) {
    OpenSet open_set;
    StepId a = open_set.seed(2, 0);
    open_set.seed(0, 5);

    auto found = open_set.frontier.find(Point{2, 0});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, a);
    EXPECT_TRUE(open_set.frontier.contains(Point{0, 5}));
    EXPECT_FALSE(open_set.frontier.find(Point{7, 7}).has_value());
}

TEST(FrontierTest, LookupIgnoresCostOrder) {
    OpenSet open_set;
    // Same f for all three: identity lookup must not depend on where
    // the entry landed in the cost order.
    open_set.seed(1, 1);
    open_set.seed(2, 0);
    StepId target = open_set.seed(0, 2);

    auto found = open_set.frontier.find(Point{0, 2});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, target);
}

TEST(FrontierTest, PoppedStepIsNoLongerOpen) {
    OpenSet open_set;
    open_set.seed(1, 0);
    StepId popped = open_set.frontier.popMin();
    EXPECT_FALSE(open_set.frontier.contains(open_set.arena[popped].node));
}

TEST(FrontierTest, RepositionAfterRelax) {
    OpenSet open_set;
    StepId far = open_set.seed(4, 0);     // g = 4, f = 8
    StepId near = open_set.seed(1, 0);    // f = 2
    StepId mid = open_set.seed(0, 3);     // f = 6

    ASSERT_EQ(open_set.frontier.popMin(), near);

    open_set.arena.relax(far, near, 0);   // g = 1, f = 5
    open_set.frontier.reposition(far);

    EXPECT_EQ(open_set.arena[far].previous, near);
    EXPECT_EQ(open_set.arena[far].step_cost, 1);
    EXPECT_EQ(open_set.frontier.popMin(), far);
    EXPECT_EQ(open_set.frontier.popMin(), mid);
}

TEST(FrontierTest, DuplicateNodeRejected) {
    OpenSet open_set;
    open_set.seed(1, 0);
    StepId again = open_set.arena.seed(Point{5, 5}, Point{1, 0});
    EXPECT_THROW(open_set.frontier.push(again), std::runtime_error);
    EXPECT_EQ(open_set.frontier.size(), 1u);
}

TEST(FrontierTest, RepositionOfClosedStepThrows) {
    OpenSet open_set;
    StepId id = open_set.seed(1, 0);
    open_set.frontier.popMin();
    EXPECT_THROW(open_set.frontier.reposition(id), std::runtime_error);
}

TEST(FrontierTest, PopOnEmptyThrows) {
    OpenSet open_set;
    EXPECT_THROW(open_set.frontier.popMin(), std::out_of_range);
}

TEST(FrontierTest, RepositionOfUnorderableStepThrows) {
    StepArena<Beacon> arena{Beacon{0}};
    Frontier<Beacon> frontier{arena};

    frontier.push(arena.seed(Beacon{0}, Beacon{5}));   // f = 51
    StepId lost = arena.seed(Beacon{0}, Beacon{-1});   // f = NaN
    frontier.push(lost);
    ASSERT_TRUE(std::isnan(arena[lost].totalCost()));

    EXPECT_THROW(frontier.reposition(lost), std::runtime_error);
    EXPECT_EQ(frontier.size(), 2u);
}
