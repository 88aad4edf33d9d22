#include <QtTest/QtTest>

#include "errandplan/scheduling/PlacementSearch.hpp"
#include "errandplan/scheduling/TravelEstimator.hpp"

#include "../support/FakeProviders.hpp"

using namespace errandplan::data;
using namespace errandplan::scheduling;
using errandplan::core::SchedulerSettings;
using errandplan::testsupport::FakeLocationResolver;
using errandplan::testsupport::FakeTravelProvider;

namespace {

const QDate Monday(2026, 10, 19);
const GeoPoint Home{0.0, 0.0};

QDateTime at(int hour, int minute = 0)
{
    return QDateTime(Monday, QTime(hour, minute));
}

SchedulerSettings quickSettings()
{
    SchedulerSettings settings;
    settings.providerBackoffMs = 0;
    return settings;
}

ErrandDefinition errand(const QString &title, LocationSpec location, int duration, TimeWindow window)
{
    ErrandDefinition definition;
    definition.title = title;
    definition.location = std::move(location);
    definition.durationMinutes = duration;
    definition.window = window;
    return definition;
}

CalendarEvent busy(const QDateTime &start, const QDateTime &end, std::optional<GeoPoint> coordinate = std::nullopt)
{
    CalendarEvent event;
    event.title = "Busy";
    event.start = start;
    event.end = end;
    event.coordinate = coordinate;
    return event;
}

FreeTimeLedger ledgerFor(const std::vector<CalendarEvent> &events)
{
    return FreeTimeLedger(PlanningHorizon{Monday, Monday}, 7 * 60, 22 * 60, Home, events);
}

struct Fixture
{
    explicit Fixture(SchedulerSettings config = quickSettings())
        : settings(config)
        , estimator(travel, settings)
        , search(estimator, places, settings)
    {
    }

    PlacementResult place(const ErrandDefinition &definition, const FreeTimeLedger &ledger,
                          const ScheduleState &state = ScheduleState()) const
    {
        return search.place(makeInstance(definition, Monday, Monday, Monday), state, ledger);
    }

    FakeTravelProvider travel;
    FakeLocationResolver places;
    SchedulerSettings settings;
    TravelEstimator estimator;
    PlacementSearch search;
};

} // namespace

class PlacementSearchTest : public QObject
{
    Q_OBJECT

private slots:
    void exactLocationStartsAfterTravel();
    void leavesRoomForTravelToNextCommitment();
    void equalTravelPrefersLabelOrder();
    void fewerTransfersBreakCostTies();
    void unknownOriginIgnoresDistanceFromHome();
    void reportsAccessTypeInfeasibility();
    void providerOutageIsRetriedThenInfeasible();
    void reportsTimeWindowConflict();
    void reportsSpacingConflict();
    void reportsSameDayConflict();
    void flexibleDurationShrinksToFit();
};

void PlacementSearchTest::exactLocationStartsAfterTravel()
{
    Fixture fixture;
    const auto definition = errand("Post office", ExactLocation{GeoPoint{0.3, 0.0}, "Post office"}, 20,
                                   TimeWindow{7 * 60, 12 * 60});
    const auto result = fixture.place(definition, ledgerFor({}));
    QVERIFY(result.scheduled());
    QCOMPARE(result.placement->start, at(7, 30));
    QCOMPARE(result.placement->end, at(7, 50));
    QCOMPARE(result.placement->travelIn.durationMinutes, 30);
    QCOMPARE(result.placement->locationLabel, QStringLiteral("Post office"));
}

void PlacementSearchTest::leavesRoomForTravelToNextCommitment()
{
    Fixture fixture;
    const auto ledger = ledgerFor({busy(at(10), at(11), GeoPoint{-0.1, 0.0})});

    // 10 min in, 20 min on to the meeting: at most 40 min fit before 10:00.
    const auto tooLong = errand("Bank", ExactLocation{GeoPoint{0.1, 0.0}, "Bank"}, 45, TimeWindow{9 * 60, 10 * 60 + 30});
    const auto rejected = fixture.place(tooLong, ledger);
    QVERIFY(!rejected.scheduled());
    QCOMPARE(rejected.reason, BlockingReason::TimeWindowConflict);

    const auto fitting = errand("Bank", ExactLocation{GeoPoint{0.1, 0.0}, "Bank"}, 40, TimeWindow{9 * 60, 10 * 60 + 30});
    const auto result = fixture.place(fitting, ledger);
    QVERIFY(result.scheduled());
    QCOMPARE(result.placement->start, at(9));
    QCOMPARE(result.placement->end, at(9, 40));
    QVERIFY(result.placement->travelOut.has_value());
    QCOMPARE(result.placement->travelOut->durationMinutes, 20);
    QCOMPARE(result.placement->cost, 30);
}

void PlacementSearchTest::equalTravelPrefersLabelOrder()
{
    Fixture fixture;
    fixture.places.addPlace("pet store", "Beta Pets", GeoPoint{0.1, 0.0});
    fixture.places.addPlace("pet store", "Alpha Pets", GeoPoint{-0.1, 0.0});

    const auto definition = errand("Dog food", StoreCategory{"pet store"}, 30, TimeWindow{9 * 60, 12 * 60});
    const auto result = fixture.place(definition, ledgerFor({}));
    QVERIFY(result.scheduled());
    QCOMPARE(result.placement->locationLabel, QStringLiteral("Alpha Pets"));
    QCOMPARE(result.placement->start, at(9));
    QCOMPARE(result.placement->cost, 10);
}

void PlacementSearchTest::fewerTransfersBreakCostTies()
{
    const GeoPoint north{0.1, 0.0};
    const GeoPoint south{-0.1, 0.0};

    Fixture fixture;
    fixture.travel.setRoute(north, 20, 1);
    fixture.travel.setRoute(south, 15, 2);
    fixture.places.addPlace("hardware", "South Hardware", south);
    fixture.places.addPlace("hardware", "North Hardware", north);

    auto definition = errand("Screws", StoreCategory{"hardware"}, 30, TimeWindow{9 * 60, 12 * 60});
    definition.access = AccessType::AllTransit;

    // 15 min plus one extra transfer costs as much as 20 min direct.
    const auto result = fixture.place(definition, ledgerFor({}));
    QVERIFY(result.scheduled());
    QCOMPARE(result.placement->cost, 20);
    QCOMPARE(result.placement->locationLabel, QStringLiteral("North Hardware"));

    auto noPenalty = quickSettings();
    noPenalty.transferPenaltyMinutes = 0;
    Fixture relaxed(noPenalty);
    relaxed.travel.setRoute(north, 20, 1);
    relaxed.travel.setRoute(south, 15, 2);
    relaxed.places.addPlace("hardware", "South Hardware", south);
    relaxed.places.addPlace("hardware", "North Hardware", north);
    const auto cheaper = relaxed.place(definition, ledgerFor({}));
    QVERIFY(cheaper.scheduled());
    QCOMPARE(cheaper.placement->locationLabel, QStringLiteral("South Hardware"));
}

void PlacementSearchTest::unknownOriginIgnoresDistanceFromHome()
{
    Fixture fixture;
    fixture.places.addPlace("pet store", "Zoo Supplies", GeoPoint{0.05, 0.0});
    fixture.places.addPlace("pet store", "Animal Depot", GeoPoint{0.3, 0.0});
    const auto definition = errand("Dog food", StoreCategory{"pet store"}, 30, TimeWindow{10 * 60, 12 * 60});

    // After an event at home the nearer store wins.
    const auto fromHome = fixture.place(definition, ledgerFor({busy(at(7), at(10), Home)}));
    QVERIFY(fromHome.scheduled());
    QCOMPARE(fromHome.placement->locationLabel, QStringLiteral("Zoo Supplies"));
    QCOMPARE(fromHome.placement->start, at(10, 5));

    // After an event without a location both stores cost the same buffer.
    Fixture unknown;
    unknown.places.addPlace("pet store", "Zoo Supplies", GeoPoint{0.05, 0.0});
    unknown.places.addPlace("pet store", "Animal Depot", GeoPoint{0.3, 0.0});
    const auto result = unknown.place(definition, ledgerFor({busy(at(7), at(10))}));
    QVERIFY(result.scheduled());
    QCOMPARE(result.placement->locationLabel, QStringLiteral("Animal Depot"));
    QCOMPARE(result.placement->start, at(10, 30));
    QCOMPARE(result.placement->travelIn.durationMinutes, unknown.settings.unknownOriginBufferMinutes);
    QCOMPARE(result.placement->cost, 30);
    QCOMPARE(unknown.travel.calls(), 0);
}

void PlacementSearchTest::reportsAccessTypeInfeasibility()
{
    Fixture fixture;
    fixture.travel.setUnreachable(AccessType::Bike);
    auto definition = errand("Bike shop", ExactLocation{GeoPoint{0.1, 0.0}, "Bike shop"}, 30,
                             TimeWindow{9 * 60, 12 * 60});
    definition.access = AccessType::Bike;

    const auto result = fixture.place(definition, ledgerFor({}));
    QVERIFY(!result.scheduled());
    QCOMPARE(result.reason, BlockingReason::AccessTypeInfeasible);
    QCOMPARE(blockingReasonName(result.reason), QStringLiteral("access-type infeasibility"));
}

void PlacementSearchTest::providerOutageIsRetriedThenInfeasible()
{
    Fixture fixture;
    fixture.travel.failNext(100);
    const auto definition = errand("Bank", ExactLocation{GeoPoint{0.1, 0.0}, "Bank"}, 30, TimeWindow{9 * 60, 12 * 60});

    const auto result = fixture.place(definition, ledgerFor({}));
    QVERIFY(!result.scheduled());
    QCOMPARE(result.reason, BlockingReason::AccessTypeInfeasible);
    QCOMPARE(fixture.travel.calls(), fixture.settings.providerRetries + 1);
    QCOMPARE(fixture.estimator.providerCalls(), fixture.settings.providerRetries + 1);
}

void PlacementSearchTest::reportsTimeWindowConflict()
{
    Fixture fixture;
    const auto definition = errand("Call bank", RemoteLocation{}, 30, TimeWindow{9 * 60, 12 * 60});
    const auto result = fixture.place(definition, ledgerFor({busy(at(8), at(13))}));
    QVERIFY(!result.scheduled());
    QCOMPARE(result.reason, BlockingReason::TimeWindowConflict);
    QCOMPARE(blockingReasonName(result.reason), QStringLiteral("time-window conflict"));
}

void PlacementSearchTest::reportsSpacingConflict()
{
    Fixture fixture;
    auto definition = errand("Medication", RemoteLocation{}, 30, TimeWindow{9 * 60, 12 * 60});
    definition.interval.minimumGapMinutes = 180;

    ScheduleState state;
    auto earlier = makeInstance(definition, Monday.addDays(-1), Monday.addDays(-1), Monday);
    earlier.start = at(10);
    earlier.end = at(10, 30);
    QVERIFY(state.place(earlier));

    const auto result = fixture.place(definition, ledgerFor({}), state);
    QVERIFY(!result.scheduled());
    QCOMPARE(result.reason, BlockingReason::IntervalSpacingConflict);
}

void PlacementSearchTest::reportsSameDayConflict()
{
    Fixture fixture;
    const auto gym = errand("Gym", RemoteLocation{}, 60, TimeWindow{7 * 60, 22 * 60});
    auto run = errand("Long run", RemoteLocation{}, 60, TimeWindow{7 * 60, 22 * 60});
    run.conflictsWith = {gym.id};

    ScheduleState state;
    auto gymToday = makeInstance(gym, Monday, Monday, Monday);
    gymToday.start = at(18);
    gymToday.end = at(19);
    QVERIFY(state.place(gymToday));

    const auto result = fixture.place(run, ledgerFor({}), state);
    QVERIFY(!result.scheduled());
    QCOMPARE(result.reason, BlockingReason::SameDayConflict);
}

void PlacementSearchTest::flexibleDurationShrinksToFit()
{
    Fixture fixture;
    const auto ledger = ledgerFor({busy(at(7), at(10), Home), busy(at(11), at(22), Home)});
    auto definition = errand("Tax return", RemoteLocation{}, 90, TimeWindow{9 * 60, 12 * 60});
    definition.minimumDurationMinutes = 45;

    const auto result = fixture.place(definition, ledger);
    QVERIFY(result.scheduled());
    QCOMPARE(result.placement->start, at(10));
    QCOMPARE(result.placement->end, at(11));

    definition.minimumDurationMinutes = 0;
    QVERIFY(!fixture.place(definition, ledger).scheduled());
}

QTEST_GUILESS_MAIN(PlacementSearchTest)
#include "PlacementSearchTest.moc"
