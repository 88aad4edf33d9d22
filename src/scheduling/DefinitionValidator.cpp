#include "errandplan/scheduling/DefinitionValidator.hpp"

#include <cmath>

namespace errandplan {
namespace scheduling {

namespace {
constexpr int MinutesPerDay = 24 * 60;

bool validPoint(const data::GeoPoint &point)
{
    return std::isfinite(point.latitude) && std::isfinite(point.longitude) && std::abs(point.latitude) <= 90.0
        && std::abs(point.longitude) <= 180.0;
}

QString locationProblem(const data::LocationSpec &location)
{
    if (const auto *exact = std::get_if<data::ExactLocation>(&location)) {
        return validPoint(exact->point) ? QString() : QStringLiteral("Exact location has an invalid coordinate");
    }
    if (const auto *place = std::get_if<data::NamedPlace>(&location)) {
        if (place->point) {
            return validPoint(*place->point) ? QString() : QStringLiteral("Named place has an invalid coordinate");
        }
        return place->name.trimmed().isEmpty() ? QStringLiteral("Named place needs a name or a coordinate")
                                               : QString();
    }
    if (const auto *store = std::get_if<data::StoreCategory>(&location)) {
        return store->category.trimmed().isEmpty() ? QStringLiteral("Store category is empty") : QString();
    }
    return QString();
}
} // namespace

bool validateDefinition(const data::ErrandDefinition &definition, QString *error)
{
    QString problem;
    const auto &window = definition.window;

    if (definition.title.trimmed().isEmpty()) {
        problem = QStringLiteral("Title is required");
    } else if (definition.id.isNull()) {
        problem = QStringLiteral("Definition has no id");
    } else if (const QString location = locationProblem(definition.location); !location.isEmpty()) {
        problem = location;
    } else if (window.startMinute < 0 || window.endMinute > MinutesPerDay) {
        problem = QStringLiteral("Valid window %1-%2 is outside the day").arg(window.startMinute).arg(window.endMinute);
    } else if (window.startMinute >= window.endMinute) {
        problem = QStringLiteral("Valid window %1-%2 is inverted").arg(window.startMinute).arg(window.endMinute);
    } else if (definition.durationMinutes <= 0) {
        problem = QStringLiteral("Estimated duration must be positive");
    } else if (definition.durationMinutes > window.length() && definition.minimumDurationMinutes == 0) {
        problem = QStringLiteral("Estimated duration of %1 min does not fit the valid window")
                      .arg(definition.durationMinutes);
    } else if (definition.minimumDurationMinutes < 0
               || definition.minimumDurationMinutes > definition.durationMinutes) {
        problem = QStringLiteral("Minimum duration must lie between 0 and the estimated duration");
    } else if (definition.minimumDurationMinutes > window.length()) {
        problem = QStringLiteral("Minimum duration does not fit the valid window");
    } else if (definition.conflictsWith.contains(definition.id)) {
        problem = QStringLiteral("An errand cannot conflict with itself");
    }

    if (problem.isEmpty()) {
        return true;
    }
    if (error) {
        *error = problem;
    }
    return false;
}

} // namespace scheduling
} // namespace errandplan
