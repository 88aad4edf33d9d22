#pragma once

#include <QString>

#include "errandplan/data/Errand.hpp"

namespace errandplan {
namespace scheduling {

// Rejects malformed definitions before they reach expansion.
bool validateDefinition(const data::ErrandDefinition &definition, QString *error = nullptr);

} // namespace scheduling
} // namespace errandplan
