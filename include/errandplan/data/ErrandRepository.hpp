#pragma once

#include <optional>
#include <vector>

#include "errandplan/data/Errand.hpp"

namespace errandplan {
namespace data {

class ErrandRepository
{
public:
    virtual ~ErrandRepository() = default;

    virtual std::vector<ErrandDefinition> fetchDefinitions() const = 0;
    virtual std::optional<ErrandDefinition> findById(const QUuid &id) const = 0;
    virtual ErrandDefinition addDefinition(ErrandDefinition definition) = 0;
    virtual bool updateDefinition(const ErrandDefinition &definition) = 0;
    virtual bool removeDefinition(const QUuid &id) = 0;
};

} // namespace data
} // namespace errandplan
