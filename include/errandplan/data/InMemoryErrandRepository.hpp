#pragma once

#include <QHash>

#include "errandplan/data/ErrandRepository.hpp"

namespace errandplan {
namespace data {

class InMemoryErrandRepository : public ErrandRepository
{
public:
    InMemoryErrandRepository();
    ~InMemoryErrandRepository() override;

    std::vector<ErrandDefinition> fetchDefinitions() const override;
    std::optional<ErrandDefinition> findById(const QUuid &id) const override;
    ErrandDefinition addDefinition(ErrandDefinition definition) override;
    bool updateDefinition(const ErrandDefinition &definition) override;
    bool removeDefinition(const QUuid &id) override;

private:
    QHash<QUuid, ErrandDefinition> m_items;
};

} // namespace data
} // namespace errandplan
