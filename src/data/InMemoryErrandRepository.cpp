#include "errandplan/data/InMemoryErrandRepository.hpp"

#include <algorithm>

namespace errandplan {
namespace data {

InMemoryErrandRepository::InMemoryErrandRepository() = default;
InMemoryErrandRepository::~InMemoryErrandRepository() = default;

std::vector<ErrandDefinition> InMemoryErrandRepository::fetchDefinitions() const
{
    std::vector<ErrandDefinition> definitions;
    definitions.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        definitions.push_back(item);
    }
    std::sort(definitions.begin(), definitions.end(),
              [](const ErrandDefinition &a, const ErrandDefinition &b) { return a.id < b.id; });
    return definitions;
}

std::optional<ErrandDefinition> InMemoryErrandRepository::findById(const QUuid &id) const
{
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

ErrandDefinition InMemoryErrandRepository::addDefinition(ErrandDefinition definition)
{
    if (definition.id.isNull()) {
        definition.id = QUuid::createUuid();
    }
    m_items.insert(definition.id, definition);
    return definition;
}

bool InMemoryErrandRepository::updateDefinition(const ErrandDefinition &definition)
{
    if (!m_items.contains(definition.id)) {
        return false;
    }
    m_items.insert(definition.id, definition);
    return true;
}

bool InMemoryErrandRepository::removeDefinition(const QUuid &id)
{
    if (m_items.remove(id) == 0) {
        return false;
    }
    // Drop dangling same-day conflict references.
    for (auto &item : m_items) {
        item.conflictsWith.removeAll(id);
    }
    return true;
}

} // namespace data
} // namespace errandplan
