#include "catalog/CatalogRegistry.h"
#include "catalog/PostgresCatalogProvider.h"
#include "core/logger.h"
#include "lineage/LineageErrors.h"
#include "utils/string_utils.h"
#include <stdexcept>

void CatalogRegistry::registerProvider(const std::string &name,
                                       Factory factory) {
  if (name.empty() || !factory)
    throw std::invalid_argument("Catalog provider needs a name and a factory");
  std::string key = StringUtils::toLower(name);
  if (factories_.count(key)) {
    Logger::warning(LogCategory::CATALOG, "CatalogRegistry",
                    "Replacing catalog provider '" + key + "'");
  }
  factories_[key] = std::move(factory);
}

bool CatalogRegistry::contains(const std::string &name) const {
  return factories_.count(StringUtils::toLower(name)) > 0;
}

std::vector<std::string> CatalogRegistry::names() const {
  std::vector<std::string> result;
  for (const auto &entry : factories_)
    result.push_back(entry.first);
  return result;
}

std::unique_ptr<ICatalogProvider>
CatalogRegistry::create(const std::string &name,
                        const nlohmann::json &config) const {
  auto it = factories_.find(StringUtils::toLower(name));
  if (it == factories_.end()) {
    std::vector<std::string> available = names();
    throw CatalogError("Unknown catalog '" + name + "'. Available catalogs: " +
                       (available.empty() ? std::string("none")
                                          : StringUtils::join(available, ", ")));
  }

  std::unique_ptr<ICatalogProvider> provider = it->second();
  if (!provider)
    throw CatalogError("Catalog factory for '" + name + "' returned nothing");
  if (!config.is_null() && !config.empty())
    provider->configure(config);
  Logger::debug(LogCategory::CATALOG, "CatalogRegistry",
                "Created catalog provider '" + provider->name() + "'");
  return provider;
}

void CatalogRegistry::registerBuiltins(CatalogRegistry &registry) {
  registry.registerProvider("postgres", []() {
    return std::unique_ptr<ICatalogProvider>(new PostgresCatalogProvider());
  });
}
