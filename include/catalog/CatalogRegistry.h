#ifndef CATALOG_REGISTRY_H
#define CATALOG_REGISTRY_H

#include "catalog/ICatalogProvider.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Maps a catalog type name ("postgres", ...) to a provider factory. Filled
// once at startup and handed to whoever needs to create providers.
class CatalogRegistry {
public:
  using Factory = std::function<std::unique_ptr<ICatalogProvider>()>;

  void registerProvider(const std::string &name, Factory factory);
  bool contains(const std::string &name) const;
  std::vector<std::string> names() const;

  // Creates and configures the named provider. Throws CatalogError for an
  // unknown name.
  std::unique_ptr<ICatalogProvider>
  create(const std::string &name,
         const nlohmann::json &config = nlohmann::json::object()) const;

  static void registerBuiltins(CatalogRegistry &registry);

private:
  std::map<std::string, Factory> factories_;
};

#endif
