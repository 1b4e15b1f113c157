#pragma once

#include "../domain/CatalogItem.hpp"
#include "../domain/TemplateEntry.hpp"
#include "../processing/ColorAnalyzer.hpp"
#include <shared/types/Common.hpp>
#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace HotbarScan::Internal::Templates {

// Owned cache of reference icons and their descriptors. Mutated only by
// loadAll() and reset(); lookups are safe from any thread once loaded.
class TemplateStore {
  public:
    // Returns the decoded RGBA icon, or an empty image when none is available.
    using IconLoader = std::function<Types::Image(const Domain::ItemDescriptor&)>;

    struct StoreSettings {
        int maxConcurrentLoads;  // 0 = hardware concurrency

        StoreSettings();
    };

    struct LoadReport {
        int attempted = 0;
        int loaded = 0;
        int failed = 0;
        int skipped = 0;  // catalog items without an icon path
        bool alreadyLoaded = false;
        std::vector<std::string> failedIds;
        float loadTimeMs = 0.0f;

        std::string getSummary() const;
    };

    explicit TemplateStore(const StoreSettings& settings = StoreSettings{},
                           IconLoader loader = defaultIconLoader());

    TemplateStore(const TemplateStore&) = delete;
    TemplateStore& operator=(const TemplateStore&) = delete;

    // Blocks until every icon load has settled. No-op when already loaded.
    LoadReport loadAll(const Domain::Catalog& catalog);

    // The catalog is copied; the store must outlive the future.
    std::future<LoadReport> loadAllAsync(const Domain::Catalog& catalog);

    const Domain::TemplateEntry* get(const std::string& itemId) const;
    const Domain::ItemDescriptor* getItem(const std::string& itemId) const;

    std::vector<const Domain::ItemDescriptor*> byRarity(Types::Rarity rarity) const;
    std::vector<const Domain::ItemDescriptor*> byColor(Types::ColorLabel color) const;

    // Items with a loaded template, in catalog order.
    std::vector<const Domain::ItemDescriptor*> allItems() const;

    void reset();

    bool isLoaded() const { return loaded_.load(); }
    size_t size() const { return items_.size(); }

    // Reads the icon path, trying the .webp and .png variants of it.
    static IconLoader defaultIconLoader();
    static std::vector<std::string> iconPathCandidates(const std::string& iconPath);

  private:
    StoreSettings settings_;
    IconLoader loader_;
    Processing::ColorAnalyzer analyzer_;

    std::vector<Domain::ItemDescriptor> items_;
    std::unordered_map<std::string, size_t> indexById_;
    std::unordered_map<std::string, Domain::TemplateEntry> entries_;
    std::map<Types::Rarity, std::vector<size_t>> byRarity_;
    std::map<Types::ColorLabel, std::vector<size_t>> byColor_;

    std::atomic<bool> loaded_;
    std::mutex loadMutex_;

    Domain::TemplateEntry buildEntry(const Domain::ItemDescriptor& item) const;
    void insert(const Domain::ItemDescriptor& item, Domain::TemplateEntry entry);
    std::vector<const Domain::ItemDescriptor*> resolve(const std::vector<size_t>& indices) const;
};

}  // namespace HotbarScan::Internal::Templates
